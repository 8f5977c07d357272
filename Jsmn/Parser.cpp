#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Token.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Util/make_unique.hpp"

/* jsmn is header-only; instantiate its code privately
 * in this compilation unit.
 */
#define JSMN_STATIC 1
#undef JSMN_HEADER
#define JSMN_STRICT 1
# include <jsmn.h>

namespace {

Jsmn::Detail::Type type_convert(jsmntype_t t) {
	switch (t) {
	case JSMN_OBJECT: return Jsmn::Detail::Object;
	case JSMN_ARRAY: return Jsmn::Detail::Array;
	case JSMN_STRING: return Jsmn::Detail::String;
	case JSMN_PRIMITIVE: return Jsmn::Detail::Primitive;
	default: return Jsmn::Detail::Undefined;
	}
}

bool is_space(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}
bool is_delimiter(char c) {
	return is_space(c)
	    || c == ',' || c == ':' || c == '"'
	    || c == '[' || c == ']' || c == '{' || c == '}'
	     ;
}

}

namespace Jsmn {

Object Parser::parse_datum(std::string const& text) {
	/* In strict mode jsmn wants a top-level primitive
	 * to be followed by something.  */
	auto txt = text + "\n";

	auto p = jsmn_parser();
	jsmn_init(&p);
	auto count = jsmn_parse(&p, txt.c_str(), txt.size(), nullptr, 0);
	if (count <= 0)
		throw ParseError(text, p.pos);

	auto toks = std::vector<jsmntok_t>(std::size_t(count));
	jsmn_init(&p);
	auto res = jsmn_parse( &p, txt.c_str(), txt.size()
			     , &toks[0], unsigned(toks.size())
			     );
	if (res != count)
		throw ParseError(text, p.pos);

	auto pr = std::make_shared<Detail::ParseResult>();
	pr->tokens.reserve(toks.size());
	for (auto const& t : toks) {
		auto tok = Detail::Token();
		tok.type = type_convert(t.type);
		tok.start = t.start;
		tok.end = t.end;
		tok.size = t.size;
		pr->tokens.push_back(tok);
	}
	/* Exactly one top-level datum.  */
	if (pr->skip(0) != pr->tokens.size())
		throw ParseError(text, std::size_t(pr->tokens[pr->skip(0)].start));
	pr->orig_string = std::move(txt);

	return Object(std::move(pr), 0);
}

class Parser::Impl {
private:
	enum Kind { Container, String, Primitive };

	std::string buffer;
	/* Scanning state for the datum at the front of
	 * the buffer.  */
	std::size_t pos;
	bool started;
	Kind kind;
	unsigned int depth;
	bool in_string;
	bool escape;

	void reset() {
		pos = 0;
		started = false;
		kind = Container;
		depth = 0;
		in_string = false;
		escape = false;
	}

	void complete(std::size_t end, std::vector<Object>& out) {
		auto text = buffer.substr(0, end);
		buffer.erase(0, end);
		reset();
		out.push_back(Parser::parse_datum(text));
	}

public:
	Impl() { reset(); }

	bool empty() const {
		for (auto c : buffer)
			if (!is_space(c))
				return false;
		return true;
	}

	std::vector<Object> feed(std::string const& s) {
		auto rv = std::vector<Object>();
		buffer += s;
		while (pos < buffer.size()) {
			auto c = buffer[pos];
			if (!started) {
				if (is_space(c)) {
					buffer.erase(0, 1);
					continue;
				}
				started = true;
				if (c == '{' || c == '[') {
					kind = Container;
					depth = 1;
				} else if (c == '"') {
					kind = String;
					in_string = true;
				} else {
					kind = Primitive;
				}
				++pos;
				continue;
			}
			if (in_string) {
				++pos;
				if (escape)
					escape = false;
				else if (c == '\\')
					escape = true;
				else if (c == '"') {
					in_string = false;
					if (kind == String)
						complete(pos, rv);
				}
				continue;
			}
			if (kind == Primitive) {
				if (is_delimiter(c))
					complete(pos, rv);
				else
					++pos;
				continue;
			}
			++pos;
			if (c == '"')
				in_string = true;
			else if (c == '{' || c == '[')
				++depth;
			else if (c == '}' || c == ']') {
				--depth;
				if (depth == 0)
					complete(pos, rv);
			}
		}
		return rv;
	}
};

Parser::Parser() : pimpl(Util::make_unique<Impl>()) { }
Parser::~Parser() { }
Parser::Parser(Parser&& o) : pimpl(std::move(o.pimpl)) { }

std::vector<Jsmn::Object> Parser::feed(std::string const& s) {
	return pimpl->feed(s);
}
bool Parser::empty() const {
	return pimpl->empty();
}

}
