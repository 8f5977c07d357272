#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include<iterator>
#include<sstream>

namespace Jsmn {

class Object::Impl {
private:
	std::shared_ptr<Detail::ParseResult> r;
	std::size_t i;

	Detail::Token const& token() const {
		return r->tokens[i];
	}
	std::string text(int b, int e) const {
		auto sb = r->orig_string.cbegin();
		return std::string(sb + b, sb + e);
	}
	char first_char() const {
		return r->orig_string[token().start];
	}

public:
	Impl( std::shared_ptr<Detail::ParseResult> r_
	    , std::size_t i_
	    ) : r(std::move(r_)), i(i_) { }

	Detail::Type type() const { return token().type; }

	bool is_null() const {
		return type() == Detail::Primitive && first_char() == 'n';
	}
	bool is_boolean() const {
		if (type() != Detail::Primitive)
			return false;
		auto c = first_char();
		return c == 't' || c == 'f';
	}
	bool is_number() const {
		return type() == Detail::Primitive
		    && !is_null() && !is_boolean()
		     ;
	}

	explicit operator bool() const {
		if (type() != Detail::Primitive)
			throw TypeError();
		auto c = first_char();
		if (c == 'n' || c == 'f')
			return false;
		if (c == 't')
			return true;
		throw TypeError();
	}
	explicit operator std::string() const {
		if (type() != Detail::String)
			throw TypeError();
		return Detail::Str::from_escaped(text(token().start, token().end));
	}
	explicit operator double() const {
		if (!is_number())
			throw TypeError();
		return Detail::Str::to_double(text(token().start, token().end));
	}

	std::size_t size() const {
		if (type() != Detail::Object && type() != Detail::Array)
			throw TypeError();
		return std::size_t(token().size);
	}

	/* Calls f(key_index) for each key of an object,
	 * stopping early if f returns true.  */
	template<typename F>
	void each_key(F f) const {
		if (type() != Detail::Object)
			throw TypeError();
		auto k = i + 1;
		for (auto n = 0; n < token().size; ++n) {
			if (f(k))
				return;
			k = r->skip(k);
		}
	}
	std::string key_at(std::size_t k) const {
		auto const& tok = r->tokens[k];
		return Detail::Str::from_escaped(text(tok.start, tok.end));
	}

	std::vector<std::string> keys() const {
		auto rv = std::vector<std::string>();
		each_key([&](std::size_t k) {
			rv.push_back(key_at(k));
			return false;
		});
		return rv;
	}
	Object lookup(std::string const& key) const {
		auto rv = Object();
		each_key([&](std::size_t k) {
			if (key_at(k) != key)
				return false;
			rv = Object(r, k + 1);
			return true;
		});
		return rv;
	}
	bool has(std::string const& key) const {
		auto found = false;
		each_key([&](std::size_t k) {
			found = (key_at(k) == key);
			return found;
		});
		return found;
	}

	Object at(std::size_t n) const {
		if (type() != Detail::Array)
			throw TypeError();
		if (n >= std::size_t(token().size))
			return Object();
		auto k = i + 1;
		for (auto step = std::size_t(0); step < n; ++step)
			k = r->skip(k);
		return Object(r, k);
	}

	std::string direct_text() const {
		auto const& tok = token();
		/* jsmn excludes the quotes from string tokens.  */
		if (tok.type == Detail::String)
			return text(tok.start - 1, tok.end + 1);
		return text(tok.start, tok.end);
	}

	std::shared_ptr<Detail::ParseResult> const& result() const {
		return r;
	}
	std::size_t index() const { return i; }
};

Object::Object( std::shared_ptr<Detail::ParseResult> r
	      , std::size_t i
	      ) : pimpl(std::make_shared<Impl>(std::move(r), i)) { }

Object::Object() {
	auto r = std::make_shared<Detail::ParseResult>();
	r->orig_string = "null";
	auto tok = Detail::Token();
	tok.type = Detail::Primitive;
	tok.start = 0;
	tok.end = 4;
	tok.size = 0;
	r->tokens.push_back(tok);
	pimpl = std::make_shared<Impl>(std::move(r), 0);
}

Object Object::parse_json(std::string const& txt) {
	return Parser::parse_datum(txt);
}

bool Object::is_null() const { return pimpl->is_null(); }
bool Object::is_boolean() const { return pimpl->is_boolean(); }
bool Object::is_string() const { return pimpl->type() == Detail::String; }
bool Object::is_object() const { return pimpl->type() == Detail::Object; }
bool Object::is_array() const { return pimpl->type() == Detail::Array; }
bool Object::is_number() const { return pimpl->is_number(); }

Object::operator bool() const { return bool(*pimpl); }
Object::operator std::string() const { return std::string(*pimpl); }
Object::operator double() const { return double(*pimpl); }

std::size_t Object::size() const { return pimpl->size(); }
std::vector<std::string> Object::keys() const { return pimpl->keys(); }
bool Object::has(std::string const& key) const { return pimpl->has(key); }
Object Object::operator[](std::string const& key) const {
	return pimpl->lookup(key);
}
Object Object::operator[](std::size_t n) const {
	return pimpl->at(n);
}

std::string Object::direct_text() const { return pimpl->direct_text(); }

Object::iterator Object::begin() const {
	if (!is_array())
		throw TypeError();
	return Detail::Iterator(pimpl->result(), pimpl->index() + 1);
}
Object::iterator Object::end() const {
	if (!is_array())
		throw TypeError();
	auto const& r = pimpl->result();
	return Detail::Iterator(r, r->skip(pimpl->index()));
}

std::ostream& operator<<(std::ostream& os, Jsmn::Object const& o) {
	return os << o.direct_text();
}
std::istream& operator>>(std::istream& is, Jsmn::Object& o) {
	auto txt = std::string( std::istreambuf_iterator<char>(is)
			      , std::istreambuf_iterator<char>()
			      );
	o = Object::parse_json(txt);
	return is;
}

}
