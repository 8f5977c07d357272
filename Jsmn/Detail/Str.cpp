#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstdint>
#include<iomanip>
#include<locale>
#include<sstream>

namespace {

std::uint32_t read_hex4(std::string const& s, std::size_t& i) {
	if (i + 4 > s.size())
		throw Jsmn::TypeError();
	auto cp = std::uint32_t(0);
	for (auto end = i + 4; i < end; ++i) {
		auto c = s[i];
		cp <<= 4;
		if ('0' <= c && c <= '9')
			cp |= std::uint32_t(c - '0');
		else if ('a' <= c && c <= 'f')
			cp |= std::uint32_t(c - 'a' + 10);
		else if ('A' <= c && c <= 'F')
			cp |= std::uint32_t(c - 'A' + 10);
		else
			throw Jsmn::TypeError();
	}
	return cp;
}

void put_utf8(std::ostringstream& os, std::uint32_t cp) {
	if (cp < 0x80) {
		os << char(cp);
	} else if (cp < 0x800) {
		os << char(0xC0 | (cp >> 6))
		   << char(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		os << char(0xE0 | (cp >> 12))
		   << char(0x80 | ((cp >> 6) & 0x3F))
		   << char(0x80 | (cp & 0x3F));
	} else {
		os << char(0xF0 | (cp >> 18))
		   << char(0x80 | ((cp >> 12) & 0x3F))
		   << char(0x80 | ((cp >> 6) & 0x3F))
		   << char(0x80 | (cp & 0x3F));
	}
}

}

namespace Jsmn { namespace Detail { namespace Str {

std::string to_escaped(std::string const& s) {
	auto os = std::ostringstream();
	for (auto c : s) {
		switch (c) {
		case '"': os << "\\\""; break;
		case '\\': os << "\\\\"; break;
		case '\b': os << "\\b"; break;
		case '\f': os << "\\f"; break;
		case '\n': os << "\\n"; break;
		case '\r': os << "\\r"; break;
		case '\t': os << "\\t"; break;
		default:
			if ((unsigned char) c < 0x20)
				os << "\\u00" << std::hex << std::setfill('0')
				   << std::setw(2) << (unsigned int) (unsigned char) c
				   << std::dec;
			else
				os << c;
			break;
		}
	}
	return os.str();
}

std::string from_escaped(std::string const& s) {
	auto os = std::ostringstream();
	auto i = std::size_t(0);
	while (i < s.size()) {
		auto c = s[i++];
		if (c != '\\') {
			os << c;
			continue;
		}
		if (i == s.size())
			throw Jsmn::TypeError();
		c = s[i++];
		switch (c) {
		case '"': os << '"'; break;
		case '\\': os << '\\'; break;
		case '/': os << '/'; break;
		case 'b': os << '\b'; break;
		case 'f': os << '\f'; break;
		case 'n': os << '\n'; break;
		case 'r': os << '\r'; break;
		case 't': os << '\t'; break;
		case 'u': {
			auto cp = read_hex4(s, i);
			/* Surrogate pair.  */
			if ( 0xD800 <= cp && cp < 0xDC00
			  && i + 6 <= s.size()
			  && s[i] == '\\' && s[i + 1] == 'u'
			   ) {
				i += 2;
				auto lo = read_hex4(s, i);
				cp = 0x10000
				   + ((cp - 0xD800) << 10)
				   + (lo - 0xDC00)
				   ;
			}
			put_utf8(os, cp);
		} break;
		default:
			throw Jsmn::TypeError();
		}
	}
	return os.str();
}

double to_double(std::string const& s) {
	auto is = std::istringstream(s);
	is.imbue(std::locale::classic());
	auto rv = double();
	is >> rv;
	if (is.fail())
		throw Jsmn::TypeError();
	return rv;
}
std::string from_double(double v) {
	auto os = std::ostringstream();
	os.imbue(std::locale::classic());
	os << std::setprecision(17) << v;
	return os.str();
}

}}}
