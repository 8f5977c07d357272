#include"Util/Str.hpp"
#include<cctype>
#include<stdio.h>
#include<vector>

namespace Util {
namespace Str {

std::string trim(std::string const& s) {
	auto b = s.begin();
	auto e = s.end();
	while (b != e && std::isspace((unsigned char) *b))
		++b;
	while (b != e && std::isspace((unsigned char) *(e - 1)))
		--e;
	return std::string(b, e);
}

std::string fmt(char const *tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto ret = vfmt(tpl, ap);
	va_end(ap);
	return ret;
}

std::string vfmt(char const *tpl, va_list ap) {
	va_list ap2;
	va_copy(ap2, ap);
	auto len = vsnprintf(nullptr, 0, tpl, ap2);
	va_end(ap2);
	if (len < 0)
		return std::string(tpl);

	auto buf = std::vector<char>(std::size_t(len) + 1);
	vsnprintf(&buf[0], buf.size(), tpl, ap);
	return std::string(&buf[0], std::size_t(len));
}

}}
