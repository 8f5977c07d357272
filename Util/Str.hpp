#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include<stdarg.h>
#include<string>

namespace Util {
namespace Str {

/* Remove leading and trailing whitespace.  */
std::string trim(std::string const& s);

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
