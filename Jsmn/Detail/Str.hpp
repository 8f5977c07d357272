#ifndef JSMN_DETAIL_STR_HPP
#define JSMN_DETAIL_STR_HPP

#include<string>

namespace Jsmn { namespace Detail { namespace Str {

/* Insert JSON escape codes into a raw string.
 * The result does not include the surrounding quotes.  */
std::string to_escaped(std::string const&);
/* Decode the escape codes in the body of a JSON string.
 * \u escapes are re-encoded as UTF-8.  */
std::string from_escaped(std::string const&);

/* Locale-independent conversions of JSON numbers.  */
double to_double(std::string const&);
std::string from_double(double);

}}}

#endif /* !defined(JSMN_DETAIL_STR_HPP) */
