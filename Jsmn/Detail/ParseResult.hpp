#ifndef JSMN_DETAIL_PARSERESULT_HPP
#define JSMN_DETAIL_PARSERESULT_HPP

#include"Jsmn/Detail/Token.hpp"
#include<cstddef>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail {

/* The text of one complete JSON datum and its tokens.
 * Shared by every Jsmn::Object that refers into it.
 */
struct ParseResult {
	std::string orig_string;
	std::vector<Token> tokens;

	/* Index of the token just after the value that
	 * starts at token i, skipping all its descendants.  */
	std::size_t skip(std::size_t i) const;
};

}}

#endif /* !defined(JSMN_DETAIL_PARSERESULT_HPP) */
