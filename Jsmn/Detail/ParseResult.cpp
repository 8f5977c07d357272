#include"Jsmn/Detail/ParseResult.hpp"

namespace Jsmn { namespace Detail {

std::size_t ParseResult::skip(std::size_t i) const {
	/* Count of values still to be stepped over.  */
	auto pending = std::size_t(1);
	while (pending > 0 && i < tokens.size()) {
		pending += std::size_t(tokens[i].size);
		--pending;
		++i;
	}
	return i;
}

}}
