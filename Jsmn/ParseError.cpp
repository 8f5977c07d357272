#include"Jsmn/ParseError.hpp"
#include<sstream>

namespace Jsmn {

std::string ParseError::enmessage(std::string const& input, std::size_t i) {
	auto os = std::ostringstream();
	os << "JSON parse error at " << i << ": ";
	/* Show some context around the failure point.  */
	auto b = (i > 20) ? i - 20 : 0;
	os << input.substr(b, 40);
	return os.str();
}

}
