#ifndef JSMN_PARSEERROR_HPP
#define JSMN_PARSEERROR_HPP

#include<cstddef>
#include<stdexcept>
#include<string>

namespace Jsmn {

/* Thrown on JSON parsing failure.  */
class ParseError : public std::runtime_error {
private:
	std::string input;
	std::size_t i;

	static
	std::string enmessage(std::string const& input, std::size_t i);

public:
	ParseError() =delete;
	ParseError( std::string const& input_
		  , std::size_t i_
		  ) : std::runtime_error(enmessage(input_, i_))
		    , input(input_)
		    , i(i_)
		    { }

	std::string const& get_input() const { return input; }
	std::size_t get_position() const { return i; }
};

}

#endif /* !defined(JSMN_PARSEERROR_HPP) */
