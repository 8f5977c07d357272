#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<cstddef>
#include<memory>
#include<string>
#include<vector>

namespace Jsmn { class Object; }

namespace Jsmn {

/** class Jsmn::Parser
 *
 * @brief a stateful jsmn-based parser for a stream of
 * concatenated JSON datums.
 *
 * @desc feed() returns every datum completed by the
 * new data.
 * An incomplete datum is retained and extended by
 * later feed() calls.
 * A number at top level is only known to be complete
 * once a following whitespace or delimiter arrives.
 *
 * Throws Jsmn::ParseError on malformed input.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Parser();
	~Parser();

	Parser(Parser const&) =delete;
	Parser(Parser&&);

	std::vector<Jsmn::Object> feed(std::string const& s);

	/* True if there is no partial datum held.  */
	bool empty() const;

	/* Parse text known to hold exactly one complete
	 * JSON datum, possibly surrounded by whitespace.  */
	static Jsmn::Object parse_datum(std::string const& text);
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
