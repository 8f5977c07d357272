#include"Ln/Amount.hpp"
#include<algorithm>
#include<sstream>
#include<stdexcept>

namespace Ln {

bool Amount::valid_string(std::string const& s) {
	auto digits = s;
	if ( digits.size() > 4
	  && std::string(digits.end() - 4, digits.end()) == "msat"
	   )
		digits.erase(digits.end() - 4, digits.end());
	if (digits.empty())
		return false;
	auto flag = std::all_of( digits.begin(), digits.end()
			       , [](char c) { return '0' <= c && c <= '9'; }
			       );
	if (!flag)
		return false;
	/* 21,000,000 BTC in msat is 19 digits, which
	 * still fits a uint64.  */
	if (digits.size() > 19)
		return false;
	return true;
}

Amount::Amount(std::string const& s) : v(0) {
	if (!valid_string(s))
		throw std::invalid_argument("Ln::Amount string invalid: " + s);
	auto is = std::istringstream(s);
	is >> v;
}
Amount::operator std::string() const {
	auto os = std::ostringstream();
	os << v << "msat";
	return os.str();
}

}
