#ifndef LN_AMOUNT_HPP
#define LN_AMOUNT_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Ln {

/** class Ln::Amount
 *
 * @brief represents some amount of Bitcoins, with
 * millisatoshi precision.
 *
 * @desc arithmetic saturates instead of wrapping.
 */
class Amount {
private:
	/* In millisatoshi.  */
	std::uint64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;
	~Amount() =default;

	/* Accepts "<digits>msat" or plain "<digits>"
	 * millisatoshis.  Throws std::invalid_argument.  */
	explicit
	Amount(std::string const&);
	/* Always "<digits>msat".  */
	explicit
	operator std::string() const;
	static
	bool valid_string(std::string const&);

	static
	Amount sat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = (v > UINT64_MAX / 1000) ? UINT64_MAX : v * 1000;
		return ret;
	}
	static
	Amount msat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}

	std::uint64_t to_msat() const { return v; }
	/* Rounds down.  */
	std::uint64_t to_sat() const { return v / 1000; }

	Amount& operator+=(Amount const& i) {
		v += i.v;
		if (v < i.v)
			v = UINT64_MAX;
		return *this;
	}
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}
	Amount& operator-=(Amount const& i) {
		if (i.v > v)
			v = 0;
		else
			v -= i.v;
		return *this;
	}
	Amount operator-(Amount const& i) const {
		return Amount(*this) -= i;
	}

	bool operator<(Amount const& o) const {
		return v < o.v;
	}
	bool operator>(Amount const& o) const {
		return o < (*this);
	}
	bool operator<=(Amount const& o) const {
		return !(*this > o);
	}
	bool operator>=(Amount const& o) const {
		return o <= (*this);
	}
	bool operator==(Amount const& o) const {
		return v == o.v;
	}
	bool operator!=(Amount const& o) const {
		return !(*this == o);
	}
};

inline
std::ostream& operator<<(std::ostream& os, Amount const& v) {
	return os << std::string(v);
}

}

#endif /* !defined(LN_AMOUNT_HPP) */
