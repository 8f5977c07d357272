#undef NDEBUG
#include"Ln/Amount.hpp"
#include<assert.h>
#include<cstdint>
#include<sstream>
#include<stdexcept>

int main() {
	assert(Ln::Amount::msat(42) == Ln::Amount("42msat"));
	assert(Ln::Amount::msat(42) == Ln::Amount("42"));
	assert(Ln::Amount::sat(42) == Ln::Amount::msat(42000));
	assert(Ln::Amount() == Ln::Amount::sat(0));

	/* Satoshis round down.  */
	assert(Ln::Amount::msat(1999).to_sat() == 1);
	assert(Ln::Amount::sat(7).to_msat() == 7000);

	auto a = Ln::Amount::sat(547);
	auto b = Ln::Amount::msat(99999);
	assert(a > b);
	assert(b < a);
	assert(a + b == b + a);
	assert(a - a == Ln::Amount());
	/* Subtraction and addition saturate.  */
	assert(b - a == Ln::Amount());
	assert(Ln::Amount::msat(UINT64_MAX) + a == Ln::Amount::msat(UINT64_MAX));
	assert(Ln::Amount::sat(UINT64_MAX) == Ln::Amount::msat(UINT64_MAX));

	{
		auto os = std::ostringstream();
		os << a + a;
		assert(os.str() == "1094000msat");
		assert(std::string(a) == "547000msat");
	}

	assert(Ln::Amount::valid_string("0"));
	assert(!Ln::Amount::valid_string(""));
	assert(!Ln::Amount::valid_string("msat"));
	assert(!Ln::Amount::valid_string("-5msat"));
	assert(!Ln::Amount::valid_string("5 msat"));

	auto flag = false;
	try {
		auto tmp = Ln::Amount("garbage");
		(void) tmp;
		assert(false);
	} catch (std::invalid_argument const& _) {
		flag = true;
	}
	assert(flag);
	flag = false;
	try {
		auto tmp = Ln::Amount("999999999999999999999999999999999msat");
		(void) tmp;
		assert(false);
	} catch (std::invalid_argument const& _) {
		flag = true;
	}
	assert(flag);

	return 0;
}
