#ifndef HELM_FIELDREADER_HPP
#define HELM_FIELDREADER_HPP

#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include<cstdint>
#include<initializer_list>
#include<optional>
#include<string>

namespace Helm {

/* Who wrote the JSON being read.  */
enum class JsonSource {
	/* A reply from the node backend; problems are
	 * reported as Helm::BackendError.  */
	Backend,
	/* Parameters given by our caller; problems are
	 * reported as Helm::InvalidArgument.  */
	Caller
};

/** class Helm::FieldReader
 *
 * @brief typed access to the fields of a JSON object.
 *
 * @desc an absent field and a field set to `null`
 * are treated the same.
 * Counts and amounts must be non-negative integers.
 * "sat" amounts are JSON numbers in satoshis;
 * "msat" amounts are decimal strings (or numbers) in
 * millisatoshis.
 */
class FieldReader {
private:
	Jsmn::Object obj;
	JsonSource src;
	std::string what;

	[[noreturn]]
	void complain(std::string const& msg) const;
	Jsmn::Object get(char const* key) const;

public:
	/* Throws if `obj` is not a JSON object.  */
	FieldReader(Jsmn::Object obj, JsonSource src, std::string what);

	bool has(char const* key) const;

	std::string string(char const* key) const;
	std::optional<std::string> opt_string(char const* key) const;

	/* A missing flag reads as `dflt`.  */
	bool boolean(char const* key, bool dflt) const;
	std::optional<bool> opt_boolean(char const* key) const;

	std::uint64_t count(char const* key) const;
	std::optional<std::uint64_t> opt_count(char const* key) const;
	/* Also rejects counts that do not fit 32 bits.  */
	std::uint32_t count32(char const* key) const;
	std::optional<std::uint32_t> opt_count32(char const* key) const;
	std::optional<double> opt_number(char const* key) const;

	Ln::Amount sat(char const* key) const;
	std::optional<Ln::Amount> opt_sat(char const* key) const;
	std::optional<Ln::Amount> opt_msat(char const* key) const;

	/* A missing array reads as empty.  */
	Jsmn::Object array(char const* key) const;

	/* Rejects any key not in the list.  */
	void only(std::initializer_list<char const*> keys) const;
};

/* For writing optional amounts as sat numbers or
 * msat strings.  */
std::optional<std::uint64_t> opt_sat_value(std::optional<Ln::Amount> const&);
std::optional<std::string> opt_msat_value(std::optional<Ln::Amount> const&);

}

#endif /* !defined(HELM_FIELDREADER_HPP) */
