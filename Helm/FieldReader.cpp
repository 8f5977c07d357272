#include"Helm/Exception.hpp"
#include"Helm/FieldReader.hpp"
#include<cmath>

namespace Helm {

FieldReader::FieldReader( Jsmn::Object obj_
			, JsonSource src_
			, std::string what_
			) : obj(std::move(obj_))
			  , src(src_)
			  , what(std::move(what_))
			  {
	if (!obj.is_object())
		complain("expected a JSON object, got " + obj.direct_text());
}

void FieldReader::complain(std::string const& msg) const {
	auto full = what + ": " + msg;
	if (src == JsonSource::Backend)
		throw BackendError("unexpected result: " + full);
	throw InvalidArgument(full);
}

Jsmn::Object FieldReader::get(char const* key) const {
	return obj[std::string(key)];
}

bool FieldReader::has(char const* key) const {
	return !get(key).is_null();
}

std::string FieldReader::string(char const* key) const {
	auto rv = opt_string(key);
	if (!rv)
		complain(std::string("missing field ") + key);
	return *rv;
}
std::optional<std::string> FieldReader::opt_string(char const* key) const {
	auto v = get(key);
	if (v.is_null())
		return std::nullopt;
	if (!v.is_string())
		complain(std::string(key) + " must be a string");
	return std::string(v);
}

bool FieldReader::boolean(char const* key, bool dflt) const {
	auto rv = opt_boolean(key);
	return rv ? *rv : dflt;
}
std::optional<bool> FieldReader::opt_boolean(char const* key) const {
	auto v = get(key);
	if (v.is_null())
		return std::nullopt;
	if (!v.is_boolean())
		complain(std::string(key) + " must be true or false");
	return bool(v);
}

std::uint64_t FieldReader::count(char const* key) const {
	auto rv = opt_count(key);
	if (!rv)
		complain(std::string("missing field ") + key);
	return *rv;
}
std::optional<std::uint64_t> FieldReader::opt_count(char const* key) const {
	auto v = get(key);
	if (v.is_null())
		return std::nullopt;
	if (!v.is_number())
		complain(std::string(key) + " must be a number");
	auto d = double(v);
	if (d < 0 || std::floor(d) != d || d > 18446744073709549568.0)
		complain( std::string(key) + " must be a non-negative integer, got "
			+ v.direct_text()
			);
	return std::uint64_t(d);
}

std::uint32_t FieldReader::count32(char const* key) const {
	auto rv = opt_count32(key);
	if (!rv)
		complain(std::string("missing field ") + key);
	return *rv;
}
std::optional<std::uint32_t> FieldReader::opt_count32(char const* key) const {
	auto v = opt_count(key);
	if (!v)
		return std::nullopt;
	if (*v > UINT32_MAX)
		complain( std::string(key) + " out of range, got "
			+ std::to_string(*v)
			);
	return std::uint32_t(*v);
}

std::optional<double> FieldReader::opt_number(char const* key) const {
	auto v = get(key);
	if (v.is_null())
		return std::nullopt;
	if (!v.is_number())
		complain(std::string(key) + " must be a number");
	return double(v);
}

Ln::Amount FieldReader::sat(char const* key) const {
	auto rv = opt_sat(key);
	if (!rv)
		complain(std::string("missing field ") + key);
	return *rv;
}
std::optional<Ln::Amount> FieldReader::opt_sat(char const* key) const {
	auto n = opt_count(key);
	if (!n)
		return std::nullopt;
	return Ln::Amount::sat(*n);
}
std::optional<Ln::Amount> FieldReader::opt_msat(char const* key) const {
	auto v = get(key);
	if (v.is_null())
		return std::nullopt;
	if (v.is_number())
		return Ln::Amount::msat(*opt_count(key));
	if (!v.is_string() || !Ln::Amount::valid_string(std::string(v)))
		complain( std::string(key) + " must be a millisatoshi amount, got "
			+ v.direct_text()
			);
	return Ln::Amount(std::string(v));
}

Jsmn::Object FieldReader::array(char const* key) const {
	auto v = get(key);
	if (v.is_null())
		return Jsmn::Object::parse_json("[]");
	if (!v.is_array())
		complain(std::string(key) + " must be an array");
	return v;
}

void FieldReader::only(std::initializer_list<char const*> keys) const {
	for (auto const& k : obj.keys()) {
		auto found = false;
		for (auto allowed : keys)
			if (k == allowed) {
				found = true;
				break;
			}
		if (!found)
			complain("unknown field " + k);
	}
}

std::optional<std::uint64_t> opt_sat_value(std::optional<Ln::Amount> const& a) {
	if (!a)
		return std::nullopt;
	return a->to_sat();
}
std::optional<std::string> opt_msat_value(std::optional<Ln::Amount> const& a) {
	if (!a)
		return std::nullopt;
	return std::to_string(a->to_msat());
}

}
