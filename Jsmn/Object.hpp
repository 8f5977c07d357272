#ifndef JSMN_OBJECT_HPP
#define JSMN_OBJECT_HPP

#include"Jsmn/Detail/Iterator.hpp"
#include<cstddef>
#include<istream>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Parser; }

namespace Jsmn {

/* Thrown when converting or using as incorrect type.  */
class TypeError : public std::invalid_argument {
public:
	TypeError() : std::invalid_argument("Incorrect type.") { }
};

/** class Jsmn::Object
 *
 * @brief a read-only view of one JSON value, inside a
 * parsed JSON datum.
 *
 * @desc copies are cheap and share the underlying
 * parsed text.
 */
class Object {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	/* Used by Parser and the array iterator.  */
	Object( std::shared_ptr<Detail::ParseResult>
	      , std::size_t
	      );

public:
	/* Results in a null object.  */
	Object();

	Object(Object const&) =default;
	Object(Object&&) =default;
	Object& operator=(Object const&) =default;
	Object& operator=(Object&&) =default;

	/* Parse a single complete JSON datum.
	 * Throws Jsmn::ParseError on malformed or
	 * incomplete input.  */
	static Object parse_json(std::string const&);

	bool is_null() const;
	bool is_boolean() const;
	bool is_string() const;
	bool is_object() const;
	bool is_array() const;
	bool is_number() const;

	/* Conversions throw TypeError on a type mismatch.  */
	explicit operator bool() const; /* Also false for null.  */
	explicit operator std::string() const;
	explicit operator double() const;

	/* Number of keys for objects, number of elements for arrays.
	 * Throws TypeError for anything else.
	 */
	std::size_t size() const;
	std::size_t length() const { return size(); }

	std::vector<std::string> keys() const;
	bool has(std::string const&) const;
	/* Null if the key does not exist.  */
	Object operator[](std::string const&) const;
	/* Null if out of range.  */
	Object operator[](std::size_t) const;

	friend class Parser;
	friend class Jsmn::Detail::Iterator;

	/* The JSON text of this value.  */
	std::string direct_text() const;

	/* Iterate over array elements.  */
	typedef Jsmn::Detail::Iterator const_iterator;
	typedef Jsmn::Detail::Iterator iterator;
	iterator begin() const;
	iterator end() const;
};

std::ostream& operator<<(std::ostream&, Jsmn::Object const&);
/* Reads the rest of the stream as a single JSON datum.  */
std::istream& operator>>(std::istream&, Jsmn::Object&);

}

#endif /* !defined(JSMN_OBJECT_HPP) */
