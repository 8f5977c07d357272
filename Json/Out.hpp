#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include"Jsmn/Object.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<optional>
#include<sstream>
#include<string>
#include<type_traits>

namespace Json { class Out; }

namespace Json { namespace Detail {

typedef std::ostringstream Content;
template<typename Up> class Array;
template<typename Up> class Object;

/* Converts a C++ value to JSON text.  */
template<typename t, typename Enable = void>
struct Serializer;

/* All integer types except bool.  */
template<typename t>
struct Serializer< t
		 , typename std::enable_if< std::is_integral<t>::value
					 && !std::is_same<t, bool>::value
					  >::type
		 > {
	static std::string serialize(t v) {
		return std::to_string(v);
	}
};
template<typename t>
struct Serializer< t
		 , typename std::enable_if<std::is_floating_point<t>::value>::type
		 > {
	static std::string serialize(t v) {
		return Jsmn::Detail::Str::from_double(double(v));
	}
};
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) {
		return Serializer<std::string>::serialize(std::string(v));
	}
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) {
		return "null";
	}
};
template<typename a>
struct Serializer<std::unique_ptr<a>> {
	static std::string serialize(std::unique_ptr<a> const& p) {
		return p ? Serializer<a>::serialize(*p) : "null";
	}
};

/* Shared by Object and Array: output goes to a
 * stream owned by the root Json::Out.  */
class Level {
protected:
	Content& content;
	bool started;

	void encomma() {
		if (started)
			content << ", ";
		else
			started = true;
	}
	void key(std::string const& name) {
		encomma();
		content << Serializer<std::string>::serialize(name) << ": ";
	}

	Level(Content& content_, char open)
		: content(content_), started(false) {
		content << open;
	}
};

template<typename Up>
class Object : private Level {
private:
	Up& up;

public:
	Object(Up& up_, Content& content_)
		: Level(content_, '{'), up(up_) { }

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		key(name);
		content << Serializer<a>::serialize(value);
		return *this;
	}
	/* Emits the field only if the value is present.  */
	template<typename a>
	Object<Up>& field_if(std::string const& name, std::optional<a> const& value) {
		if (value)
			field(name, *value);
		return *this;
	}

	/* Defined later when all types are completed.  */
	Array<Object<Up>> start_array(std::string const& name);
	Object<Object<Up>> start_object(std::string const& name);

	Up& end_object() {
		content << '}';
		return up;
	}
};

template<typename Up>
class Array : private Level {
private:
	Up& up;

public:
	Array(Up& up_, Content& content_)
		: Level(content_, '['), up(up_) { }

	template<typename a>
	Array<Up>& entry(a const& value) {
		encomma();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	Array<Array<Up>> start_array();
	Object<Array<Up>> start_object();

	Up& end_array() {
		content << ']';
		return up;
	}
};

} /* namespace Detail */

/** class Json::Out
 *
 * @brief builder for JSON text.
 *
 * @desc copies share the same output.
 */
class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }
	explicit
	Out(Jsmn::Object const& js) : Out() {
		*content << js;
	}

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}

	static
	Json::Out empty_object() {
		auto rv = Json::Out();
		rv.start_object().end_object();
		return rv;
	}
};

namespace Detail {

template<>
struct Serializer<Json::Out> {
	static std::string serialize(Json::Out const& v) {
		return v.output();
	}
};
template<>
struct Serializer<Jsmn::Object> {
	static std::string serialize(Jsmn::Object const& v) {
		return v.direct_text();
	}
};

template<typename Up>
Array<Object<Up>> Object<Up>::start_array(std::string const& name) {
	key(name);
	return Array<Object<Up>>(*this, content);
}
template<typename Up>
Object<Object<Up>> Object<Up>::start_object(std::string const& name) {
	key(name);
	return Object<Object<Up>>(*this, content);
}
template<typename Up>
Array<Array<Up>> Array<Up>::start_array() {
	encomma();
	return Array<Array<Up>>(*this, content);
}
template<typename Up>
Object<Array<Up>> Array<Up>::start_object() {
	encomma();
	return Object<Array<Up>>(*this, content);
}

} /* namespace Detail */

} /* namespace Json */

#endif /* !defined(JSON_OUT_HPP) */
