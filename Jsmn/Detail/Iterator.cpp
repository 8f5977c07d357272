#include"Jsmn/Detail/Iterator.hpp"
#include"Jsmn/Detail/ParseResult.hpp"
#include"Jsmn/Object.hpp"

namespace Jsmn { namespace Detail {

Iterator& Iterator::operator++() {
	i = r->skip(i);
	return *this;
}

Jsmn::Object Iterator::operator*() const {
	return Jsmn::Object(r, i);
}

}}
