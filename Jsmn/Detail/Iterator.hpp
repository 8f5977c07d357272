#ifndef JSMN_DETAIL_ITERATOR_HPP
#define JSMN_DETAIL_ITERATOR_HPP

#include<cstddef>
#include<memory>

namespace Jsmn { namespace Detail { struct ParseResult; }}
namespace Jsmn { class Object; }

namespace Jsmn { namespace Detail {

/* Forward iterator over the elements of a JSON array.  */
class Iterator {
private:
	std::shared_ptr<Detail::ParseResult> r;
	std::size_t i;

	friend class Jsmn::Object;

	Iterator( std::shared_ptr<Detail::ParseResult> r_
		, std::size_t i_
		) : r(std::move(r_)), i(i_) { }

public:
	Iterator() : r(nullptr), i(0) { }
	Iterator(Iterator const&) =default;
	Iterator& operator=(Iterator const&) =default;

	bool operator==(Iterator const& o) const {
		return r == o.r && i == o.i;
	}
	bool operator!=(Iterator const& o) const {
		return !(*this == o);
	}
	Iterator& operator++();
	Iterator operator++(int) {
		auto it = *this;
		++(*this);
		return it;
	}

	Jsmn::Object operator*() const;
};

}}

#endif /* !defined(JSMN_DETAIL_ITERATOR_HPP) */
