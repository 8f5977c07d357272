#ifndef UTIL_EITHER_HPP
#define UTIL_EITHER_HPP

#include<new>
#include<utility>

namespace Util {

/** class Util::Either<L, R>
 *
 * @brief holds either a value of type `L` or a
 * value of type `R`, i.e. a typesafe sum type.
 *
 * @desc `L` and `R` need only be movable; copying
 * an `Either` requires both to be copyable.
 */
template<typename L, typename R>
class Either {
private:
	union U {
		L l;
		R r;
		/* Construction and destruction of the active
		 * member are done by Either.  */
		U() { }
		~U() { }
	} u;
	bool left_flag;

	struct UnInit { };
	explicit Either(UnInit) : left_flag(true) { }

	void destroy() {
		if (left_flag)
			u.l.~L();
		else
			u.r.~R();
	}

public:
	static
	Either left(L obj) {
		auto rv = Either(UnInit());
		rv.left_flag = true;
		new(&rv.u.l) L(std::move(obj));
		return rv;
	}
	static
	Either right(R obj) {
		auto rv = Either(UnInit());
		rv.left_flag = false;
		new(&rv.u.r) R(std::move(obj));
		return rv;
	}

	/* Default is a default-constructed left.  */
	Either() : left_flag(true) {
		new(&u.l) L();
	}
	~Either() { destroy(); }

	Either(Either const& o) : left_flag(o.left_flag) {
		if (left_flag)
			new(&u.l) L(o.u.l);
		else
			new(&u.r) R(o.u.r);
	}
	Either(Either&& o) : left_flag(o.left_flag) {
		if (left_flag)
			new(&u.l) L(std::move(o.u.l));
		else
			new(&u.r) R(std::move(o.u.r));
	}
	Either& operator=(Either const& o) {
		if (this == &o)
			return *this;
		auto tmp = Either(o);
		return *this = std::move(tmp);
	}
	Either& operator=(Either&& o) {
		if (this == &o)
			return *this;
		destroy();
		left_flag = o.left_flag;
		if (left_flag)
			new(&u.l) L(std::move(o.u.l));
		else
			new(&u.r) R(std::move(o.u.r));
		return *this;
	}

	bool is_left() const { return left_flag; }
	bool is_right() const { return !left_flag; }

	/** Inspect the contents.  */
	template<typename FL, typename FR>
	void cmatch(FL fl, FR fr) const {
		if (left_flag)
			fl(u.l);
		else
			fr(u.r);
	}
	template<typename FL, typename FR>
	void match(FL fl, FR fr) const {
		cmatch(std::move(fl), std::move(fr));
	}
	template<typename FL, typename FR>
	void match(FL fl, FR fr) {
		if (left_flag)
			fl(u.l);
		else
			fr(u.r);
	}
};

}

#endif /* !defined(UTIL_EITHER_HPP) */
