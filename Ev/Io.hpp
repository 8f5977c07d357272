#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

/* Pre-declare for Detail::IoInner.  */
template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};
/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};
typedef std::function<void(std::exception_ptr)> FailFunc;

/* Wraps a pass function so that at most one of pass or
 * fail is ever invoked.  */
template<typename a>
struct Once {
	static
	typename PassFunc<a>::type
	pass( std::shared_ptr<bool> done
	    , typename PassFunc<a>::type pass
	    ) {
		return [done, pass](a value) {
			if (*done)
				return;
			*done = true;
			pass(std::move(value));
		};
	}
};
template<>
struct Once<void> {
	static
	PassFunc<void>::type
	pass(std::shared_ptr<bool> done, PassFunc<void>::type pass) {
		return [done, pass]() {
			if (*done)
				return;
			*done = true;
			pass();
		};
	}
};

/* Base for Io<a>.  */
template<typename a>
class IoBase {
public:
	typedef typename PassFunc<a>::type Pass;
	typedef
	std::function<void (Pass, FailFunc)> CoreFunc;

protected:
	CoreFunc core;

	template<typename b>
	friend class Ev::Io;
	template<typename b>
	friend class IoBase;

public:
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching<e>
	 *
	 * @brief if this action fails with an exception
	 * of type e, invoke the handler and continue
	 * with the action it returns instead.
	 * Other exceptions pass through unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ](Pass pass, FailFunc fail) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				auto next = std::unique_ptr<Io<a>>();
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						next.reset(new Io<a>(handler(ex)));
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			core_copy(pass, sub_fail);
		});
	}

	/* Execute the action.
	 * Exactly one of pass or fail is called, once.
	 */
	void run(Pass pass, FailFunc fail) const noexcept {
		auto done = std::make_shared<bool>(false);
		auto sub_pass = Once<a>::pass(done, std::move(pass));
		auto sub_fail = [done, fail](std::exception_ptr e) {
			if (*done)
				return;
			*done = true;
			fail(std::move(e));
		};
		try {
			core(std::move(sub_pass), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	Io(typename Detail::IoBase<a>::CoreFunc core_)
		: Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b*/
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f(a)>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::result_of<f(a)>::type>::type;
		auto core_copy = this->core;
		/* Continuation Monad.  */
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail](a value) {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(func(std::move(value))));
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			core_copy(sub_pass, fail);
		});
	}
};

/* Io<void> needs its own then, as the continuation
 * takes no argument.  */
template<>
class Io<void> : public Detail::IoBase<void> {
public:
	Io(typename Detail::IoBase<void>::CoreFunc core_)
		: Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b*/
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f()>::type>::type>
	then(f func) const {
		using b = typename Detail::IoInner<typename std::result_of<f()>::type>::type;
		auto core_copy = core;
		/* Continuation Monad.  */
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			auto sub_pass = [func, pass, fail]() {
				auto next = std::unique_ptr<Io<b>>();
				try {
					next.reset(new Io<b>(func()));
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->core(pass, fail);
			};
			core_copy(sub_pass, fail);
		});
	}

	Io<void>& operator+=(Io<void> o) {
		*this = then([o]() { return o; });
		return *this;
	}
};

/* Sequence two actions.  */
inline
Io<void> operator+(Io<void> a, Io<void> b) {
	return a.then([b]() { return b; });
}

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift(void) {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> fail
			  ) {
		pass();
	});
}

}

#endif /* !defined(EV_IO_HPP) */
