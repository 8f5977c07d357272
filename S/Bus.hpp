#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief signal bus for broadcasting messages and
 * subscribing to broadcasts, keyed on the message
 * type.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* Returns the Signal object for the given type,
	 * creating it with `make` the first time.  */
	S::Detail::SignalBase&
	get_signal( std::type_index type
		  , std::function< std::unique_ptr<S::Detail::SignalBase>()
				 > make
		  );
	template<typename a>
	S::Detail::Signal<a>& get_signal_ex() {
		using Signal = S::Detail::Signal<a>;
		auto& sbase = get_signal( std::type_index(typeid(Signal))
					, []() {
			return std::unique_ptr<S::Detail::SignalBase>(
				Util::make_unique<Signal>()
			);
		});
		return static_cast<Signal&>(sbase);
	}

public:
	Bus();
	Bus(Bus&&);
	~Bus();

	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		get_signal_ex<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return get_signal_ex<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
