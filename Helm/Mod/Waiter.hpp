#ifndef HELM_MOD_WAITER_HPP
#define HELM_MOD_WAITER_HPP

#include"Ev/Io.hpp"
#include"Util/make_unique.hpp"
#include<memory>

namespace S { class Bus; }

namespace Helm { namespace Mod {

/** class Helm::Mod::Waiter
 *
 * @brief provides timers on the default event loop.
 *
 * @desc on Helm::Shutdown, all pending timers are
 * failed with Helm::Shutdown and new ones fail
 * immediately.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/** Helm::Mod::Waiter::wait
	 *
	 * @brief completes after the given number of
	 * seconds.
	 */
	Ev::Io<void> wait(double seconds);

	/** Helm::Mod::Waiter::timed
	 *
	 * @brief performs the action, but fails with
	 * `TimedOut` if it has not completed within
	 * `timeout` seconds.
	 *
	 * @desc the action cannot be cancelled, so it
	 * still runs to completion after a timeout, and
	 * its result is then discarded.
	 * If the action completes first, the timer is
	 * stopped.
	 */
	template<typename a>
	Ev::Io<a> timed( double timeout
		       , Ev::Io<a> action
		       );
	struct TimedOut { };

private:
	Ev::Io<void> timed_core( double timeout
			       , Ev::Io<void> action
			       );
};

template<typename a>
inline
Ev::Io<a> Waiter::timed( double timeout
		       , Ev::Io<a> action
		       ) {
	auto presult = std::make_shared<std::unique_ptr<a>>();
	auto inner = action.then([presult](a value) {
		*presult = Util::make_unique<a>(std::move(value));
		return Ev::lift();
	});
	return timed_core(timeout, std::move(inner)).then([presult]() {
		return Ev::lift(std::move(**presult));
	});
}
template<>
inline
Ev::Io<void> Waiter::timed<void>( double timeout
				, Ev::Io<void> action
				) {
	return timed_core(timeout, std::move(action));
}

}}

#endif /* !defined(HELM_MOD_WAITER_HPP) */
