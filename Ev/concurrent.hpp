#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief starts the given action as a new
 * greenthread, which begins running the next
 * time the current greenthread yields.
 * The returned action completes immediately.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* EV_CONCURRENT_HPP */
