#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief Does nothing, but lets other greenthreads
 * run before continuing.
 *
 * @desc Put one in every loop.
 * Anything shared with other greenthreads may have
 * changed by the time the action continues.
 *
 * @param num_yields - how many times to yield.
 * Mostly for tests, to let other modules
 * settle.
 */
Ev::Io<void> yield();

Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
