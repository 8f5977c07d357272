#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action in the default
 * libev loop until the loop has nothing left to
 * do, then returns the exit code the action
 * produced.
 *
 * @desc If the action fails with an exception,
 * the exception is printed to stderr and 254 is
 * returned.
 * If libev cannot initialize, 255 is returned.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
