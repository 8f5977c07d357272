#ifndef HELM_SHUTDOWN_HPP
#define HELM_SHUTDOWN_HPP

namespace Helm {

/** struct Helm::Shutdown
 *
 * @brief raised on the bus to stop all timers and
 * the backend connection; also thrown by blocking
 * operations that were interrupted by it.
 */
struct Shutdown {};

}

#endif /* !defined(HELM_SHUTDOWN_HPP) */
