#ifndef HELM_LOG_HPP
#define HELM_LOG_HPP

#include"Helm/LogLevel.hpp"

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Helm {

/* printf-style formatting; the result is raised as
 * a Helm::Msg::Log on the bus.  */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#ifdef __GNUC__
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* HELM_LOG_HPP */
