#ifndef HELM_MOD_LOGOUTPUTTER_HPP
#define HELM_MOD_LOGOUTPUTTER_HPP

#include"Helm/LogLevel.hpp"
#include<ostream>
#include<queue>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Helm { namespace Mod {

/** class Helm::Mod::LogOutputter
 *
 * @brief module that prints Helm::Msg::Log messages
 * at or above a threshold level, one per line.
 */
class LogOutputter {
private:
	std::ostream& out;
	LogLevel threshold;
	std::queue<std::string> lines;

	Ev::Io<void> loop();

public:
	LogOutputter( std::ostream& out
		    , S::Bus& bus
		    , LogLevel threshold = Info
		    );
};

}}

#endif /* !defined(HELM_MOD_LOGOUTPUTTER_HPP) */
