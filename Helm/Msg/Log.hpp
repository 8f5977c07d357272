#ifndef HELM_MSG_LOG_HPP
#define HELM_MSG_LOG_HPP

#include"Helm/LogLevel.hpp"
#include<string>

namespace Helm { namespace Msg {

/** struct Helm::Msg::Log
 *
 * @brief raised by Helm::log for each log line.
 */
struct Log {
	Helm::LogLevel level;
	std::string message;
};

}}

#endif /* !defined(HELM_MSG_LOG_HPP) */
