#ifndef HELM_LOGLEVEL_HPP
#define HELM_LOGLEVEL_HPP

#include<string>

namespace Helm {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

char const* to_string(LogLevel);
/* Throws Helm::InvalidArgument on an unknown name.  */
LogLevel log_level_from_string(std::string const&);

}

#endif /* !defined(HELM_LOGLEVEL_HPP) */
