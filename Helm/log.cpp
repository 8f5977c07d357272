#include"Ev/Io.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Msg/Log.hpp"
#include"Helm/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Helm {

char const* to_string(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

LogLevel log_level_from_string(std::string const& s) {
	for (auto l : {Trace, Debug, Info, Warn, Error})
		if (s == to_string(l))
			return l;
	throw InvalidArgument("Unknown log level: " + s);
}

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Msg::Log{l, std::move(msg)});
}

}
