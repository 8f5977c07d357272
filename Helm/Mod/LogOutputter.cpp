#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"Helm/Mod/LogOutputter.hpp"
#include"Helm/Msg/Log.hpp"
#include"S/Bus.hpp"

namespace Helm { namespace Mod {

LogOutputter::LogOutputter( std::ostream& out_
			  , S::Bus& bus
			  , LogLevel threshold_
			  ) : out(out_), threshold(threshold_) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
		if (l.level < threshold)
			return Ev::lift();

		auto start = lines.empty();
		lines.push( std::string("lnhelm: ")
			  + to_string(l.level) + ": "
			  + l.message
			  );

		if (!start)
			return Ev::lift();
		return Ev::concurrent(loop());
	});
}

Ev::Io<void> LogOutputter::loop() {
	return Ev::yield().then([this]() {
		if (lines.empty())
			return Ev::lift();
		out << lines.front() << std::endl;
		lines.pop();
		return loop();
	});
}

}}
