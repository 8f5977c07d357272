#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Helm/ChannelRegistry.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Mod/RegistryRefresher.hpp"
#include"Helm/Mod/Waiter.hpp"
#include"Helm/Shutdown.hpp"
#include"Helm/log.hpp"
#include"S/Bus.hpp"

namespace Helm { namespace Mod {

RegistryRefresher::RegistryRefresher( S::Bus& bus_
				    , ChannelRegistry& registry_
				    , Waiter& waiter_
				    , double interval_
				    ) : bus(bus_)
				      , registry(registry_)
				      , waiter(waiter_)
				      , interval(interval_)
				      , started(false)
				      , stopping(false) {
	if (!(interval > 0))
		throw InvalidArgument("Refresh interval must be positive");
	bus.subscribe<Helm::Shutdown>([this](Helm::Shutdown const&) {
		stopping = true;
		return Ev::lift();
	});
}

Ev::Io<void> RegistryRefresher::start() {
	return Ev::lift().then([this]() {
		if (started || stopping)
			return Ev::lift();
		started = true;
		return Helm::log( bus, Debug
				, "RegistryRefresher: every %g seconds"
				, interval
				) + Ev::concurrent(loop());
	});
}

Ev::Io<void> RegistryRefresher::loop() {
	return waiter.wait(interval).then([this]() {
		return refresh_once();
	}).then([this]() {
		if (stopping)
			return Ev::lift();
		return loop();
	}).catching<Helm::Shutdown>([](Helm::Shutdown const&) {
		return Ev::lift();
	});
}

Ev::Io<void> RegistryRefresher::refresh_once() {
	return registry.refresh().then([](ChannelRegistry::Snapshot) {
		return Ev::lift();
	}).catching<Helm::Exception>([this](Helm::Exception const& e) {
		return Helm::log( bus, Warn
				, "RegistryRefresher: refresh failed, "
				  "keeping snapshot of %.0f: %s"
				, registry.last_refresh()
				, describe_error(std::make_exception_ptr(e))
					.c_str()
				);
	});
}

}}
