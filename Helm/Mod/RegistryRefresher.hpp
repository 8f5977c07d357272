#ifndef HELM_MOD_REGISTRYREFRESHER_HPP
#define HELM_MOD_REGISTRYREFRESHER_HPP

namespace Ev { template<typename a> class Io; }
namespace Helm { class ChannelRegistry; }
namespace Helm { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Helm { namespace Mod {

/** class Helm::Mod::RegistryRefresher
 *
 * @brief once started, refreshes the channel
 * registry every `interval` seconds until
 * Helm::Shutdown.
 *
 * @desc a failed refresh is logged and the registry
 * keeps its older snapshot.
 */
class RegistryRefresher {
private:
	S::Bus& bus;
	ChannelRegistry& registry;
	Waiter& waiter;
	double interval;
	bool started;
	bool stopping;

	Ev::Io<void> loop();
	Ev::Io<void> refresh_once();

public:
	RegistryRefresher( S::Bus& bus
			 , ChannelRegistry& registry
			 , Waiter& waiter
			 , double interval
			 );
	RegistryRefresher(RegistryRefresher const&) =delete;

	/* Launches the refresh loop in its own
	 * greenthread.  Does nothing if already
	 * started.  */
	Ev::Io<void> start();
};

}}

#endif /* !defined(HELM_MOD_REGISTRYREFRESHER_HPP) */
