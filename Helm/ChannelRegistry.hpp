#ifndef HELM_CHANNELREGISTRY_HPP
#define HELM_CHANNELREGISTRY_HPP

#include"Helm/Channel.hpp"
#include<memory>
#include<mutex>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Helm { class NodeClientIF; }
namespace S { class Bus; }

namespace Helm {

/** class Helm::ChannelRegistry
 *
 * @brief the core's view of the node's channels.
 *
 * @desc holds an immutable snapshot that `refresh`
 * replaces as a whole, so readers see either the old
 * or the new set of channels.
 * A failed refresh leaves the previous snapshot in
 * place.
 */
class ChannelRegistry {
public:
	typedef std::shared_ptr<std::vector<Channel> const> Snapshot;

private:
	S::Bus& bus;
	NodeClientIF& client;

	mutable std::mutex mtx;
	Snapshot snap;
	double last;

public:
	ChannelRegistry(S::Bus& bus, NodeClientIF& client);

	ChannelRegistry(ChannelRegistry const&) =delete;

	/* Fetches every channel from the backend and
	 * replaces the snapshot.  Raises
	 * Helm::Msg::ChannelsRefreshed.  */
	Ev::Io<Snapshot> refresh();

	/* Channels of the snapshot passing the filter, in
	 * snapshot order.  */
	std::vector<Channel> query(ChannelFilter const&) const;

	/* Id of the active channel with the largest local
	 * balance.  Throws Helm::NoAvailableChannel.  */
	std::string best_outbound_channel() const;

	/* Empty until the first refresh.  */
	Snapshot snapshot() const;
	/* Seconds since epoch; 0 if never refreshed.  */
	double last_refresh() const;
	bool has_snapshot() const;
};

/* Filter semantics of ChannelRegistry::query.
 * is_active wins over is_offline, is_private over
 * is_public, and a blank partner key is ignored.  */
std::vector<Channel> filter_channels( std::vector<Channel> const&
				    , ChannelFilter const&
				    );
/* Selection of ChannelRegistry::best_outbound_channel.
 * Ties go to the lexicographically lowest id.  */
std::string select_outbound_channel(std::vector<Channel> const&);

}

#endif /* !defined(HELM_CHANNELREGISTRY_HPP) */
