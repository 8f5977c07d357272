#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Helm/ChannelRegistry.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Msg/ChannelsRefreshed.hpp"
#include"Helm/NodeClientIF.hpp"
#include"Helm/log.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"

namespace Helm {

std::vector<Channel> filter_channels( std::vector<Channel> const& channels
				    , ChannelFilter const& filter
				    ) {
	/* Reduce to at most one condition each.  */
	auto want_active = std::optional<bool>();
	if (filter.is_active)
		want_active = *filter.is_active;
	else if (filter.is_offline)
		want_active = !*filter.is_offline;

	auto want_private = std::optional<bool>();
	if (filter.is_private)
		want_private = *filter.is_private;
	else if (filter.is_public)
		want_private = !*filter.is_public;

	auto partner = std::string();
	if (filter.partner_public_key)
		partner = Util::Str::trim(*filter.partner_public_key);

	auto rv = std::vector<Channel>();
	for (auto const& c : channels) {
		if (want_active && c.is_active != *want_active)
			continue;
		if (want_private && c.is_private != *want_private)
			continue;
		if (!partner.empty() && c.partner_public_key != partner)
			continue;
		rv.push_back(c);
	}
	return rv;
}

std::string select_outbound_channel(std::vector<Channel> const& channels) {
	auto best = static_cast<Channel const*>(nullptr);
	for (auto const& c : channels) {
		if (!c.is_active)
			continue;
		if ( !best
		  || c.local_balance > best->local_balance
		  || ( c.local_balance == best->local_balance
		    && c.id < best->id
		     )
		   )
			best = &c;
	}
	if (!best)
		throw NoAvailableChannel();
	return best->id;
}

ChannelRegistry::ChannelRegistry( S::Bus& bus_
				, NodeClientIF& client_
				) : bus(bus_)
				  , client(client_)
				  , snap(std::make_shared<std::vector<Channel>>())
				  , last(0)
				  { }

Ev::Io<ChannelRegistry::Snapshot> ChannelRegistry::refresh() {
	return client.get_channels(ChannelFilter()).then([this](std::vector<Channel> channels) {
		auto now = Ev::now();
		auto fresh = Snapshot(std::make_shared<std::vector<Channel>>(
			std::move(channels)
		));
		{
			auto lock = std::lock_guard<std::mutex>(mtx);
			snap = fresh;
			last = now;
		}

		auto act = Helm::log( bus, Debug
				    , "ChannelRegistry: %zu channels."
				    , fresh->size()
				    );
		for (auto const& c : *fresh) {
			if (c.is_consistent())
				continue;
			act += Helm::log( bus, Warn
					, "ChannelRegistry: channel %s reports "
					  "balances above its capacity "
					  "(local %s, remote %s, unsettled %s, "
					  "capacity %s)."
					, c.id.c_str()
					, std::string(c.local_balance).c_str()
					, std::string(c.remote_balance).c_str()
					, std::string(c.unsettled_balance).c_str()
					, std::string(c.capacity).c_str()
					);
		}
		return std::move(act).then([this, fresh, now]() {
			return bus.raise(Msg::ChannelsRefreshed{fresh, now});
		}).then([fresh]() {
			return Ev::lift(fresh);
		});
	});
}

std::vector<Channel>
ChannelRegistry::query(ChannelFilter const& filter) const {
	return filter_channels(*snapshot(), filter);
}

std::string ChannelRegistry::best_outbound_channel() const {
	return select_outbound_channel(*snapshot());
}

ChannelRegistry::Snapshot ChannelRegistry::snapshot() const {
	auto lock = std::lock_guard<std::mutex>(mtx);
	return snap;
}
double ChannelRegistry::last_refresh() const {
	auto lock = std::lock_guard<std::mutex>(mtx);
	return last;
}
bool ChannelRegistry::has_snapshot() const {
	return last_refresh() != 0;
}

}
