#include"Ev/Io.hpp"
#include"Helm/ChannelRegistry.hpp"
#include"Helm/NodeClientIF.hpp"
#include"Helm/NodeSummary.hpp"
#include"Helm/StatusReporter.hpp"

namespace Helm {

StatusReporter::StatusReporter( NodeClientIF& client_
			      , ChannelRegistry& registry_
			      ) : client(client_), registry(registry_) { }

Ev::Io<NodeSummary> StatusReporter::summary() {
	return client.get_identity().then([this](NodeIdentity id) {
		return registry.refresh().then([id](ChannelRegistry::Snapshot s) {
			auto rv = NodeSummary();
			rv.public_key = id.public_key;
			rv.channel_count = s->size();
			rv.active_channel_count = 0;
			for (auto const& c : *s)
				if (c.is_active)
					++rv.active_channel_count;
			return Ev::lift(rv);
		});
	});
}

}
