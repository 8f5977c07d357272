#ifndef HELM_STATUSREPORTER_HPP
#define HELM_STATUSREPORTER_HPP

namespace Ev { template<typename a> class Io; }
namespace Helm { class ChannelRegistry; }
namespace Helm { class NodeClientIF; }
namespace Helm { struct NodeSummary; }

namespace Helm {

/** class Helm::StatusReporter
 *
 * @brief summarizes the node: its public key and how
 * many of its channels are active.
 *
 * @desc the channel counts come from a fresh registry
 * refresh.  Backend failures are passed on.
 */
class StatusReporter {
private:
	NodeClientIF& client;
	ChannelRegistry& registry;

public:
	StatusReporter(NodeClientIF& client, ChannelRegistry& registry);

	Ev::Io<NodeSummary> summary();
};

}

#endif /* !defined(HELM_STATUSREPORTER_HPP) */
