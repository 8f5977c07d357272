#ifndef HELM_NODESUMMARY_HPP
#define HELM_NODESUMMARY_HPP

#include<cstddef>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Helm {

struct NodeIdentity {
	std::string public_key;
};

struct NodeSummary {
	std::string public_key;
	std::size_t channel_count;
	std::size_t active_channel_count;
};

NodeIdentity node_identity_from_json(Jsmn::Object const&);
Json::Out node_summary_to_json(NodeSummary const&);

}

#endif /* !defined(HELM_NODESUMMARY_HPP) */
