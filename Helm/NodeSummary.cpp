#include"Helm/FieldReader.hpp"
#include"Helm/NodeSummary.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace Helm {

NodeIdentity node_identity_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Backend, "node identity");
	auto rv = NodeIdentity();
	rv.public_key = f.string("public_key");
	return rv;
}

Json::Out node_summary_to_json(NodeSummary const& s) {
	auto rv = Json::Out();
	rv.start_object()
		.field("public_key", s.public_key)
		.field("channel_count", s.channel_count)
		.field("active_channel_count", s.active_channel_count)
	.end_object();
	return rv;
}

}
