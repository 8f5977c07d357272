#include"Helm/ChannelTx.hpp"
#include"Helm/FieldReader.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace Helm {

ChannelTx channel_tx_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Backend, "channel transaction");
	auto rv = ChannelTx();
	rv.transaction_id = f.string("transaction_id");
	rv.transaction_vout = f.count32("transaction_vout");
	return rv;
}

Json::Out channel_tx_to_json(ChannelTx const& tx) {
	auto rv = Json::Out();
	rv.start_object()
		.field("transaction_id", tx.transaction_id)
		.field("transaction_vout", tx.transaction_vout)
	.end_object();
	return rv;
}

}
