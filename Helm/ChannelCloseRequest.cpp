#include"Helm/ChannelCloseRequest.hpp"
#include"Helm/FieldReader.hpp"
#include"Jsmn/Object.hpp"

namespace Helm {

ChannelCloseRequest channel_close_request_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Caller, "channel close request");
	f.only({ "id", "transaction_id", "transaction_vout", "is_force_close"
	       , "address", "is_graceful_close", "public_key", "socket"
	       , "max_tokens_per_vbyte", "tokens_per_vbyte"
	       , "target_confirmations"
	       });

	auto rv = ChannelCloseRequest();
	rv.id = f.opt_string("id");
	rv.transaction_id = f.opt_string("transaction_id");
	rv.transaction_vout = f.opt_count32("transaction_vout");
	rv.is_force_close = f.opt_boolean("is_force_close");
	rv.address = f.opt_string("address");
	rv.is_graceful_close = f.opt_boolean("is_graceful_close");
	rv.public_key = f.opt_string("public_key");
	rv.socket = f.opt_string("socket");
	rv.max_tokens_per_vbyte = f.opt_count("max_tokens_per_vbyte");
	rv.tokens_per_vbyte = f.opt_count("tokens_per_vbyte");
	rv.target_confirmations = f.opt_count("target_confirmations");
	return rv;
}

}
