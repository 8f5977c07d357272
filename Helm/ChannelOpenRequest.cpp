#include"Helm/ChannelOpenRequest.hpp"
#include"Helm/FieldReader.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace Helm {

ChannelOpenRequest channel_open_request_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Caller, "channel open request");
	f.only({ "local_tokens", "partner_public_key", "partner_socket"
	       , "cooperative_close_address", "chain_fee_tokens_per_vbyte"
	       , "give_tokens", "description", "fee_rate", "base_fee_mtokens"
	       , "min_confirmations", "partner_csv_delay", "is_private"
	       , "is_allowing_minimal_reserve", "is_simplified_taproot"
	       , "is_trusted_funding", "is_max_funding"
	       });

	auto rv = ChannelOpenRequest();
	rv.local_tokens = f.opt_sat("local_tokens").value_or(Ln::Amount());
	rv.partner_public_key = f.opt_string("partner_public_key").value_or("");
	rv.partner_socket = f.opt_string("partner_socket");
	rv.cooperative_close_address = f.opt_string("cooperative_close_address");
	rv.chain_fee_tokens_per_vbyte = f.opt_count("chain_fee_tokens_per_vbyte");
	rv.give_tokens = f.opt_sat("give_tokens");
	rv.description = f.opt_string("description");
	rv.fee_rate = f.opt_count("fee_rate");
	rv.base_fee_mtokens = f.opt_msat("base_fee_mtokens");
	rv.min_confirmations = f.opt_count("min_confirmations");
	rv.partner_csv_delay = f.opt_count("partner_csv_delay");
	rv.is_private = f.opt_boolean("is_private");
	rv.is_allowing_minimal_reserve = f.opt_boolean("is_allowing_minimal_reserve");
	rv.is_simplified_taproot = f.opt_boolean("is_simplified_taproot");
	rv.is_trusted_funding = f.opt_boolean("is_trusted_funding");
	rv.is_max_funding = f.opt_boolean("is_max_funding");
	return rv;
}

Json::Out channel_open_request_to_json(ChannelOpenRequest const& r) {
	auto rv = Json::Out();
	rv.start_object()
		.field("local_tokens", r.local_tokens.to_sat())
		.field("partner_public_key", r.partner_public_key)
		.field_if("partner_socket", r.partner_socket)
		.field_if("cooperative_close_address", r.cooperative_close_address)
		.field_if("chain_fee_tokens_per_vbyte", r.chain_fee_tokens_per_vbyte)
		.field_if("give_tokens", opt_sat_value(r.give_tokens))
		.field_if("description", r.description)
		.field_if("fee_rate", r.fee_rate)
		.field_if("base_fee_mtokens", opt_msat_value(r.base_fee_mtokens))
		.field_if("min_confirmations", r.min_confirmations)
		.field_if("partner_csv_delay", r.partner_csv_delay)
		.field_if("is_private", r.is_private)
		.field_if("is_allowing_minimal_reserve", r.is_allowing_minimal_reserve)
		.field_if("is_simplified_taproot", r.is_simplified_taproot)
		.field_if("is_trusted_funding", r.is_trusted_funding)
		.field_if("is_max_funding", r.is_max_funding)
	.end_object();
	return rv;
}

}
