#include"Helm/Exception.hpp"
#include"Helm/FieldReader.hpp"
#include"Helm/Payment.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/Str.hpp"

namespace Helm {

PayRequest pay_request_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Caller, "pay request");
	f.only({ "request", "tokens", "mtokens", "max_fee", "max_fee_mtokens"
	       , "max_paths", "max_timeout_height", "pathfinding_timeout"
	       , "incoming_peer"
	       });
	auto rv = PayRequest();
	rv.request = f.opt_string("request").value_or("");
	rv.tokens = f.opt_sat("tokens");
	rv.mtokens = f.opt_msat("mtokens");
	rv.max_fee = f.opt_sat("max_fee");
	rv.max_fee_mtokens = f.opt_msat("max_fee_mtokens");
	rv.max_paths = f.opt_count("max_paths");
	rv.max_timeout_height = f.opt_count("max_timeout_height");
	rv.pathfinding_timeout = f.opt_count("pathfinding_timeout");
	rv.incoming_peer = f.opt_string("incoming_peer");
	return rv;
}

void check_pay_request(PayRequest const& req) {
	if (Util::Str::trim(req.request).empty())
		throw InvalidArgument("Payment needs a payment request");
}

Json::Out pay_request_to_json( PayRequest const& r
			     , std::string const& outgoing_channel
			     ) {
	auto rv = Json::Out();
	rv.start_object()
		.field("request", r.request)
		.field("outgoing_channel", outgoing_channel)
		.field_if("tokens", opt_sat_value(r.tokens))
		.field_if("mtokens", opt_msat_value(r.mtokens))
		.field_if("max_fee", opt_sat_value(r.max_fee))
		.field_if("max_fee_mtokens", opt_msat_value(r.max_fee_mtokens))
		.field_if("max_paths", r.max_paths)
		.field_if("max_timeout_height", r.max_timeout_height)
		.field_if("pathfinding_timeout", r.pathfinding_timeout)
		.field_if("incoming_peer", r.incoming_peer)
	.end_object();
	return rv;
}

PaymentResult payment_result_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Backend, "payment result");
	auto rv = PaymentResult();
	rv.id = f.string("id");
	rv.is_confirmed = f.boolean("is_confirmed", false);
	/* Prefer the exact millisatoshi figures.  */
	auto mtokens = f.opt_msat("mtokens");
	rv.tokens = mtokens ? *mtokens
			    : f.opt_sat("tokens").value_or(Ln::Amount())
			    ;
	auto fee_mtokens = f.opt_msat("fee_mtokens");
	rv.fee = fee_mtokens ? *fee_mtokens
			     : f.opt_sat("fee").value_or(Ln::Amount())
			     ;
	rv.secret = f.opt_string("secret");
	if (f.has("hops"))
		rv.hops = js["hops"].is_array() ? js["hops"].size()
						: f.count("hops")
						;
	return rv;
}

Json::Out payment_receipt_to_json(PaymentReceipt const& r) {
	auto rv = Json::Out();
	rv.start_object()
		.field("id", r.id)
		.field("confirmed", r.confirmed)
		.field("tokens", r.tokens.to_sat())
		.field("mtokens", std::to_string(r.tokens.to_msat()))
		.field("fee", r.fee.to_sat())
		.field("fee_mtokens", std::to_string(r.fee.to_msat()))
		.field("outgoing_channel", r.outgoing_channel)
		.field("failure", r.failure)
	.end_object();
	return rv;
}

}
