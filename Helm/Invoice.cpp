#include"Helm/Exception.hpp"
#include"Helm/FieldReader.hpp"
#include"Helm/Invoice.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace Helm {

CreateInvoiceArgs create_invoice_args_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Caller, "invoice arguments");
	f.only({ "tokens", "mtokens", "description", "description_hash"
	       , "expires_at", "secret", "cltv_delta"
	       , "is_including_private_channels", "is_fallback_included"
	       , "is_fallback_nested", "is_encrypting_routes"
	       });
	auto rv = CreateInvoiceArgs();
	rv.tokens = f.opt_sat("tokens");
	rv.mtokens = f.opt_msat("mtokens");
	rv.description = f.opt_string("description");
	rv.description_hash = f.opt_string("description_hash");
	rv.expires_at = f.opt_string("expires_at");
	rv.secret = f.opt_string("secret");
	rv.cltv_delta = f.opt_count("cltv_delta");
	rv.is_including_private_channels = f.opt_boolean("is_including_private_channels");
	rv.is_fallback_included = f.opt_boolean("is_fallback_included");
	rv.is_fallback_nested = f.opt_boolean("is_fallback_nested");
	rv.is_encrypting_routes = f.opt_boolean("is_encrypting_routes");
	return rv;
}

void check_create_invoice_args(CreateInvoiceArgs const& args) {
	auto zero = Ln::Amount();
	auto has_tokens = args.tokens && *args.tokens > zero;
	auto has_mtokens = args.mtokens && *args.mtokens > zero;
	if (!has_tokens && !has_mtokens)
		throw InvalidArgument(
			"Invoice needs a positive tokens or mtokens"
		);
}

Json::Out create_invoice_args_to_json(CreateInvoiceArgs const& a) {
	auto rv = Json::Out();
	rv.start_object()
		.field_if("tokens", opt_sat_value(a.tokens))
		.field_if("mtokens", opt_msat_value(a.mtokens))
		.field_if("description", a.description)
		.field_if("description_hash", a.description_hash)
		.field_if("expires_at", a.expires_at)
		.field_if("secret", a.secret)
		.field_if("cltv_delta", a.cltv_delta)
		.field_if("is_including_private_channels", a.is_including_private_channels)
		.field_if("is_fallback_included", a.is_fallback_included)
		.field_if("is_fallback_nested", a.is_fallback_nested)
		.field_if("is_encrypting_routes", a.is_encrypting_routes)
	.end_object();
	return rv;
}

Invoice invoice_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Backend, "invoice");
	auto rv = Invoice();
	rv.id = f.string("id");
	rv.request = f.string("request");

	auto mtokens = f.opt_msat("mtokens");
	auto tokens = f.opt_sat("tokens");
	/* Backends may give either; derive the other.  */
	rv.mtokens = mtokens ? *mtokens : tokens.value_or(Ln::Amount());
	rv.tokens = tokens ? *tokens : Ln::Amount::sat(rv.mtokens.to_sat());

	rv.description = f.opt_string("description");
	rv.secret = f.opt_string("secret");
	rv.created_at = f.opt_string("created_at").value_or("");
	rv.expires_at = f.opt_string("expires_at");
	rv.chain_address = f.opt_string("chain_address");
	return rv;
}

Json::Out invoice_to_json(Invoice const& i) {
	auto rv = Json::Out();
	rv.start_object()
		.field("id", i.id)
		.field("request", i.request)
		.field("tokens", i.tokens.to_sat())
		.field("mtokens", std::to_string(i.mtokens.to_msat()))
		.field_if("description", i.description)
		.field_if("secret", i.secret)
		.field("created_at", i.created_at)
		.field_if("expires_at", i.expires_at)
		.field_if("chain_address", i.chain_address)
	.end_object();
	return rv;
}

}
