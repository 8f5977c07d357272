#include"Helm/Channel.hpp"
#include"Helm/FieldReader.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace {

Helm::PendingPayment pending_payment_from_json(Jsmn::Object const& js) {
	auto f = Helm::FieldReader(js, Helm::JsonSource::Backend, "pending payment");
	auto rv = Helm::PendingPayment();
	rv.id = f.string("id");
	rv.is_outgoing = f.boolean("is_outgoing", false);
	rv.tokens = f.sat("tokens");
	rv.timeout = f.count32("timeout");
	rv.is_forward = f.boolean("is_forward", false);
	return rv;
}

}

namespace Helm {

bool Channel::is_consistent() const {
	return local_balance + remote_balance + unsettled_balance <= capacity;
}

Channel channel_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Backend, "channel");
	auto rv = Channel();

	rv.id = f.string("id");
	rv.partner_public_key = f.string("partner_public_key");

	rv.capacity = f.sat("capacity");
	rv.local_balance = f.sat("local_balance");
	rv.remote_balance = f.sat("remote_balance");
	rv.unsettled_balance = f.opt_sat("unsettled_balance").value_or(Ln::Amount());
	rv.local_reserve = f.opt_sat("local_reserve").value_or(Ln::Amount());
	rv.remote_reserve = f.opt_sat("remote_reserve").value_or(Ln::Amount());

	rv.is_active = f.boolean("is_active", false);
	rv.is_private = f.boolean("is_private", false);
	rv.is_opening = f.boolean("is_opening", false);
	rv.is_closing = f.boolean("is_closing", false);
	rv.is_partner_initiated = f.boolean("is_partner_initiated", false);

	rv.transaction_id = f.opt_string("transaction_id").value_or("");
	rv.transaction_vout = f.opt_count32("transaction_vout").value_or(0);

	rv.cooperative_close_address = f.opt_string("cooperative_close_address");

	rv.sent = f.opt_sat("sent").value_or(Ln::Amount());
	rv.received = f.opt_sat("received").value_or(Ln::Amount());

	for (auto p : f.array("pending_payments"))
		rv.pending_payments.push_back(pending_payment_from_json(p));

	return rv;
}

Json::Out channel_to_json(Channel const& c) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj
		.field("id", c.id)
		.field("partner_public_key", c.partner_public_key)
		.field("capacity", c.capacity.to_sat())
		.field("local_balance", c.local_balance.to_sat())
		.field("remote_balance", c.remote_balance.to_sat())
		.field("unsettled_balance", c.unsettled_balance.to_sat())
		.field("local_reserve", c.local_reserve.to_sat())
		.field("remote_reserve", c.remote_reserve.to_sat())
		.field("is_active", c.is_active)
		.field("is_private", c.is_private)
		.field("is_opening", c.is_opening)
		.field("is_closing", c.is_closing)
		.field("is_partner_initiated", c.is_partner_initiated)
		.field("transaction_id", c.transaction_id)
		.field("transaction_vout", c.transaction_vout)
		.field_if("cooperative_close_address", c.cooperative_close_address)
		.field("sent", c.sent.to_sat())
		.field("received", c.received.to_sat())
		;
	auto arr = obj.start_array("pending_payments");
	for (auto const& p : c.pending_payments)
		arr.start_object()
			.field("id", p.id)
			.field("is_outgoing", p.is_outgoing)
			.field("tokens", p.tokens.to_sat())
			.field("timeout", p.timeout)
			.field("is_forward", p.is_forward)
		.end_object();
	arr.end_array();
	obj.end_object();
	return rv;
}

ChannelFilter channel_filter_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Caller, "channel filter");
	f.only({ "is_active", "is_offline", "is_private", "is_public"
	       , "partner_public_key"
	       });
	auto rv = ChannelFilter();
	rv.is_active = f.opt_boolean("is_active");
	rv.is_offline = f.opt_boolean("is_offline");
	rv.is_private = f.opt_boolean("is_private");
	rv.is_public = f.opt_boolean("is_public");
	rv.partner_public_key = f.opt_string("partner_public_key");
	return rv;
}

Json::Out channel_filter_to_json(ChannelFilter const& filter) {
	auto rv = Json::Out();
	rv.start_object()
		.field_if("is_active", filter.is_active)
		.field_if("is_offline", filter.is_offline)
		.field_if("is_private", filter.is_private)
		.field_if("is_public", filter.is_public)
		.field_if("partner_public_key", filter.partner_public_key)
	.end_object();
	return rv;
}

}
