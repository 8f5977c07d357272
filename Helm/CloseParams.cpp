#include"Helm/ChannelCloseRequest.hpp"
#include"Helm/CloseParams.hpp"
#include"Helm/Exception.hpp"
#include"Json/Out.hpp"
#include"Util/Str.hpp"

namespace {

std::optional<std::string> nonempty(std::optional<std::string> const& s) {
	if (!s)
		return std::nullopt;
	auto t = Util::Str::trim(*s);
	if (t.empty())
		return std::nullopt;
	return t;
}

Helm::ChannelRef make_ref(Helm::ChannelCloseRequest const& r) {
	auto rv = Helm::ChannelRef();
	rv.transaction_vout = 0;

	auto id = nonempty(r.id);
	if (id) {
		rv.id = *id;
		return rv;
	}
	auto txid = nonempty(r.transaction_id);
	if (txid && r.transaction_vout) {
		rv.transaction_id = *txid;
		rv.transaction_vout = *r.transaction_vout;
		return rv;
	}
	throw Helm::InvalidArgument(
		"Channel close needs an id, or both "
		"transaction_id and transaction_vout"
	);
}

Helm::CloseFees make_fees(Helm::ChannelCloseRequest const& r) {
	auto rv = Helm::CloseFees();
	rv.max_tokens_per_vbyte = r.max_tokens_per_vbyte;
	rv.tokens_per_vbyte = r.tokens_per_vbyte;
	rv.target_confirmations = r.target_confirmations;
	return rv;
}

template<typename Up>
void write_ref(Json::Detail::Object<Up>& obj, Helm::ChannelRef const& ref) {
	if (ref.by_id())
		obj.field("id", ref.id);
	else
		obj
			.field("transaction_id", ref.transaction_id)
			.field("transaction_vout", ref.transaction_vout)
			;
}
template<typename Up>
void write_fees(Json::Detail::Object<Up>& obj, Helm::CloseFees const& fees) {
	obj
		.field_if("max_tokens_per_vbyte", fees.max_tokens_per_vbyte)
		.field_if("tokens_per_vbyte", fees.tokens_per_vbyte)
		.field_if("target_confirmations", fees.target_confirmations)
		;
}

}

namespace Helm {

std::string ChannelRef::text() const {
	if (by_id())
		return id;
	return transaction_id + ":" + std::to_string(transaction_vout);
}

CloseParams make_close_params(ChannelCloseRequest const& r) {
	auto ref = make_ref(r);
	if (r.is_force_close && *r.is_force_close) {
		auto p = ForceCloseParams();
		p.channel = std::move(ref);
		p.fees = make_fees(r);
		return CloseParams::left(std::move(p));
	}
	auto p = CooperativeCloseParams();
	p.channel = std::move(ref);
	p.is_force_close = r.is_force_close;
	p.address = r.address;
	p.is_graceful_close = r.is_graceful_close;
	p.fees = make_fees(r);
	p.public_key = r.public_key;
	p.socket = r.socket;
	return CloseParams::right(std::move(p));
}

std::vector<std::string> force_close_dropped_fields(ChannelCloseRequest const& r) {
	auto rv = std::vector<std::string>();
	if (!r.is_force_close || !*r.is_force_close)
		return rv;
	if (r.address)
		rv.push_back("address");
	if (r.is_graceful_close)
		rv.push_back("is_graceful_close");
	if (r.public_key)
		rv.push_back("public_key");
	if (r.socket)
		rv.push_back("socket");
	return rv;
}

CloseMode close_mode(CloseParams const& p) {
	return p.is_left() ? CloseMode::Force : CloseMode::Cooperative;
}

ChannelRef close_channel_ref(CloseParams const& p) {
	auto rv = ChannelRef();
	p.cmatch([&](ForceCloseParams const& f) {
		rv = f.channel;
	}, [&](CooperativeCloseParams const& c) {
		rv = c.channel;
	});
	return rv;
}

Json::Out close_params_to_json(CloseParams const& p) {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	p.cmatch([&](ForceCloseParams const& f) {
		write_ref(obj, f.channel);
		obj.field("is_force_close", true);
		write_fees(obj, f.fees);
	}, [&](CooperativeCloseParams const& c) {
		write_ref(obj, c.channel);
		obj
			.field_if("is_force_close", c.is_force_close)
			.field_if("address", c.address)
			.field_if("is_graceful_close", c.is_graceful_close)
			;
		write_fees(obj, c.fees);
		obj
			.field_if("public_key", c.public_key)
			.field_if("socket", c.socket)
			;
	});
	obj.end_object();
	return rv;
}

}
