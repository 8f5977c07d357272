#include"Ev/Io.hpp"
#include"Helm/Exception.hpp"
#include"Helm/FieldReader.hpp"
#include"Helm/Mod/Rpc.hpp"
#include"Helm/RpcNodeClient.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<functional>

namespace {

template<typename a>
Ev::Io<a> call( Ev::Io<Jsmn::Object> command
	      , std::function<a(Jsmn::Object const&)> parse
	      ) {
	return command.then([parse](Jsmn::Object result) {
		return Ev::lift(parse(result));
	}).template catching<Helm::Mod::RpcError>([](Helm::Mod::RpcError const& e) -> Ev::Io<a> {
		throw Helm::BackendError(e.message());
	}).template catching<Jsmn::TypeError>([](Jsmn::TypeError const& e) -> Ev::Io<a> {
		throw Helm::BackendError(std::string("unexpected result: ") + e.what());
	});
}

void check_present(std::string const& value, char const* name) {
	if (value.empty())
		throw Helm::InvalidArgument(
			std::string("Node credential missing: ") + name
		);
}

}

namespace Helm {

void check_credentials(Credentials const& creds) {
	check_present(creds.cert, "cert");
	check_present(creds.macaroon, "macaroon");
	check_present(creds.socket, "socket");
}

RpcNodeClient::RpcNodeClient( Helm::Mod::Rpc& rpc_
			    , Credentials creds_
			    ) : rpc(rpc_), creds(std::move(creds_)) {
	check_credentials(creds);
}

Ev::Io<void> RpcNodeClient::authenticate() {
	auto params = Json::Out();
	params.start_object()
		.field("cert", creds.cert)
		.field("macaroon", creds.macaroon)
	.end_object();
	return call<bool>( rpc.secret_command("authenticate", params)
			 , [](Jsmn::Object const&) { return true; }
			 ).then([](bool) {
		return Ev::lift();
	});
}

Ev::Io<NodeIdentity> RpcNodeClient::get_identity() {
	return call<NodeIdentity>( rpc.command("getIdentity", Json::Out::empty_object())
				 , &node_identity_from_json
				 );
}

Ev::Io<std::vector<Channel>>
RpcNodeClient::get_channels(ChannelFilter const& filter) {
	return call<std::vector<Channel>>( rpc.command( "getChannels"
						      , channel_filter_to_json(filter)
						      )
					 , [](Jsmn::Object const& res) {
		auto f = FieldReader(res, JsonSource::Backend, "getChannels");
		auto rv = std::vector<Channel>();
		for (auto c : f.array("channels"))
			rv.push_back(channel_from_json(c));
		return rv;
	});
}

Ev::Io<Invoice>
RpcNodeClient::create_invoice(CreateInvoiceArgs const& args) {
	return call<Invoice>( rpc.command( "createInvoice"
					 , create_invoice_args_to_json(args)
					 )
			    , &invoice_from_json
			    );
}

Ev::Io<PaymentResult>
RpcNodeClient::pay( PayRequest const& req
		  , std::string const& outgoing_channel
		  ) {
	return call<PaymentResult>( rpc.command( "pay"
					       , pay_request_to_json(req, outgoing_channel)
					       )
				  , &payment_result_from_json
				  );
}

Ev::Io<ChannelTx>
RpcNodeClient::close_channel(CloseParams const& params) {
	return call<ChannelTx>( rpc.command( "closeChannel"
					   , close_params_to_json(params)
					   )
			      , &channel_tx_from_json
			      );
}

Ev::Io<ChannelTx>
RpcNodeClient::open_channel(ChannelOpenRequest const& req) {
	return call<ChannelTx>( rpc.command( "openChannel"
					   , channel_open_request_to_json(req)
					   )
			      , &channel_tx_from_json
			      );
}

Ev::Io<std::vector<ChainAddress>>
RpcNodeClient::get_chain_addresses() {
	return call<std::vector<ChainAddress>>( rpc.command( "getChainAddresses"
							   , Json::Out::empty_object()
							   )
					      , [](Jsmn::Object const& res) {
		auto f = FieldReader(res, JsonSource::Backend, "getChainAddresses");
		auto rv = std::vector<ChainAddress>();
		for (auto a : f.array("addresses"))
			rv.push_back(chain_address_from_json(a));
		return rv;
	});
}

Ev::Io<ChainAddress>
RpcNodeClient::create_chain_address( AddressFormat format
				   , std::optional<bool> is_unused
				   ) {
	auto params = Json::Out();
	params.start_object()
		.field("format", std::string(to_string(format)))
		.field_if("is_unused", is_unused)
	.end_object();
	return call<ChainAddress>( rpc.command("createChainAddress", params)
				 , [](Jsmn::Object const& res) {
		auto f = FieldReader(res, JsonSource::Backend, "createChainAddress");
		auto rv = ChainAddress();
		rv.address = f.string("address");
		rv.is_change = false;
		return rv;
	});
}

Ev::Io<Ln::Amount> RpcNodeClient::get_chain_balance() {
	return call<Ln::Amount>( rpc.command( "getChainBalance"
					    , Json::Out::empty_object()
					    )
			       , [](Jsmn::Object const& res) {
		auto f = FieldReader(res, JsonSource::Backend, "getChainBalance");
		return f.sat("chain_balance");
	});
}

}
