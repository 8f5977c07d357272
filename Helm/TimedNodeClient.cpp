#include"Ev/Io.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Mod/Waiter.hpp"
#include"Helm/TimedNodeClient.hpp"
#include"Util/Str.hpp"

namespace Helm {

TimedNodeClient::TimedNodeClient( NodeClientIF& inner_
				, Helm::Mod::Waiter& waiter_
				, double timeout_
				) : inner(inner_)
				  , waiter(waiter_)
				  , timeout(timeout_)
				  {
	if (!(timeout > 0))
		throw InvalidArgument("Backend timeout must be positive");
}

template<typename a>
Ev::Io<a> TimedNodeClient::timed(char const* what, Ev::Io<a> action) {
	auto detail = Util::Str::fmt("%s: no reply after %g seconds", what, timeout);
	return waiter.timed(timeout, std::move(action))
		.template catching<Helm::Mod::Waiter::TimedOut>([detail](Helm::Mod::Waiter::TimedOut const&) -> Ev::Io<a> {
		throw BackendTimeout(detail);
	});
}

Ev::Io<NodeIdentity> TimedNodeClient::get_identity() {
	return timed("getIdentity", inner.get_identity());
}
Ev::Io<std::vector<Channel>>
TimedNodeClient::get_channels(ChannelFilter const& filter) {
	return timed("getChannels", inner.get_channels(filter));
}
Ev::Io<Invoice>
TimedNodeClient::create_invoice(CreateInvoiceArgs const& args) {
	return timed("createInvoice", inner.create_invoice(args));
}
Ev::Io<PaymentResult>
TimedNodeClient::pay( PayRequest const& req
		    , std::string const& outgoing_channel
		    ) {
	return timed("pay", inner.pay(req, outgoing_channel));
}
Ev::Io<ChannelTx>
TimedNodeClient::close_channel(CloseParams const& params) {
	return timed("closeChannel", inner.close_channel(params));
}
Ev::Io<ChannelTx>
TimedNodeClient::open_channel(ChannelOpenRequest const& req) {
	return timed("openChannel", inner.open_channel(req));
}
Ev::Io<std::vector<ChainAddress>>
TimedNodeClient::get_chain_addresses() {
	return timed("getChainAddresses", inner.get_chain_addresses());
}
Ev::Io<ChainAddress>
TimedNodeClient::create_chain_address( AddressFormat format
				     , std::optional<bool> is_unused
				     ) {
	return timed( "createChainAddress"
		    , inner.create_chain_address(format, is_unused)
		    );
}
Ev::Io<Ln::Amount> TimedNodeClient::get_chain_balance() {
	return timed("getChainBalance", inner.get_chain_balance());
}

}
