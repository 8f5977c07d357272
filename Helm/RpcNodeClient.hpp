#ifndef HELM_RPCNODECLIENT_HPP
#define HELM_RPCNODECLIENT_HPP

#include"Helm/NodeClientIF.hpp"
#include<string>

namespace Helm { namespace Mod { class Rpc; }}

namespace Helm {

struct Credentials {
	std::string cert;
	std::string macaroon;
	std::string socket;
};

/* Throws Helm::InvalidArgument naming the first
 * empty credential.  */
void check_credentials(Credentials const&);

/** class Helm::RpcNodeClient
 *
 * @brief Helm::NodeClientIF over the JSON-RPC
 * connection of a Helm::Mod::Rpc.
 *
 * @desc the credentials are checked for presence
 * at construction (Helm::InvalidArgument if any is
 * empty) and are sent by `authenticate`, which must
 * complete before other calls are made.
 */
class RpcNodeClient : public NodeClientIF {
private:
	Helm::Mod::Rpc& rpc;
	Credentials creds;

public:
	RpcNodeClient(Helm::Mod::Rpc& rpc, Credentials creds);

	Ev::Io<void> authenticate();

	Ev::Io<NodeIdentity> get_identity() override;
	Ev::Io<std::vector<Channel>> get_channels(ChannelFilter const&) override;
	Ev::Io<Invoice> create_invoice(CreateInvoiceArgs const&) override;
	Ev::Io<PaymentResult> pay( PayRequest const&
				 , std::string const& outgoing_channel
				 ) override;
	Ev::Io<ChannelTx> close_channel(CloseParams const&) override;
	Ev::Io<ChannelTx> open_channel(ChannelOpenRequest const&) override;
	Ev::Io<std::vector<ChainAddress>> get_chain_addresses() override;
	Ev::Io<ChainAddress> create_chain_address( AddressFormat
						 , std::optional<bool> is_unused
						 ) override;
	Ev::Io<Ln::Amount> get_chain_balance() override;
};

}

#endif /* !defined(HELM_RPCNODECLIENT_HPP) */
