#ifndef HELM_TIMEDNODECLIENT_HPP
#define HELM_TIMEDNODECLIENT_HPP

#include"Helm/NodeClientIF.hpp"

namespace Helm { namespace Mod { class Waiter; }}

namespace Helm {

/** class Helm::TimedNodeClient
 *
 * @brief decorates another Helm::NodeClientIF so that
 * every call fails with Helm::BackendTimeout if it
 * takes longer than the given number of seconds.
 */
class TimedNodeClient : public NodeClientIF {
private:
	NodeClientIF& inner;
	Helm::Mod::Waiter& waiter;
	double timeout;

	template<typename a>
	Ev::Io<a> timed(char const* what, Ev::Io<a> action);

public:
	TimedNodeClient( NodeClientIF& inner
		       , Helm::Mod::Waiter& waiter
		       , double timeout
		       );

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

#endif /* !defined(HELM_TIMEDNODECLIENT_HPP) */
