#ifndef HELM_NODECLIENTIF_HPP
#define HELM_NODECLIENTIF_HPP

#include"Helm/ChainAddress.hpp"
#include"Helm/Channel.hpp"
#include"Helm/ChannelOpenRequest.hpp"
#include"Helm/ChannelTx.hpp"
#include"Helm/CloseParams.hpp"
#include"Helm/Invoice.hpp"
#include"Helm/NodeSummary.hpp"
#include"Helm/Payment.hpp"
#include"Ln/Amount.hpp"
#include<optional>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Helm {

/** class Helm::NodeClientIF
 *
 * @brief abstract interface to the node backend.
 *
 * @desc implementations only translate; they keep no
 * state about channels or payments.
 * Failures:
 * - Helm::BackendUnavailable if the request could
 *   not be delivered.
 * - Helm::BackendTimeout if no answer came in time.
 * - Helm::BackendError if the backend refused, or
 *   answered with something we cannot interpret.
 */
class NodeClientIF {
public:
	virtual ~NodeClientIF() { }

	virtual
	Ev::Io<NodeIdentity> get_identity() =0;
	virtual
	Ev::Io<std::vector<Channel>> get_channels(ChannelFilter const&) =0;
	virtual
	Ev::Io<Invoice> create_invoice(CreateInvoiceArgs const&) =0;
	virtual
	Ev::Io<PaymentResult> pay( PayRequest const&
				 , std::string const& outgoing_channel
				 ) =0;
	virtual
	Ev::Io<ChannelTx> close_channel(CloseParams const&) =0;
	virtual
	Ev::Io<ChannelTx> open_channel(ChannelOpenRequest const&) =0;
	virtual
	Ev::Io<std::vector<ChainAddress>> get_chain_addresses() =0;
	virtual
	Ev::Io<ChainAddress> create_chain_address( AddressFormat
						 , std::optional<bool> is_unused
						 ) =0;
	/* Confirmed on-chain balance.  */
	virtual
	Ev::Io<Ln::Amount> get_chain_balance() =0;
};

}

#endif /* !defined(HELM_NODECLIENTIF_HPP) */
