#ifndef HELM_PAYMENTDISPATCHER_HPP
#define HELM_PAYMENTDISPATCHER_HPP

namespace Ev { template<typename a> class Io; }
namespace Helm { class ChannelRegistry; }
namespace Helm { class NodeClientIF; }
namespace Helm { struct PayRequest; }
namespace Helm { struct PaymentReceipt; }
namespace S { class Bus; }

namespace Helm {

/** class Helm::PaymentDispatcher
 *
 * @brief pays invoices through the active channel
 * with the most outbound liquidity.
 *
 * @desc a payment that the backend refused, that
 * timed out, or whose result could not be read is
 * returned as an unconfirmed Helm::PaymentReceipt
 * rather than as an error.
 * Fails with Helm::InvalidArgument on an empty
 * request, with Helm::PaymentFailed if no channel can
 * carry the payment, and with
 * Helm::BackendUnavailable if the request never
 * reached the backend.
 * Payments are never retried here.
 */
class PaymentDispatcher {
private:
	S::Bus& bus;
	NodeClientIF& client;
	ChannelRegistry& registry;

	Ev::Io<PaymentReceipt> submit(PayRequest const&);

public:
	PaymentDispatcher( S::Bus& bus
			 , NodeClientIF& client
			 , ChannelRegistry& registry
			 );

	Ev::Io<PaymentReceipt> pay(PayRequest);
};

}

#endif /* !defined(HELM_PAYMENTDISPATCHER_HPP) */
