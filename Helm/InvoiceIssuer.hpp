#ifndef HELM_INVOICEISSUER_HPP
#define HELM_INVOICEISSUER_HPP

namespace Ev { template<typename a> class Io; }
namespace Helm { struct CreateInvoiceArgs; }
namespace Helm { struct Invoice; }
namespace Helm { class NodeClientIF; }
namespace S { class Bus; }

namespace Helm {

/** class Helm::InvoiceIssuer
 *
 * @brief creates invoices on the node.
 *
 * @desc the arguments must give a positive tokens or
 * mtokens, else Helm::InvalidArgument.
 * The invoice is returned as the backend made it; a
 * backend refusal is reported as Helm::InvoiceFailed.
 */
class InvoiceIssuer {
private:
	S::Bus& bus;
	NodeClientIF& client;

public:
	InvoiceIssuer(S::Bus& bus, NodeClientIF& client);

	Ev::Io<Invoice> create(CreateInvoiceArgs);
};

}

#endif /* !defined(HELM_INVOICEISSUER_HPP) */
