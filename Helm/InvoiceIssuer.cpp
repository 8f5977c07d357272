#include"Ev/Io.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Invoice.hpp"
#include"Helm/InvoiceIssuer.hpp"
#include"Helm/NodeClientIF.hpp"
#include"Helm/log.hpp"

namespace Helm {

InvoiceIssuer::InvoiceIssuer( S::Bus& bus_
			    , NodeClientIF& client_
			    ) : bus(bus_), client(client_) { }

Ev::Io<Invoice> InvoiceIssuer::create(CreateInvoiceArgs args) {
	return Ev::lift().then([this, args]() {
		check_create_invoice_args(args);
		return client.create_invoice(args);
	}).then([this](Invoice inv) {
		return Helm::log( bus, Info
				, "InvoiceIssuer: invoice %s for %s"
				, inv.id.c_str()
				, std::string(inv.mtokens).c_str()
				).then([inv]() {
			return Ev::lift(inv);
		});
	}).catching<BackendError>([this](BackendError const& e) {
		return Helm::log( bus, Warn
				, "InvoiceIssuer: backend refused invoice: %s"
				, e.detail().c_str()
				).then([e]() {
			throw InvoiceFailed(e.detail());
			return Ev::lift(Invoice());
		});
	});
}

}
