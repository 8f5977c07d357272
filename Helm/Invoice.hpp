#ifndef HELM_INVOICE_HPP
#define HELM_INVOICE_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<optional>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Helm {

struct CreateInvoiceArgs {
	std::optional<Ln::Amount> tokens;
	std::optional<Ln::Amount> mtokens;
	std::optional<std::string> description;
	std::optional<std::string> description_hash;
	/* ISO 8601.  */
	std::optional<std::string> expires_at;
	/* Preimage, hex.  */
	std::optional<std::string> secret;
	std::optional<std::uint64_t> cltv_delta;
	std::optional<bool> is_including_private_channels;
	std::optional<bool> is_fallback_included;
	std::optional<bool> is_fallback_nested;
	std::optional<bool> is_encrypting_routes;
};

/** struct Helm::Invoice
 *
 * @brief an invoice created by the node backend.
 *
 * @desc whether it has been paid is not tracked here.
 */
struct Invoice {
	/* Payment hash.  */
	std::string id;
	/* BOLT11.  */
	std::string request;
	Ln::Amount tokens;
	Ln::Amount mtokens;
	std::optional<std::string> description;
	std::optional<std::string> secret;
	std::string created_at;
	std::optional<std::string> expires_at;
	std::optional<std::string> chain_address;
};

/* Throws Helm::InvalidArgument on malformed input.  */
CreateInvoiceArgs create_invoice_args_from_json(Jsmn::Object const&);
/* Requires a positive tokens or mtokens, else
 * Helm::InvalidArgument.  */
void check_create_invoice_args(CreateInvoiceArgs const&);
/* The backend createInvoice parameters.  */
Json::Out create_invoice_args_to_json(CreateInvoiceArgs const&);

/* Throws Helm::BackendError on a malformed result.  */
Invoice invoice_from_json(Jsmn::Object const&);
Json::Out invoice_to_json(Invoice const&);

}

#endif /* !defined(HELM_INVOICE_HPP) */
