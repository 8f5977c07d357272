#ifndef HELM_PAYMENT_HPP
#define HELM_PAYMENT_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<optional>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Helm {

/** struct Helm::PayRequest
 *
 * @brief a request to pay a BOLT11 invoice.
 */
struct PayRequest {
	std::string request;
	/* For invoices that do not state an amount.  */
	std::optional<Ln::Amount> tokens;
	std::optional<Ln::Amount> mtokens;
	std::optional<Ln::Amount> max_fee;
	std::optional<Ln::Amount> max_fee_mtokens;
	std::optional<std::uint64_t> max_paths;
	std::optional<std::uint64_t> max_timeout_height;
	/* Milliseconds.  */
	std::optional<std::uint64_t> pathfinding_timeout;
	std::optional<std::string> incoming_peer;
};

/* What the backend says about a payment attempt.  */
struct PaymentResult {
	std::string id;
	bool is_confirmed;
	Ln::Amount tokens;
	Ln::Amount fee;
	std::optional<std::string> secret;
	std::optional<std::uint64_t> hops;
};

/** struct Helm::PaymentReceipt
 *
 * @brief outcome of a payment, as reported to the
 * caller.
 *
 * @desc `failure` is empty when `confirmed`, and
 * otherwise says why confirmation is missing.
 */
struct PaymentReceipt {
	std::string id;
	bool confirmed;
	Ln::Amount tokens;
	Ln::Amount fee;
	std::string outgoing_channel;
	std::string failure;
};

/* Throws Helm::InvalidArgument on malformed input.  */
PayRequest pay_request_from_json(Jsmn::Object const&);
/* Throws Helm::InvalidArgument if the request
 * cannot be paid.  */
void check_pay_request(PayRequest const&);
/* The backend pay parameters.  */
Json::Out pay_request_to_json( PayRequest const&
			     , std::string const& outgoing_channel
			     );

/* Throws Helm::BackendError on a malformed result.  */
PaymentResult payment_result_from_json(Jsmn::Object const&);

Json::Out payment_receipt_to_json(PaymentReceipt const&);

}

#endif /* !defined(HELM_PAYMENT_HPP) */
