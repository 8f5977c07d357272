#ifndef HELM_CHANNELOPENREQUEST_HPP
#define HELM_CHANNELOPENREQUEST_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<optional>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Helm {

/** struct Helm::ChannelOpenRequest
 *
 * @brief parameters of a channel open.
 *
 * @desc `local_tokens` and `partner_public_key` are
 * required; they are left zero/empty by the JSON
 * reader when absent so that the open workflow can
 * fill defaults and reject the request itself.
 */
struct ChannelOpenRequest {
	Ln::Amount local_tokens;
	std::string partner_public_key;
	std::optional<std::string> partner_socket;
	std::optional<std::string> cooperative_close_address;
	std::optional<std::uint64_t> chain_fee_tokens_per_vbyte;
	std::optional<Ln::Amount> give_tokens;
	std::optional<std::string> description;
	/* Parts per million.  */
	std::optional<std::uint64_t> fee_rate;
	std::optional<Ln::Amount> base_fee_mtokens;
	std::optional<std::uint64_t> min_confirmations;
	std::optional<std::uint64_t> partner_csv_delay;
	std::optional<bool> is_private;
	std::optional<bool> is_allowing_minimal_reserve;
	std::optional<bool> is_simplified_taproot;
	std::optional<bool> is_trusted_funding;
	std::optional<bool> is_max_funding;
};

/* Throws Helm::InvalidArgument on malformed input.  */
ChannelOpenRequest channel_open_request_from_json(Jsmn::Object const&);
/* The backend openChannel parameters.  */
Json::Out channel_open_request_to_json(ChannelOpenRequest const&);

}

#endif /* !defined(HELM_CHANNELOPENREQUEST_HPP) */
