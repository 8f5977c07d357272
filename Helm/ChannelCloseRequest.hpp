#ifndef HELM_CHANNELCLOSEREQUEST_HPP
#define HELM_CHANNELCLOSEREQUEST_HPP

#include<cstdint>
#include<optional>
#include<string>

namespace Jsmn { class Object; }

namespace Helm {

/** struct Helm::ChannelCloseRequest
 *
 * @brief a close request as given by the caller,
 * before it is checked and split by close mode.
 *
 * @desc see Helm::make_close_params.
 */
struct ChannelCloseRequest {
	std::optional<std::string> id;
	std::optional<std::string> transaction_id;
	std::optional<std::uint32_t> transaction_vout;

	std::optional<bool> is_force_close;

	/* Cooperative-only.  */
	std::optional<std::string> address;
	std::optional<bool> is_graceful_close;
	std::optional<std::string> public_key;
	std::optional<std::string> socket;

	/* Fee control, either mode.  */
	std::optional<std::uint64_t> max_tokens_per_vbyte;
	std::optional<std::uint64_t> tokens_per_vbyte;
	std::optional<std::uint64_t> target_confirmations;
};

/* Throws Helm::InvalidArgument on malformed input.  */
ChannelCloseRequest channel_close_request_from_json(Jsmn::Object const&);

}

#endif /* !defined(HELM_CHANNELCLOSEREQUEST_HPP) */
