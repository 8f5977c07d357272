#ifndef HELM_CLOSEPARAMS_HPP
#define HELM_CLOSEPARAMS_HPP

#include"Helm/CloseMode.hpp"
#include"Util/Either.hpp"
#include<cstdint>
#include<optional>
#include<string>
#include<vector>

namespace Helm { struct ChannelCloseRequest; }
namespace Json { class Out; }

namespace Helm {

/** struct Helm::ChannelRef
 *
 * @brief names a channel either by its id or by its
 * funding outpoint.
 */
struct ChannelRef {
	/* Empty when referring by outpoint.  */
	std::string id;
	std::string transaction_id;
	std::uint32_t transaction_vout;

	bool by_id() const { return !id.empty(); }
	/* The id, or "txid:vout".  */
	std::string text() const;
};

struct CloseFees {
	std::optional<std::uint64_t> max_tokens_per_vbyte;
	std::optional<std::uint64_t> tokens_per_vbyte;
	std::optional<std::uint64_t> target_confirmations;
};

/* A unilateral close.  Has no place for an address or
 * peer details, which only a cooperative close uses.  */
struct ForceCloseParams {
	ChannelRef channel;
	CloseFees fees;
};

struct CooperativeCloseParams {
	ChannelRef channel;
	/* Only ever false; kept so an explicit false from
	 * the caller reaches the backend as given.  */
	std::optional<bool> is_force_close;
	std::optional<std::string> address;
	std::optional<bool> is_graceful_close;
	CloseFees fees;
	std::optional<std::string> public_key;
	std::optional<std::string> socket;
};

typedef Util::Either<ForceCloseParams, CooperativeCloseParams> CloseParams;

/** Helm::make_close_params
 *
 * @brief checks a close request and converts it to
 * the parameters of its close mode.
 *
 * @desc the request must name the channel by a
 * non-empty id, or by both transaction_id and
 * transaction_vout; otherwise Helm::InvalidArgument.
 * If both are given, only the id is kept.
 * is_force_close == true selects a force close, which
 * drops address, is_graceful_close, public_key and
 * socket.
 */
CloseParams make_close_params(ChannelCloseRequest const&);

/* Names of the fields a force close dropped from the
 * request, for logging.  */
std::vector<std::string> force_close_dropped_fields(ChannelCloseRequest const&);

CloseMode close_mode(CloseParams const&);
ChannelRef close_channel_ref(CloseParams const&);

/* The backend closeChannel parameters.  Absent
 * optional fields are omitted.  */
Json::Out close_params_to_json(CloseParams const&);

}

#endif /* !defined(HELM_CLOSEPARAMS_HPP) */
