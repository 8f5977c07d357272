#ifndef HELM_CHANNEL_HPP
#define HELM_CHANNEL_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<optional>
#include<string>
#include<vector>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Helm {

/** struct Helm::PendingPayment
 *
 * @brief an HTLC in flight on a channel.
 */
struct PendingPayment {
	std::string id;
	bool is_outgoing;
	Ln::Amount tokens;
	/* Block height.  */
	std::uint32_t timeout;
	bool is_forward;
};

/** struct Helm::Channel
 *
 * @brief a channel as reported by the node backend.
 *
 * @desc balances are whatever the backend says;
 * nothing here computes them.
 */
struct Channel {
	std::string id;
	std::string partner_public_key;

	Ln::Amount capacity;
	Ln::Amount local_balance;
	Ln::Amount remote_balance;
	Ln::Amount unsettled_balance;
	Ln::Amount local_reserve;
	Ln::Amount remote_reserve;

	bool is_active;
	bool is_private;
	bool is_opening;
	bool is_closing;
	bool is_partner_initiated;

	/* Funding outpoint.  */
	std::string transaction_id;
	std::uint32_t transaction_vout;

	std::optional<std::string> cooperative_close_address;

	Ln::Amount sent;
	Ln::Amount received;

	std::vector<PendingPayment> pending_payments;

	/* local + remote + unsettled must not exceed
	 * capacity.  */
	bool is_consistent() const;
};

/** struct Helm::ChannelFilter
 *
 * @brief optional predicates over channels.
 *
 * @desc is_offline is the negation of is_active, and
 * is_public the negation of is_private.
 */
struct ChannelFilter {
	std::optional<bool> is_active;
	std::optional<bool> is_offline;
	std::optional<bool> is_private;
	std::optional<bool> is_public;
	std::optional<std::string> partner_public_key;
};

/* Throws Helm::BackendError on a malformed record.  */
Channel channel_from_json(Jsmn::Object const&);
Json::Out channel_to_json(Channel const&);

/* Throws Helm::InvalidArgument on malformed input.  */
ChannelFilter channel_filter_from_json(Jsmn::Object const&);
Json::Out channel_filter_to_json(ChannelFilter const&);

}

#endif /* !defined(HELM_CHANNEL_HPP) */
