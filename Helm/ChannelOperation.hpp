#ifndef HELM_CHANNELOPERATION_HPP
#define HELM_CHANNELOPERATION_HPP

#include"Helm/CloseMode.hpp"
#include<cstdint>
#include<optional>
#include<string>

namespace Json { class Out; }

namespace Helm {

enum class OperationKind {
	Open,
	Close
};

/* Requested -> Submitted -> Confirmed
 * Requested -> Rejected
 * Submitted -> Failed
 */
enum class OperationState {
	Requested,
	Submitted,
	Confirmed,
	Rejected,
	Failed
};

char const* to_string(OperationKind);
char const* to_string(OperationState);
bool is_terminal(OperationState);
bool is_valid_transition(OperationState from, OperationState to);

/** struct Helm::ChannelOperation
 *
 * @brief record of one open or close workflow.
 */
struct ChannelOperation {
	std::uint64_t seq;
	OperationKind kind;
	OperationState state;
	/* Partner key for opens, channel reference for
	 * closes.  */
	std::string channel;
	std::optional<CloseMode> mode;
	/* Reason for Rejected/Failed, transaction for
	 * Confirmed.  */
	std::string detail;
};

Json::Out channel_operation_to_json(ChannelOperation const&);

}

#endif /* !defined(HELM_CHANNELOPERATION_HPP) */
