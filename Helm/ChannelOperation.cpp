#include"Helm/ChannelOperation.hpp"
#include"Json/Out.hpp"

namespace Helm {

char const* to_string(OperationKind k) {
	return (k == OperationKind::Open) ? "open" : "close";
}

char const* to_string(OperationState s) {
	switch (s) {
	case OperationState::Requested: return "requested";
	case OperationState::Submitted: return "submitted";
	case OperationState::Confirmed: return "confirmed";
	case OperationState::Rejected: return "rejected";
	case OperationState::Failed: return "failed";
	}
	return "unknown";
}

bool is_terminal(OperationState s) {
	return s == OperationState::Confirmed
	    || s == OperationState::Rejected
	    || s == OperationState::Failed
	     ;
}

bool is_valid_transition(OperationState from, OperationState to) {
	switch (from) {
	case OperationState::Requested:
		return to == OperationState::Submitted
		    || to == OperationState::Rejected
		     ;
	case OperationState::Submitted:
		return to == OperationState::Confirmed
		    || to == OperationState::Failed
		     ;
	default:
		return false;
	}
}

Json::Out channel_operation_to_json(ChannelOperation const& op) {
	auto mode = std::optional<std::string>();
	if (op.mode)
		mode = std::string(to_string(*op.mode));

	auto rv = Json::Out();
	rv.start_object()
		.field("seq", op.seq)
		.field("kind", std::string(to_string(op.kind)))
		.field("state", std::string(to_string(op.state)))
		.field("channel", op.channel)
		.field_if("mode", mode)
		.field("detail", op.detail)
	.end_object();
	return rv;
}

}
