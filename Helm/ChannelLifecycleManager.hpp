#ifndef HELM_CHANNELLIFECYCLEMANAGER_HPP
#define HELM_CHANNELLIFECYCLEMANAGER_HPP

#include"Helm/ChannelOperation.hpp"
#include<cstddef>
#include<cstdint>
#include<deque>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Helm { class ChainFundsManager; }
namespace Helm { struct ChannelCloseRequest; }
namespace Helm { struct ChannelOpenRequest; }
namespace Helm { struct ChannelTx; }
namespace Helm { class NodeClientIF; }
namespace S { class Bus; }

namespace Helm {

/* Partner used by opens that do not name one.  */
struct PartnerDefaults {
	std::string public_key;
	std::string socket;
};

/* Fills in the partner from `defaults` when the
 * request names none.  */
ChannelOpenRequest with_partner_defaults( ChannelOpenRequest
					, PartnerDefaults const& defaults
					);
/* Throws Helm::InvalidArgument if the open cannot
 * be sent to the backend.  */
void check_channel_open_request(ChannelOpenRequest const&);

/** class Helm::ChannelLifecycleManager
 *
 * @brief runs channel open and close workflows
 * against the node backend.
 *
 * @desc every operation is recorded as a
 * Helm::ChannelOperation and each state change is
 * logged.
 *
 * An open without a partner key goes to the
 * configured default partner, key and socket.
 * It then requires a positive `local_tokens` and a
 * partner key, else Helm::InvalidArgument.
 * If no cooperative close address is given, the
 * first non-change chain address is used, if any.
 * A backend rejection is reported as
 * Helm::OpenFailed.
 *
 * A close is checked and split by mode with
 * Helm::make_close_params; a backend rejection is
 * reported as Helm::CloseFailed.
 *
 * Transport failures (Helm::BackendUnavailable,
 * Helm::BackendTimeout) are passed through as-is.
 *
 * Only the latest `max_history` finished operations
 * are remembered.
 */
class ChannelLifecycleManager {
private:
	S::Bus& bus;
	NodeClientIF& client;
	ChainFundsManager& funds;
	PartnerDefaults defaults;
	std::size_t max_history;

	std::deque<ChannelOperation> ops;
	std::uint64_t next_seq;

	ChannelOperation& operation(std::uint64_t seq);

	std::uint64_t start_operation( OperationKind kind
				     , std::string channel
				     );
	Ev::Io<void> transition( std::uint64_t seq
			       , OperationState to
			       , std::string detail
			       );
	template<typename E>
	Ev::Io<ChannelTx> settle_failure( std::uint64_t seq
					, OperationState to
					, E err
					);
	template<typename E>
	Ev::Io<ChannelTx> pass_failure(std::uint64_t seq, E const& err);

	Ev::Io<ChannelOpenRequest> with_close_address(ChannelOpenRequest);

public:
	ChannelLifecycleManager( S::Bus& bus
			       , NodeClientIF& client
			       , ChainFundsManager& funds
			       , PartnerDefaults defaults = PartnerDefaults()
			       , std::size_t max_history = 1000
			       );

	Ev::Io<ChannelTx> open(ChannelOpenRequest);
	Ev::Io<ChannelTx> close(ChannelCloseRequest);

	/* Operations in the order they were started.  */
	std::deque<ChannelOperation> const& operations() const {
		return ops;
	}
};

}

#endif /* !defined(HELM_CHANNELLIFECYCLEMANAGER_HPP) */
