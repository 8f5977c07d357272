#include"Ev/Io.hpp"
#include"Helm/ChainFundsManager.hpp"
#include"Helm/ChannelCloseRequest.hpp"
#include"Helm/ChannelLifecycleManager.hpp"
#include"Helm/ChannelOpenRequest.hpp"
#include"Helm/ChannelTx.hpp"
#include"Helm/CloseParams.hpp"
#include"Helm/Exception.hpp"
#include"Helm/NodeClientIF.hpp"
#include"Helm/log.hpp"
#include"Util/Str.hpp"
#include<stdexcept>

namespace {

/* How a close request names its channel, before it
 * has been checked.  */
std::string requested_channel(Helm::ChannelCloseRequest const& r) {
	if (r.id && !Util::Str::trim(*r.id).empty())
		return Util::Str::trim(*r.id);
	auto txid = r.transaction_id ? Util::Str::trim(*r.transaction_id)
				     : std::string("?")
				     ;
	if (txid.empty())
		txid = "?";
	auto vout = r.transaction_vout ? std::to_string(*r.transaction_vout)
				       : std::string("?")
				       ;
	return txid + ":" + vout;
}

}

namespace Helm {

ChannelOpenRequest with_partner_defaults( ChannelOpenRequest req
					, PartnerDefaults const& defaults
					) {
	req.partner_public_key = Util::Str::trim(req.partner_public_key);
	if (req.partner_public_key.empty()) {
		req.partner_public_key = defaults.public_key;
		if (!req.partner_socket && !defaults.socket.empty())
			req.partner_socket = defaults.socket;
	}
	return req;
}

void check_channel_open_request(ChannelOpenRequest const& req) {
	if (req.local_tokens == Ln::Amount::sat(0))
		throw InvalidArgument(
			"Channel open needs a positive local_tokens"
		);
	if (req.partner_public_key.empty())
		throw InvalidArgument(
			"Channel open needs a partner_public_key"
		);
}

ChannelLifecycleManager::ChannelLifecycleManager
		( S::Bus& bus_
		, NodeClientIF& client_
		, ChainFundsManager& funds_
		, PartnerDefaults defaults_
		, std::size_t max_history_
		) : bus(bus_)
		  , client(client_)
		  , funds(funds_)
		  , defaults(std::move(defaults_))
		  , max_history(max_history_ == 0 ? 1 : max_history_)
		  , next_seq(1)
		  { }

ChannelOperation& ChannelLifecycleManager::operation(std::uint64_t seq) {
	for (auto& op : ops)
		if (op.seq == seq)
			return op;
	throw std::logic_error(Util::Str::fmt(
		"ChannelLifecycleManager: no operation #%llu",
		(unsigned long long) seq
	));
}

std::uint64_t
ChannelLifecycleManager::start_operation( OperationKind kind
					, std::string channel
					) {
	auto op = ChannelOperation();
	op.seq = next_seq++;
	op.kind = kind;
	op.state = OperationState::Requested;
	op.channel = std::move(channel);
	ops.push_back(std::move(op));
	/* Operations still in flight are kept.  */
	while (ops.size() > max_history && is_terminal(ops.front().state))
		ops.pop_front();
	return ops.back().seq;
}

Ev::Io<void>
ChannelLifecycleManager::transition( std::uint64_t seq
				   , OperationState to
				   , std::string detail
				   ) {
	return Ev::lift().then([this, seq, to, detail]() {
		auto& op = operation(seq);
		auto from = op.state;
		if (!is_valid_transition(from, to))
			throw std::logic_error(
				Util::Str::fmt( "ChannelLifecycleManager: "
						"bad transition %s -> %s"
					      , to_string(from)
					      , to_string(to)
					      )
			);
		op.state = to;
		op.detail = detail;
		return Helm::log( bus
				, (to == OperationState::Failed) ? Warn : Info
				, "ChannelLifecycleManager: %s #%llu %s: "
				  "%s -> %s%s%s"
				, to_string(op.kind)
				, (unsigned long long) seq
				, op.channel.c_str()
				, to_string(from)
				, to_string(to)
				, detail.empty() ? "" : ": "
				, detail.c_str()
				);
	});
}

template<typename E>
Ev::Io<ChannelTx>
ChannelLifecycleManager::settle_failure( std::uint64_t seq
				       , OperationState to
				       , E err
				       ) {
	auto detail = err.detail().empty() ? std::string(err.what())
					   : err.detail()
					   ;
	return transition(seq, to, detail).then([err]() {
		throw err;
		return Ev::lift(ChannelTx());
	});
}

template<typename E>
Ev::Io<ChannelTx>
ChannelLifecycleManager::pass_failure(std::uint64_t seq, E const& err) {
	return settle_failure(seq, OperationState::Failed, err);
}

Ev::Io<ChannelOpenRequest>
ChannelLifecycleManager::with_close_address(ChannelOpenRequest req) {
	if (req.cooperative_close_address)
		return Ev::lift(std::move(req));
	return funds.first_non_change_address()
		.then([req](std::optional<std::string> addr) {
		auto rv = req;
		rv.cooperative_close_address = std::move(addr);
		return Ev::lift(std::move(rv));
	}).catching<Exception>([this, req](Exception const& e) {
		return Helm::log( bus, Warn
				, "ChannelLifecycleManager: "
				  "cannot get chain addresses for "
				  "close address: %s"
				, describe_error(std::make_exception_ptr(e))
					.c_str()
				).then([req]() {
			return Ev::lift(req);
		});
	});
}

Ev::Io<ChannelTx> ChannelLifecycleManager::open(ChannelOpenRequest req_) {
	return Ev::lift().then([this, req_]() {
		auto req = with_partner_defaults(req_, defaults);

		auto seq = start_operation( OperationKind::Open
					  , req.partner_public_key.empty()
						? std::string("?")
						: req.partner_public_key
					  );
		auto act = Helm::log( bus, Info
				    , "ChannelLifecycleManager: open #%llu "
				      "of %s to %s requested"
				    , (unsigned long long) seq
				    , std::string(req.local_tokens).c_str()
				    , ops.back().channel.c_str()
				    );

		try {
			check_channel_open_request(req);
		} catch (InvalidArgument const& e) {
			return act.then([this, seq, e]() {
				return settle_failure( seq
						     , OperationState::Rejected
						     , e
						     );
			});
		}

		return act.then([this, req]() {
			return with_close_address(req);
		}).then([this, seq](ChannelOpenRequest full) {
			auto detail = full.cooperative_close_address
				? "close address " + *full.cooperative_close_address
				: std::string("no close address")
				;
			return transition( seq, OperationState::Submitted
					 , detail
					 ).then([this, full]() {
				return client.open_channel(full);
			});
		}).then([this, seq](ChannelTx tx) {
			return transition( seq, OperationState::Confirmed
					 , tx.transaction_id + ":"
					 + std::to_string(tx.transaction_vout)
					 ).then([tx]() {
				return Ev::lift(tx);
			});
		}).catching<BackendError>([this, seq](BackendError const& e) {
			return pass_failure(seq, OpenFailed(e.detail()));
		}).catching<BackendTimeout>([this, seq](BackendTimeout const& e) {
			return pass_failure(seq, e);
		}).catching<BackendUnavailable>([this, seq](BackendUnavailable const& e) {
			return pass_failure(seq, e);
		});
	});
}

Ev::Io<ChannelTx> ChannelLifecycleManager::close(ChannelCloseRequest req) {
	return Ev::lift().then([this, req]() {
		auto seq = start_operation( OperationKind::Close
					  , requested_channel(req)
					  );
		auto act = Helm::log( bus, Info
				    , "ChannelLifecycleManager: close #%llu "
				      "of %s requested"
				    , (unsigned long long) seq
				    , ops.back().channel.c_str()
				    );

		auto params = CloseParams();
		try {
			params = make_close_params(req);
		} catch (InvalidArgument const& e) {
			return act.then([this, seq, e]() {
				return settle_failure( seq
						     , OperationState::Rejected
						     , e
						     );
			});
		}

		auto mode = close_mode(params);
		auto ref = close_channel_ref(params);
		operation(seq).mode = mode;
		operation(seq).channel = ref.text();

		auto dropped = force_close_dropped_fields(req);
		if (!dropped.empty()) {
			auto names = std::string();
			for (auto const& f : dropped) {
				if (!names.empty())
					names += ", ";
				names += f;
			}
			act += Helm::log( bus, Debug
					, "ChannelLifecycleManager: close #%llu "
					  "is a force close, dropping %s"
					, (unsigned long long) seq
					, names.c_str()
					);
		}

		return act.then([this, seq, mode]() {
			return transition( seq, OperationState::Submitted
					 , std::string(to_string(mode)) + " close"
					 );
		}).then([this, params]() {
			return client.close_channel(params);
		}).then([this, seq](ChannelTx tx) {
			return transition( seq, OperationState::Confirmed
					 , tx.transaction_id + ":"
					 + std::to_string(tx.transaction_vout)
					 ).then([tx]() {
				return Ev::lift(tx);
			});
		}).catching<BackendError>([ this, seq
						   , ref, mode
						   ](BackendError const& e) {
			return pass_failure( seq
					   , CloseFailed(ref.text(), mode, e.detail())
					   );
		}).catching<BackendTimeout>([this, seq](BackendTimeout const& e) {
			return pass_failure(seq, e);
		}).catching<BackendUnavailable>([this, seq](BackendUnavailable const& e) {
			return pass_failure(seq, e);
		});
	});
}

}
