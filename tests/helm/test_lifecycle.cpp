#undef NDEBUG
#include"FakeNodeClient.hpp"
#include"Ev/start.hpp"
#include"Helm/ChainFundsManager.hpp"
#include"Helm/ChannelCloseRequest.hpp"
#include"Helm/ChannelLifecycleManager.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Msg/Log.hpp"
#include"S/Bus.hpp"
#include<assert.h>

namespace {

/* Runs the action and gives back the exception it
 * failed with, if any.  */
template<typename a>
Ev::Io<std::exception_ptr> failure_of(Ev::Io<a> act) {
	return Ev::Io<std::exception_ptr>([act]( std::function<void(std::exception_ptr)> pass
					       , std::function<void(std::exception_ptr)>
					       ) {
		act.run([pass](a) {
			pass(nullptr);
		}, [pass](std::exception_ptr e) {
			pass(e);
		});
	});
}

template<typename E>
bool is(std::exception_ptr e) {
	if (!e)
		return false;
	try {
		std::rethrow_exception(e);
	} catch (E const&) {
		return true;
	} catch (...) {
		return false;
	}
}

Helm::ChainAddress address(std::string a, bool change) {
	auto rv = Helm::ChainAddress();
	rv.address = std::move(a);
	rv.is_change = change;
	return rv;
}

}

int main() {
	S::Bus bus;
	FakeNodeClient client;
	Helm::ChainFundsManager funds(bus, client);
	auto defaults = Helm::PartnerDefaults{"03defaultpartner", "partner.example:9735"};
	Helm::ChannelLifecycleManager mgr(bus, client, funds, defaults);
	Helm::ChannelLifecycleManager short_mgr( bus, client, funds
					       , Helm::PartnerDefaults(), 2
					       );

	auto lines = std::vector<std::string>();
	bus.subscribe<Helm::Msg::Log>([&](Helm::Msg::Log const& l) {
		lines.push_back(l.message);
		return Ev::lift();
	});

	client.addresses = { address("bc1qchange", true)
			   , address("bc1qfirst", false)
			   , address("bc1qsecond", false)
			   };

	auto code = Ev::lift().then([&]() {
		/* Rejected without a backend call.  */
		auto req = Helm::ChannelOpenRequest();
		req.partner_public_key = "02peer";
		return failure_of(mgr.open(req));
	}).then([&](std::exception_ptr e) {
		assert(is<Helm::InvalidArgument>(e));
		assert(client.count("openChannel") == 0);
		assert(mgr.operations().size() == 1);
		assert(mgr.operations()[0].kind == Helm::OperationKind::Open);
		assert(mgr.operations()[0].state == Helm::OperationState::Rejected);

		/* Defaults fill the partner; close address
		 * comes from the wallet.  */
		auto req = Helm::ChannelOpenRequest();
		req.local_tokens = Ln::Amount::sat(250000);
		return mgr.open(req);
	}).then([&](Helm::ChannelTx tx) {
		assert(tx.transaction_id == client.tx.transaction_id);
		assert(client.count("openChannel") == 1);
		assert(client.last_open->partner_public_key == "03defaultpartner");
		assert(*client.last_open->partner_socket == "partner.example:9735");
		assert(*client.last_open->cooperative_close_address == "bc1qfirst");
		assert(client.last_open->local_tokens == Ln::Amount::sat(250000));

		auto const& op = mgr.operations().back();
		assert(op.seq == 2);
		assert(op.state == Helm::OperationState::Confirmed);
		assert(op.channel == "03defaultpartner");

		/* Explicit partner and address are kept, and no
		 * address lookup happens.  */
		auto before = client.count("getChainAddresses");
		auto req = Helm::ChannelOpenRequest();
		req.local_tokens = Ln::Amount::sat(1);
		req.partner_public_key = "02explicit";
		req.cooperative_close_address = std::string("bc1qmine");
		return mgr.open(req).then([&, before](Helm::ChannelTx) {
			assert(client.count("getChainAddresses") == before);
			assert(client.last_open->partner_public_key == "02explicit");
			assert(!client.last_open->partner_socket);
			assert(*client.last_open->cooperative_close_address == "bc1qmine");
			return Ev::lift();
		});
	}).then([&]() {
		/* Only change addresses: proceed without one.  */
		client.addresses = { address("bc1qchange", true)
				   , address("bc1qchange2", true)
				   };
		auto req = Helm::ChannelOpenRequest();
		req.local_tokens = Ln::Amount::sat(3000);
		req.partner_public_key = "02peer";
		return mgr.open(req);
	}).then([&](Helm::ChannelTx) {
		auto opens = client.count("openChannel");
		assert(!client.last_open->cooperative_close_address);
		assert(mgr.operations().back().state == Helm::OperationState::Confirmed);

		/* No addresses at all: likewise.  */
		client.addresses.clear();
		auto req = Helm::ChannelOpenRequest();
		req.local_tokens = Ln::Amount::sat(3000);
		req.partner_public_key = "02peer";
		return mgr.open(req).then([&, opens](Helm::ChannelTx) {
			assert(client.count("openChannel") == opens + 1);
			assert(!client.last_open->cooperative_close_address);
			assert(mgr.operations().back().state == Helm::OperationState::Confirmed);
			return Ev::lift();
		});
	}).then([&]() {
		/* Address lookup fails: proceed without one.  */
		client.failures["getChainAddresses"] = std::make_exception_ptr(
			Helm::BackendError("wallet locked")
		);
		auto req = Helm::ChannelOpenRequest();
		req.local_tokens = Ln::Amount::sat(5000);
		req.partner_public_key = "02peer";
		return mgr.open(req);
	}).then([&](Helm::ChannelTx) {
		assert(!client.last_open->cooperative_close_address);
		client.failures.erase("getChainAddresses");

		/* Backend rejection becomes OpenFailed.  */
		client.failures["openChannel"] = std::make_exception_ptr(
			Helm::BackendError("peer not connected")
		);
		auto req = Helm::ChannelOpenRequest();
		req.local_tokens = Ln::Amount::sat(5000);
		req.partner_public_key = "02peer";
		return failure_of(mgr.open(req));
	}).then([&](std::exception_ptr e) {
		assert(is<Helm::OpenFailed>(e));
		try {
			std::rethrow_exception(e);
		} catch (Helm::OpenFailed const& f) {
			assert(f.detail() == "peer not connected");
		}
		assert(mgr.operations().back().state == Helm::OperationState::Failed);
		assert(mgr.operations().back().detail == "peer not connected");

		/* Transport failure passes through.  */
		client.failures["openChannel"] = std::make_exception_ptr(
			Helm::BackendUnavailable("connection closed")
		);
		auto req = Helm::ChannelOpenRequest();
		req.local_tokens = Ln::Amount::sat(5000);
		req.partner_public_key = "02peer";
		return failure_of(mgr.open(req));
	}).then([&](std::exception_ptr e) {
		assert(is<Helm::BackendUnavailable>(e));
		assert(!is<Helm::OpenFailed>(e));
		assert(mgr.operations().back().state == Helm::OperationState::Failed);

		/* Close without a channel reference.  */
		auto req = Helm::ChannelCloseRequest();
		req.transaction_id = std::string("tx1");
		auto before = client.count("closeChannel");
		return failure_of(mgr.close(req)).then([&, before](std::exception_ptr e) {
			assert(is<Helm::InvalidArgument>(e));
			assert(client.count("closeChannel") == before);
			assert(mgr.operations().back().kind == Helm::OperationKind::Close);
			assert(mgr.operations().back().state == Helm::OperationState::Rejected);
			return Ev::lift();
		});
	}).then([&]() {
		/* Force close strips the address.  */
		lines.clear();
		auto req = Helm::ChannelCloseRequest();
		req.transaction_id = std::string("tx1");
		req.transaction_vout = 0;
		req.is_force_close = true;
		req.address = std::string("bc1qdropme");
		return mgr.close(req);
	}).then([&](Helm::ChannelTx) {
		assert(client.last_close);
		assert(client.last_close->is_left());
		client.last_close->cmatch([](Helm::ForceCloseParams const& f) {
			assert(f.channel.transaction_id == "tx1");
			assert(f.channel.transaction_vout == 0);
		}, [](Helm::CooperativeCloseParams const&) {
			assert(false);
		});
		auto const& op = mgr.operations().back();
		assert(op.state == Helm::OperationState::Confirmed);
		assert(op.mode && *op.mode == Helm::CloseMode::Force);
		assert(op.channel == "tx1:0");

		auto noted = false;
		for (auto const& l : lines)
			if (l.find("dropping address") != std::string::npos)
				noted = true;
		assert(noted);

		/* Cooperative close rejected by the backend.  */
		client.failures["closeChannel"] = std::make_exception_ptr(
			Helm::BackendError("channel not found")
		);
		auto req = Helm::ChannelCloseRequest();
		req.id = std::string("chan7");
		req.is_graceful_close = false;
		return failure_of(mgr.close(req));
	}).then([&](std::exception_ptr e) {
		assert(is<Helm::CloseFailed>(e));
		try {
			std::rethrow_exception(e);
		} catch (Helm::CloseFailed const& f) {
			assert(f.channel() == "chan7");
			assert(f.mode() == Helm::CloseMode::Cooperative);
			assert(f.detail() == "channel not found");
		}
		client.last_close->cmatch([](Helm::ForceCloseParams const&) {
			assert(false);
		}, [](Helm::CooperativeCloseParams const& c) {
			assert(c.channel.id == "chan7");
			assert(c.is_graceful_close && !*c.is_graceful_close);
			assert(!c.is_force_close);
		});

		/* Every operation ended somewhere terminal.  */
		for (auto const& op : mgr.operations())
			assert(Helm::is_terminal(op.state));

		/* History keeps only the latest operations.  */
		auto open_rejected = [&]() {
			auto req = Helm::ChannelOpenRequest();
			req.partner_public_key = "02peer";
			return failure_of(short_mgr.open(req));
		};
		return open_rejected().then([&, open_rejected](std::exception_ptr) {
			return open_rejected();
		}).then([&, open_rejected](std::exception_ptr) {
			return open_rejected();
		});
	}).then([&](std::exception_ptr e) {
		assert(is<Helm::InvalidArgument>(e));
		assert(short_mgr.operations().size() == 2);
		assert(short_mgr.operations()[0].seq == 2);
		assert(short_mgr.operations()[1].seq == 3);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
