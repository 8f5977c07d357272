#include"Ev/Io.hpp"
#include"Helm/ChannelRegistry.hpp"
#include"Helm/Exception.hpp"
#include"Helm/NodeClientIF.hpp"
#include"Helm/Payment.hpp"
#include"Helm/PaymentDispatcher.hpp"
#include"Helm/log.hpp"

namespace {

Helm::PaymentReceipt unconfirmed( std::string const& channel
				, std::string failure
				) {
	auto rv = Helm::PaymentReceipt();
	rv.confirmed = false;
	rv.outgoing_channel = channel;
	rv.failure = std::move(failure);
	return rv;
}

}

namespace Helm {

PaymentDispatcher::PaymentDispatcher( S::Bus& bus_
				    , NodeClientIF& client_
				    , ChannelRegistry& registry_
				    ) : bus(bus_)
				      , client(client_)
				      , registry(registry_)
				      { }

Ev::Io<PaymentReceipt> PaymentDispatcher::pay(PayRequest req) {
	return Ev::lift().then([this, req]() {
		check_pay_request(req);
		if (registry.has_snapshot())
			return Ev::lift();
		return registry.refresh().then([](ChannelRegistry::Snapshot) {
			return Ev::lift();
		});
	}).then([this, req]() {
		return submit(req);
	});
}

Ev::Io<PaymentReceipt> PaymentDispatcher::submit(PayRequest const& req) {
	auto channel = std::string();
	try {
		channel = registry.best_outbound_channel();
	} catch (NoAvailableChannel const& e) {
		return Helm::log( bus, Warn
				, "PaymentDispatcher: not paying: %s"
				, e.what()
				).then([]() {
			throw PaymentFailed( PaymentFailure::NoAvailableChannel
					   , "no active channel in registry"
					   );
			return Ev::lift(PaymentReceipt());
		});
	}

	return Helm::log( bus, Info
			, "PaymentDispatcher: paying through %s"
			, channel.c_str()
			).then([this, req, channel]() {
		return client.pay(req, channel);
	}).then([this, channel](PaymentResult r) {
		auto rv = PaymentReceipt();
		rv.id = r.id;
		rv.confirmed = r.is_confirmed;
		rv.tokens = r.tokens;
		rv.fee = r.fee;
		rv.outgoing_channel = channel;
		if (!rv.confirmed)
			rv.failure = "backend did not confirm the payment";
		return Helm::log( bus, rv.confirmed ? Info : Warn
				, "PaymentDispatcher: payment %s %s, "
				  "fee %s"
				, rv.id.c_str()
				, rv.confirmed ? "confirmed" : "unconfirmed"
				, std::string(rv.fee).c_str()
				).then([rv]() {
			return Ev::lift(rv);
		});
	}).catching<BackendError>([this, channel](BackendError const& e) {
		return Helm::log( bus, Warn
				, "PaymentDispatcher: payment through %s "
				  "failed: %s"
				, channel.c_str()
				, e.detail().c_str()
				).then([channel, e]() {
			return Ev::lift(unconfirmed(channel, e.detail()));
		});
	}).catching<BackendTimeout>([this, channel](BackendTimeout const& e) {
		return Helm::log( bus, Warn
				, "PaymentDispatcher: payment through %s "
				  "outcome unknown: %s"
				, channel.c_str()
				, e.detail().c_str()
				).then([channel, e]() {
			return Ev::lift(unconfirmed( channel
						   , "outcome unknown: "
						   + e.detail()
						   ));
		});
	});
}

}
