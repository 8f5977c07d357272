#undef NDEBUG
#include"FakeNodeClient.hpp"
#include"Ev/start.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Mod/Waiter.hpp"
#include"Helm/Shutdown.hpp"
#include"Helm/TimedNodeClient.hpp"
#include"S/Bus.hpp"
#include<assert.h>

int main() {
	S::Bus bus;
	Helm::Mod::Waiter waiter(bus);
	FakeNodeClient inner;

	for (auto bad : {0.0, -1.0}) {
		auto flag = false;
		try {
			Helm::TimedNodeClient t(inner, waiter, bad);
		} catch (Helm::InvalidArgument const&) {
			flag = true;
		}
		assert(flag);
	}

	Helm::TimedNodeClient client(inner, waiter, 0.05);

	auto code = Ev::lift().then([&]() {
		/* Prompt answers pass through.  */
		return client.get_identity();
	}).then([&](Helm::NodeIdentity id) {
		assert(id.public_key == inner.identity.public_key);

		inner.hangs.insert("pay");
		return client.pay(Helm::PayRequest(), "chan").then([](Helm::PaymentResult) {
			assert(false);
			return Ev::lift(std::string());
		}).catching<Helm::BackendTimeout>([](Helm::BackendTimeout const& e) {
			return Ev::lift(e.detail());
		});
	}).then([&](std::string detail) {
		assert(detail.find("pay") == 0);
		assert(detail.find("no reply") != std::string::npos);
		assert(inner.count("pay") == 1);

		/* Backend errors are not timeouts.  */
		inner.failures["getChainBalance"] = std::make_exception_ptr(
			Helm::BackendError("boom")
		);
		return client.get_chain_balance().then([](Ln::Amount) {
			assert(false);
			return Ev::lift(false);
		}).catching<Helm::BackendError>([](Helm::BackendError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool flag) {
		assert(flag);
		return bus.raise(Helm::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
