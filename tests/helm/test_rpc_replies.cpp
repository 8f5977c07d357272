#undef NDEBUG
#include"FakeBackend.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Mod/Rpc.hpp"
#include"Helm/Mod/Waiter.hpp"
#include"Helm/Shutdown.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<string>

namespace {

std::string which(Jsmn::Object const& req, std::string const& w) {
	auto res = Json::Out();
	res.start_object()
		.field("which", w)
	.end_object();
	return FakeBackend::result(req, res);
}

}

int main() {
	S::Bus bus;
	Helm::Mod::Waiter waiter(bus);

	auto pair = FakeBackend::make_pair();
	FakeBackend backend(std::move(pair.first));
	Helm::Mod::Rpc rpc(bus, std::move(pair.second), 0.02);

	backend.handler = [](Jsmn::Object const& req) {
		auto method = std::string(req["method"]);
		if (method != "echo")
			return std::string();
		/* Replies whose ids we never sent come first.  */
		auto rv = std::string()
			+ R"({"jsonrpc": "2.0", "id": -1, "result": {"which": "bad"}})" "\n"
			+ R"({"jsonrpc": "2.0", "id": 1e300, "result": {"which": "bad"}})" "\n"
			+ R"({"jsonrpc": "2.0", "id": 0.5, "result": {"which": "bad"}})" "\n"
			+ R"({"jsonrpc": "2.0", "id": "0", "result": {"which": "bad"}})" "\n"
			;
		/* The late answer to the forgotten command.  */
		if (double(req["id"]) == 2)
			rv += R"({"jsonrpc": "2.0", "id": 1, "result": {"which": "late"}})" "\n";
		return rv + which(req, "good");
	};

	auto slow_detail = std::string();

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(backend.serve());
	}).then([&]() {
		return rpc.command("echo", Json::Out::empty_object());
	}).then([&](Jsmn::Object res) {
		assert(std::string(res["which"]) == "good");

		auto slow = rpc.command("slow", Json::Out::empty_object()).then([](Jsmn::Object) {
			assert(false);
			return Ev::lift();
		}).catching<Helm::BackendTimeout>([&](Helm::BackendTimeout const& e) {
			slow_detail = e.detail();
			return Ev::lift();
		});
		return Ev::concurrent(slow);
	}).then([&]() {
		return waiter.wait(0.05);
	}).then([&]() {
		assert(slow_detail.empty());
		/* The next command drops the stale one.  */
		return rpc.command("echo", Json::Out::empty_object());
	}).then([&](Jsmn::Object res) {
		assert(slow_detail == "slow: no reply after 0.02 seconds");
		assert(std::string(res["which"]) == "good");
		assert(backend.requests.size() == 3);

		backend.stop();
		return bus.raise(Helm::Shutdown());
	}).then([&]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
