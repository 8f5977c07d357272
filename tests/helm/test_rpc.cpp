#undef NDEBUG
#include"FakeBackend.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Mod/Rpc.hpp"
#include"Helm/Msg/Log.hpp"
#include"Helm/Shutdown.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<functional>
#include<string>
#include<vector>

int main() {
	S::Bus bus;

	auto logs = std::vector<std::string>();
	bus.subscribe<Helm::Msg::Log>([&](Helm::Msg::Log const& l) {
		logs.push_back(l.message);
		return Ev::lift();
	});

	auto pair = FakeBackend::make_pair();
	FakeBackend backend(std::move(pair.first));
	Helm::Mod::Rpc rpc(bus, std::move(pair.second));

	/* A second connection whose peer never answers.  */
	auto pair2 = FakeBackend::make_pair();
	FakeBackend backend2(std::move(pair2.first));
	Helm::Mod::Rpc rpc2(bus, std::move(pair2.second));
	auto shutdown_detail = std::string();

	backend.handler = [](Jsmn::Object const& req) {
		auto method = std::string(req["method"]);
		if (method == "echo") {
			auto res = Json::Out();
			res.start_object()
				.field("got", req["params"]["x"])
			.end_object();
			return FakeBackend::result(req, res);
		}
		if (method == "fail")
			return FakeBackend::error(req, -32000, "nope");
		if (method == "login")
			return FakeBackend::result(req, Json::Out::empty_object());
		/* Anything else is never answered.  */
		return std::string();
	};

	auto wait_then_hang_up = std::function<Ev::Io<void>()>();
	wait_then_hang_up = [&]() {
		return Ev::yield().then([&]() {
			if (backend.requests.size() < 4)
				return wait_then_hang_up();
			backend.hang_up();
			return Ev::lift();
		});
	};

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(backend.serve());
	}).then([&]() {
		auto params = Json::Out();
		params.start_object()
			.field("x", 42)
		.end_object();
		return rpc.command("echo", params);
	}).then([&](Jsmn::Object res) {
		assert(res.is_object());
		assert(double(res["got"]) == 42);

		assert(backend.requests.size() == 1);
		auto req = backend.requests[0];
		assert(std::string(req["jsonrpc"]) == "2.0");
		assert(double(req["id"]) == 0);
		assert(std::string(req["method"]) == "echo");

		return rpc.command("fail", Json::Out::empty_object()).then([](Jsmn::Object) {
			assert(false);
			return Ev::lift(std::string());
		}).catching<Helm::Mod::RpcError>([](Helm::Mod::RpcError const& e) {
			assert(e.method == "fail");
			return Ev::lift(e.message());
		});
	}).then([&](std::string message) {
		assert(message == "nope");
		assert(double(backend.requests[1]["id"]) == 1);

		/* Secret parameters reach the peer but not the log.  */
		auto params = Json::Out();
		params.start_object()
			.field("macaroon", std::string("s3cr3t"))
		.end_object();
		return rpc.secret_command("login", params);
	}).then([&](Jsmn::Object) {
		assert(std::string(backend.requests[2]["params"]["macaroon"]) == "s3cr3t");
		for (auto const& l : logs)
			assert(l.find("s3cr3t") == std::string::npos);

		/* A pending command fails once the peer hangs up.  */
		return Ev::concurrent(wait_then_hang_up());
	}).then([&]() {
		return rpc.command("silent", Json::Out::empty_object()).then([](Jsmn::Object) {
			assert(false);
			return Ev::lift(std::string());
		}).catching<Helm::BackendUnavailable>([](Helm::BackendUnavailable const& e) {
			return Ev::lift(e.detail());
		});
	}).then([&](std::string detail) {
		assert(detail == "connection closed by node backend");

		/* And so does every later command.  */
		return rpc.command("echo", Json::Out::empty_object()).then([](Jsmn::Object) {
			assert(false);
			return Ev::lift(false);
		}).catching<Helm::BackendUnavailable>([](Helm::BackendUnavailable const&) {
			return Ev::lift(true);
		});
	}).then([&](bool flag) {
		assert(flag);

		/* Shutdown fails whatever is still pending.  */
		auto pending = rpc2.command("silent", Json::Out::empty_object()).then([](Jsmn::Object) {
			assert(false);
			return Ev::lift();
		}).catching<Helm::BackendUnavailable>([&](Helm::BackendUnavailable const& e) {
			shutdown_detail = e.detail();
			return Ev::lift();
		});
		return Ev::concurrent(pending);
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		assert(shutdown_detail.empty());
		return bus.raise(Helm::Shutdown());
	}).then([&]() {
		return Ev::yield(10);
	}).then([&]() {
		assert(shutdown_detail == "shutting down");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
