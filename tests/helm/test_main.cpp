#undef NDEBUG
#include"FakeBackend.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Helm/Main.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<memory>
#include<sstream>
#include<string>
#include<vector>

namespace {

struct Run {
	std::ostringstream out;
	std::ostringstream err;
	std::unique_ptr<Helm::Main> main;
};

std::string answer(Jsmn::Object const& req) {
	auto method = std::string(req["method"]);
	if (method == "authenticate")
		return FakeBackend::result(req, Json::Out::empty_object());
	if (method == "getIdentity")
		return FakeBackend::result(req, Json::Out(Jsmn::Parser::parse_datum(
			R"({"public_key": "02node"})"
		)));
	if (method == "getChannels")
		return FakeBackend::result(req, Json::Out(Jsmn::Parser::parse_datum(R"(
			{ "channels":
			  [ { "id": "c1", "partner_public_key": "02p"
			    , "capacity": 100, "local_balance": 10
			    , "remote_balance": 90, "is_active": false
			    }
			  ]
			}
		)")));
	return FakeBackend::error(req, 1, "unsupported");
}

bool has(std::ostringstream const& os, std::string const& text) {
	return os.str().find(text) != std::string::npos;
}

}

int main() {
	/* Each run connects to a fresh fake node.  */
	auto backends = std::vector<std::unique_ptr<FakeBackend>>();
	auto opener = [&backends](std::string const& socket) {
		assert(socket == "node.sock");
		auto pair = FakeBackend::make_pair();
		auto b = Util::make_unique<FakeBackend>(std::move(pair.first));
		b->handler = &answer;
		b->serve().run([]() { }, [](std::exception_ptr) {
			assert(false);
		});
		backends.push_back(std::move(b));
		return std::move(pair.second);
	};

	auto runs = std::vector<std::shared_ptr<Run>>();
	auto start = [&](std::vector<std::string> args) {
		auto r = std::make_shared<Run>();
		args.insert(args.begin(), "lnhelm");
		r->main = Util::make_unique<Helm::Main>(args, r->out, r->err, opener);
		runs.push_back(r);
		return r->main->run();
	};
	auto connected = [&](std::vector<std::string> rest) {
		auto args = std::vector<std::string>{ "--socket=node.sock"
						    , "--cert=C"
						    , "--macaroon=M"
						    , "--log-level=error"
						    };
		args.insert(args.end(), rest.begin(), rest.end());
		return start(args);
	};
	auto last = [&]() -> Run& {
		return *runs.back();
	};
	auto before = std::size_t(0);

	auto code = Ev::lift().then([&]() {
		return start({"--version"});
	}).then([&](int c) {
		assert(c == 0);
		assert(last().out.str().find("lnhelm") == 0);

		return start({});
	}).then([&](int c) {
		assert(c == 2);
		assert(has(last().err, "No command given"));
		assert(has(last().err, "Usage:"));

		return start({"--bogus=1", "status"});
	}).then([&](int c) {
		assert(c == 2);
		assert(has(last().err, "--bogus"));

		return start({"--timeout=0", "status"});
	}).then([&](int c) {
		assert(c == 2);
		assert(backends.empty());

		/* No socket is an operation failure, not bad
		 * usage.  */
		return start({"--cert=C", "--macaroon=M", "status"});
	}).then([&](int c) {
		assert(c == 1);
		assert(last().err.str().find("lnhelm: InvalidArgument: ") == 0);
		assert(backends.empty());

		return connected({"status"});
	}).then([&](int c) {
		assert(c == 0);
		assert(backends.size() == 1);
		auto js = Jsmn::Object::parse_json(Util::Str::trim(last().out.str()));
		assert(std::string(js["public_key"]) == "02node");
		assert(double(js["channel_count"]) == 1);
		assert(double(js["active_channel_count"]) == 0);

		/* Credentials went out first.  */
		auto const& reqs = backends.back()->requests;
		assert(std::string(reqs[0]["method"]) == "authenticate");
		assert(std::string(reqs[0]["params"]["macaroon"]) == "M");

		return connected({"channels", R"({"is_offline": true})"});
	}).then([&](int c) {
		assert(c == 0);
		auto js = Jsmn::Object::parse_json(Util::Str::trim(last().out.str()));
		assert(js["channels"].size() == 1);
		assert(std::string(js["channels"][0]["id"]) == "c1");

		/* The only channel is inactive.  */
		return connected({"pay", R"({"request": "lnbc1"})"});
	}).then([&](int c) {
		assert(c == 1);
		assert(last().out.str().empty());
		assert(has(last().err, "lnhelm: PaymentFailed: "));

		return connected({"balance"});
	}).then([&](int c) {
		assert(c == 1);
		assert(has(last().err, "BackendError"));
		assert(has(last().err, "unsupported"));

		/* Bad input is rejected without connecting.  */
		before = backends.size();
		return connected({"channels", "[1"});
	}).then([&](int c) {
		assert(c == 1);
		assert(last().err.str().find("lnhelm: InvalidArgument: ") == 0);
		assert(has(last().err, "Parameters are not JSON"));
		assert(backends.size() == before);

		return connected({"frobnicate"});
	}).then([&](int c) {
		assert(c == 1);
		assert(last().err.str().find("lnhelm: InvalidArgument: ") == 0);
		assert(has(last().err, "Unknown command: frobnicate"));
		assert(backends.size() == before);

		/* Neither an id nor an outpoint.  */
		return connected({"close", "{}"});
	}).then([&](int c) {
		assert(c == 1);
		assert(last().err.str().find("lnhelm: InvalidArgument: ") == 0);
		assert(backends.size() == before);

		return connected({"open", R"({"partner_public_key": "02p"})"});
	}).then([&](int c) {
		assert(c == 1);
		assert(has(last().err, "local_tokens"));
		assert(backends.size() == before);

		return connected({"new-address", R"({"format": "p2pkh"})"});
	}).then([&](int c) {
		assert(c == 1);
		assert(has(last().err, "Unknown address format"));
		assert(backends.size() == before);

		return connected({"pay", "{}"});
	}).then([&](int c) {
		assert(c == 1);
		assert(last().err.str().find("lnhelm: InvalidArgument: ") == 0);
		assert(backends.size() == before);

		/* Missing credentials are caught before connecting too.  */
		return start({"--socket=node.sock", "--cert=C", "status"});
	}).then([&](int c) {
		assert(c == 1);
		assert(has(last().err, "macaroon"));
		assert(backends.size() == before);

		for (auto& b : backends)
			b->stop();
		return Ev::lift(0);
	});

	return Ev::start(code);
}
