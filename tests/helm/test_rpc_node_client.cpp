#undef NDEBUG
#include"FakeBackend.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Helm/ChannelCloseRequest.hpp"
#include"Helm/CloseParams.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Mod/Rpc.hpp"
#include"Helm/RpcNodeClient.hpp"
#include"Helm/Shutdown.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<string>

namespace {

Json::Out canned(std::string const& text) {
	return Json::Out(Jsmn::Parser::parse_datum(text));
}

std::string const txid = std::string(64, 'e');

std::string answer(Jsmn::Object const& req) {
	auto method = std::string(req["method"]);
	if (method == "authenticate")
		return FakeBackend::result(req, Json::Out::empty_object());
	if (method == "getIdentity")
		return FakeBackend::result(req, canned(R"({"public_key": "02abc"})"));
	if (method == "getChannels")
		return FakeBackend::result(req, canned(R"(
			{ "channels":
			  [ { "id": "c1"
			    , "partner_public_key": "02p"
			    , "capacity": 1000
			    , "local_balance": 600
			    , "remote_balance": 400
			    , "is_active": true
			    , "pending_payments": []
			    }
			  ]
			}
		)"));
	if (method == "closeChannel")
		return FakeBackend::result(req, canned(
			R"({"transaction_id": ")" + txid + R"(", "transaction_vout": 1})"
		));
	if (method == "getChainBalance")
		return FakeBackend::error(req, 2, "wallet locked");
	if (method == "getChainAddresses")
		return FakeBackend::result(req, canned(R"({"addresses": "oops"})"));
	return std::string();
}

}

int main() {
	S::Bus bus;

	auto pair = FakeBackend::make_pair();
	FakeBackend backend(std::move(pair.first));
	backend.handler = &answer;
	Helm::Mod::Rpc rpc(bus, std::move(pair.second));

	auto creds = Helm::Credentials{"CERT", "MACAROON", "127.0.0.1:10009"};

	{
		auto flag = false;
		try {
			auto bad = creds;
			bad.macaroon = "";
			Helm::RpcNodeClient c(rpc, bad);
		} catch (Helm::InvalidArgument const& e) {
			flag = std::string(e.what()).find("macaroon") != std::string::npos;
		}
		assert(flag);
	}

	Helm::RpcNodeClient client(rpc, creds);

	auto code = Ev::lift().then([&]() {
		return Ev::concurrent(backend.serve());
	}).then([&]() {
		return client.authenticate();
	}).then([&]() {
		auto req = backend.requests[0];
		assert(std::string(req["method"]) == "authenticate");
		assert(std::string(req["params"]["cert"]) == "CERT");
		assert(std::string(req["params"]["macaroon"]) == "MACAROON");

		return client.get_identity();
	}).then([&](Helm::NodeIdentity id) {
		assert(id.public_key == "02abc");

		auto filter = Helm::ChannelFilter();
		filter.is_active = true;
		return client.get_channels(filter);
	}).then([&](std::vector<Helm::Channel> chans) {
		auto params = backend.requests[2]["params"];
		assert(params.size() == 1);
		assert(bool(params["is_active"]));

		assert(chans.size() == 1);
		assert(chans[0].id == "c1");
		assert(chans[0].local_balance == Ln::Amount::sat(600));
		assert(chans[0].is_active);
		assert(!chans[0].is_private);
		assert(chans[0].is_consistent());

		/* A force close never carries cooperative-only
		 * fields on the wire.  */
		auto r = Helm::ChannelCloseRequest();
		r.id = std::string("c1");
		r.is_force_close = true;
		r.address = std::string("bc1qx");
		r.public_key = std::string("02p");
		r.tokens_per_vbyte = 5;
		return client.close_channel(Helm::make_close_params(r));
	}).then([&](Helm::ChannelTx tx) {
		assert(tx.transaction_id == txid);
		assert(tx.transaction_vout == 1);

		auto params = backend.requests[3]["params"];
		assert(std::string(params["id"]) == "c1");
		assert(bool(params["is_force_close"]));
		assert(double(params["tokens_per_vbyte"]) == 5);
		assert(!params.has("address"));
		assert(!params.has("public_key"));

		/* Cooperative, by funding outpoint.  */
		auto r = Helm::ChannelCloseRequest();
		r.transaction_id = txid;
		r.transaction_vout = 0;
		r.address = std::string("bc1qx");
		return client.close_channel(Helm::make_close_params(r));
	}).then([&](Helm::ChannelTx) {
		auto params = backend.requests[4]["params"];
		assert(!params.has("id"));
		assert(std::string(params["transaction_id"]) == txid);
		assert(double(params["transaction_vout"]) == 0);
		assert(std::string(params["address"]) == "bc1qx");
		assert(!params.has("is_force_close"));

		/* Backend refusals keep the backend's text.  */
		return client.get_chain_balance().then([](Ln::Amount) {
			assert(false);
			return Ev::lift(std::string());
		}).catching<Helm::BackendError>([](Helm::BackendError const& e) {
			return Ev::lift(e.detail());
		});
	}).then([&](std::string detail) {
		assert(detail == "wallet locked");

		/* So are replies we cannot interpret.  */
		return client.get_chain_addresses().then([](std::vector<Helm::ChainAddress>) {
			assert(false);
			return Ev::lift(false);
		}).catching<Helm::BackendError>([](Helm::BackendError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool flag) {
		assert(flag);
		backend.stop();
		return bus.raise(Helm::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
