#undef NDEBUG
#include"Helm/ChannelCloseRequest.hpp"
#include"Helm/CloseParams.hpp"
#include"Helm/Exception.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<assert.h>
#include<algorithm>
#include<string>
#include<vector>

namespace {

Helm::ChannelCloseRequest request(std::string const& json) {
	return Helm::channel_close_request_from_json(
		Jsmn::Object::parse_json(json)
	);
}
Jsmn::Object wire(Helm::CloseParams const& p) {
	return Jsmn::Object::parse_json(Helm::close_params_to_json(p).output());
}
std::vector<std::string> sorted_keys(Jsmn::Object const& js) {
	auto rv = js.keys();
	std::sort(rv.begin(), rv.end());
	return rv;
}
bool rejected(std::string const& json) {
	try {
		Helm::make_close_params(request(json));
	} catch (Helm::InvalidArgument const&) {
		return true;
	}
	return false;
}

typedef std::vector<std::string> Keys;

}

int main() {
	/* Force close by outpoint drops cooperative fields.  */
	{
		auto req = request(R"JSON(
		{ "transaction_id": "tx1", "transaction_vout": 0
		, "is_force_close": true, "address": "bc1qxyz"
		, "is_graceful_close": true, "socket": "peer:9735"
		}
		)JSON");
		auto p = Helm::make_close_params(req);
		assert(p.is_left());
		assert(Helm::close_mode(p) == Helm::CloseMode::Force);
		assert(Helm::close_channel_ref(p).text() == "tx1:0");

		auto js = wire(p);
		assert(sorted_keys(js) == (Keys{ "is_force_close"
					      , "transaction_id"
					      , "transaction_vout"
					      }));
		assert(bool(js["is_force_close"]));
		assert(std::string(js["transaction_id"]) == "tx1");
		assert(double(js["transaction_vout"]) == 0);

		auto dropped = Helm::force_close_dropped_fields(req);
		assert(dropped == (Keys{"address", "is_graceful_close", "socket"}));
	}

	/* Force close keeps fee control.  */
	{
		auto p = Helm::make_close_params(request(R"JSON(
		{ "id": "chan9", "is_force_close": true
		, "tokens_per_vbyte": 5, "target_confirmations": 6
		}
		)JSON"));
		auto js = wire(p);
		assert(sorted_keys(js) == (Keys{ "id", "is_force_close"
					      , "target_confirmations"
					      , "tokens_per_vbyte"
					      }));
		assert(double(js["tokens_per_vbyte"]) == 5);
	}

	/* Cooperative close: only the fields given, explicit
	 * false and zero kept.  */
	{
		auto req = request(R"JSON(
		{ "id": "chan1", "is_force_close": false
		, "address": "bc1qcoop", "is_graceful_close": false
		, "max_tokens_per_vbyte": 0
		}
		)JSON");
		auto p = Helm::make_close_params(req);
		assert(p.is_right());
		assert(Helm::close_mode(p) == Helm::CloseMode::Cooperative);
		assert(Helm::force_close_dropped_fields(req).empty());

		auto js = wire(p);
		assert(sorted_keys(js) == (Keys{ "address", "id"
					      , "is_force_close"
					      , "is_graceful_close"
					      , "max_tokens_per_vbyte"
					      }));
		assert(!bool(js["is_force_close"]));
		assert(!bool(js["is_graceful_close"]));
		assert(double(js["max_tokens_per_vbyte"]) == 0);
	}
	{
		auto js = wire(Helm::make_close_params(request(R"JSON(
		{ "id": "chan1", "public_key": "02bb", "socket": "1.2.3.4:9735" }
		)JSON")));
		assert(sorted_keys(js) == (Keys{"id", "public_key", "socket"}));
	}

	/* The id wins over an outpoint.  */
	{
		auto p = Helm::make_close_params(request(R"JSON(
		{ "id": " chan2 ", "transaction_id": "tx2", "transaction_vout": 1 }
		)JSON"));
		assert(Helm::close_channel_ref(p).text() == "chan2");
		assert(sorted_keys(wire(p)) == (Keys{"id"}));
	}
	/* A blank id falls back to the outpoint.  */
	{
		auto p = Helm::make_close_params(request(R"JSON(
		{ "id": "  ", "transaction_id": "tx3", "transaction_vout": 2 }
		)JSON"));
		assert(Helm::close_channel_ref(p).text() == "tx3:2");
	}

	/* Incomplete channel references.  */
	assert(rejected("{}"));
	assert(rejected(R"JSON({"transaction_id": "tx1"})JSON"));
	assert(rejected(R"JSON({"transaction_vout": 0})JSON"));
	assert(rejected(R"JSON({"id": "", "transaction_id": "tx1"})JSON"));
	assert(rejected(R"JSON({"id": "c", "bogus": 1})JSON"));
	assert(rejected(R"JSON({"transaction_id": "t", "transaction_vout": -1})JSON"));
	assert(rejected(R"JSON({"transaction_id": "t", "transaction_vout": 4294967296})JSON"));

	return 0;
}
