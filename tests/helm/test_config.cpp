#undef NDEBUG
#include"Helm/Config.hpp"
#include"Helm/Exception.hpp"
#include"Jsmn/Object.hpp"
#include<assert.h>
#include<cstdio>
#include<fstream>
#include<functional>
#include<string>
#include<unistd.h>

namespace {

bool rejects(std::function<void()> f) {
	try {
		f();
	} catch (Helm::InvalidArgument const&) {
		return true;
	}
	return false;
}

std::string write_temp(std::string const& text) {
	auto path = std::string("/tmp/lnhelm-test-config-")
		  + std::to_string(getpid())
		  + ".json"
		  ;
	auto file = std::ofstream(path);
	file << text;
	return path;
}

}

int main() {
	{
		auto c = Helm::Config();
		assert(c.timeout == 60);
		assert(c.refresh_interval == 600);
		assert(c.log_level == Helm::Info);
		assert(c.socket.empty());
		Helm::config_check(c);
	}

	{
		auto c = Helm::Config();
		Helm::config_apply_json(c, Jsmn::Object::parse_json(R"(
			{ "socket": "127.0.0.1:10009"
			, "cert": "CERT"
			, "macaroon": "MAC"
			, "partner_public_key": "02p"
			, "timeout": 2.5
			, "log_level": "debug"
			}
		)"));
		assert(c.socket == "127.0.0.1:10009");
		assert(c.cert == "CERT");
		assert(c.macaroon == "MAC");
		assert(c.partner.public_key == "02p");
		assert(c.partner.socket.empty());
		assert(c.timeout == 2.5);
		assert(c.refresh_interval == 600);
		assert(c.log_level == Helm::Debug);
	}

	assert(rejects([]() {
		auto c = Helm::Config();
		Helm::config_apply_json(c, Jsmn::Object::parse_json(R"({"sockett": "x"})"));
	}));
	assert(rejects([]() {
		auto c = Helm::Config();
		Helm::config_apply_json(c, Jsmn::Object::parse_json(R"({"timeout": "soon"})"));
	}));
	assert(rejects([]() {
		auto c = Helm::Config();
		Helm::config_apply_json(c, Jsmn::Object::parse_json(R"({"log_level": "loud"})"));
	}));
	assert(rejects([]() {
		auto c = Helm::Config();
		Helm::config_apply_json(c, Jsmn::Object::parse_json("[]"));
	}));

	/* Files.  */
	assert(rejects([]() {
		Helm::config_load_file("/nonexistent/lnhelm.json");
	}));
	{
		auto path = write_temp("{ not json");
		assert(rejects([path]() {
			Helm::config_load_file(path);
		}));
		std::remove(path.c_str());
	}
	{
		auto path = write_temp(R"({"socket": "node:1", "refresh_interval": 30})");
		auto base = Helm::Config();
		base.cert = "KEPT";
		auto c = Helm::config_load_file(path, base);
		std::remove(path.c_str());
		assert(c.socket == "node:1");
		assert(c.refresh_interval == 30);
		assert(c.cert == "KEPT");
	}

	/* Command-line options.  */
	{
		auto c = Helm::Config();
		assert(Helm::config_apply_option(c, "timeout", "0.5"));
		assert(c.timeout == 0.5);
		assert(Helm::config_apply_option(c, "partner-socket", "peer:9735"));
		assert(c.partner.socket == "peer:9735");
		assert(Helm::config_apply_option(c, "log-level", "warn"));
		assert(c.log_level == Helm::Warn);
		assert(!Helm::config_apply_option(c, "verbose", "1"));

		assert(rejects([&c]() {
			Helm::config_apply_option(c, "refresh-interval", "10s");
		}));
		assert(rejects([&c]() {
			Helm::config_apply_option(c, "timeout", "");
		}));
	}

	for (auto bad : {0.0, -3.0}) {
		auto c = Helm::Config();
		c.timeout = bad;
		assert(rejects([c]() { Helm::config_check(c); }));
		c = Helm::Config();
		c.refresh_interval = bad;
		assert(rejects([c]() { Helm::config_check(c); }));
	}

	return 0;
}
