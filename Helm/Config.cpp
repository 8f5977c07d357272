#include"Helm/Config.hpp"
#include"Helm/Exception.hpp"
#include"Helm/FieldReader.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include<cerrno>
#include<cstdlib>
#include<fstream>
#include<sstream>

namespace {

double parse_seconds(std::string const& name, std::string const& value) {
	auto end = (char*) nullptr;
	errno = 0;
	auto rv = std::strtod(value.c_str(), &end);
	if (value.empty() || *end != '\0' || errno != 0)
		throw Helm::InvalidArgument(
			"--" + name + " must be a number of seconds, got "
			+ value
		);
	return rv;
}

}

namespace Helm {

void config_apply_json(Config& c, Jsmn::Object const& obj) {
	auto f = FieldReader(obj, JsonSource::Caller, "configuration");
	f.only({ "socket", "cert", "macaroon"
	       , "partner_public_key", "partner_socket"
	       , "timeout", "refresh_interval", "log_level"
	       });

	if (auto v = f.opt_string("socket"))
		c.socket = *v;
	if (auto v = f.opt_string("cert"))
		c.cert = *v;
	if (auto v = f.opt_string("macaroon"))
		c.macaroon = *v;
	if (auto v = f.opt_string("partner_public_key"))
		c.partner.public_key = *v;
	if (auto v = f.opt_string("partner_socket"))
		c.partner.socket = *v;
	if (auto v = f.opt_number("timeout"))
		c.timeout = *v;
	if (auto v = f.opt_number("refresh_interval"))
		c.refresh_interval = *v;
	if (auto v = f.opt_string("log_level"))
		c.log_level = log_level_from_string(*v);
}

Config config_load_file(std::string const& path, Config base) {
	auto file = std::ifstream(path);
	if (!file)
		throw InvalidArgument("Cannot read configuration " + path);
	auto os = std::ostringstream();
	os << file.rdbuf();

	auto obj = Jsmn::Object();
	try {
		obj = Jsmn::Object::parse_json(os.str());
	} catch (Jsmn::ParseError const& e) {
		throw InvalidArgument( "Configuration " + path
				     + " is not JSON: " + e.what()
				     );
	}
	config_apply_json(base, obj);
	return base;
}

bool config_apply_option( Config& c
			, std::string const& name
			, std::string const& value
			) {
	if (name == "socket")
		c.socket = value;
	else if (name == "cert")
		c.cert = value;
	else if (name == "macaroon")
		c.macaroon = value;
	else if (name == "partner-public-key")
		c.partner.public_key = value;
	else if (name == "partner-socket")
		c.partner.socket = value;
	else if (name == "timeout")
		c.timeout = parse_seconds(name, value);
	else if (name == "refresh-interval")
		c.refresh_interval = parse_seconds(name, value);
	else if (name == "log-level")
		c.log_level = log_level_from_string(value);
	else
		return false;
	return true;
}

void config_check(Config const& c) {
	if (!(c.timeout > 0))
		throw InvalidArgument("timeout must be positive");
	if (!(c.refresh_interval > 0))
		throw InvalidArgument("refresh_interval must be positive");
}

}
