#ifndef HELM_CONFIG_HPP
#define HELM_CONFIG_HPP

#include"Helm/ChannelLifecycleManager.hpp"
#include"Helm/LogLevel.hpp"
#include<string>

namespace Jsmn { class Object; }

namespace Helm {

/** struct Helm::Config
 *
 * @brief settings of an lnhelm run.
 *
 * @desc loaded from a JSON file with the keys
 * `socket`, `cert`, `macaroon`,
 * `partner_public_key`, `partner_socket`,
 * `timeout`, `refresh_interval` and `log_level`,
 * then overridden from the command line.
 * Durations are in seconds.
 */
struct Config {
	std::string socket;
	std::string cert;
	std::string macaroon;
	PartnerDefaults partner;
	double timeout;
	double refresh_interval;
	LogLevel log_level;

	Config() : timeout(60)
		 , refresh_interval(600)
		 , log_level(Info)
		 { }
};

/* Overlays the keys present in `obj`.
 * Throws Helm::InvalidArgument on an unknown key or a
 * value of the wrong type.  */
void config_apply_json(Config&, Jsmn::Object const& obj);

/* Reads a JSON configuration file over `base`.  */
Config config_load_file(std::string const& path, Config base = Config());

/* Applies a command-line option given without its
 * leading "--".  Returns false if `name` is not a
 * configuration option.  */
bool config_apply_option( Config&
			, std::string const& name
			, std::string const& value
			);

/* Throws Helm::InvalidArgument unless timeout and
 * refresh_interval are positive.  Credentials are
 * checked when the node client is built.  */
void config_check(Config const&);

}

#endif /* !defined(HELM_CONFIG_HPP) */
