#include"Ev/Io.hpp"
#include"Helm/ChainAddress.hpp"
#include"Helm/ChainFundsManager.hpp"
#include"Helm/Channel.hpp"
#include"Helm/ChannelCloseRequest.hpp"
#include"Helm/ChannelLifecycleManager.hpp"
#include"Helm/ChannelOpenRequest.hpp"
#include"Helm/ChannelRegistry.hpp"
#include"Helm/ChannelTx.hpp"
#include"Helm/CloseParams.hpp"
#include"Helm/Config.hpp"
#include"Helm/Exception.hpp"
#include"Helm/FieldReader.hpp"
#include"Helm/Invoice.hpp"
#include"Helm/InvoiceIssuer.hpp"
#include"Helm/Main.hpp"
#include"Helm/Mod/LogOutputter.hpp"
#include"Helm/Mod/RegistryRefresher.hpp"
#include"Helm/Mod/Rpc.hpp"
#include"Helm/Mod/Waiter.hpp"
#include"Helm/Msg/ChannelsRefreshed.hpp"
#include"Helm/NodeSummary.hpp"
#include"Helm/Payment.hpp"
#include"Helm/PaymentDispatcher.hpp"
#include"Helm/RpcNodeClient.hpp"
#include"Helm/Shutdown.hpp"
#include"Helm/StatusReporter.hpp"
#include"Helm/TimedNodeClient.hpp"
#include"Helm/log.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<memory>


namespace {

auto const usage_text =
"Usage: lnhelm [OPTIONS] COMMAND [JSON-PARAMS]\n"
"\n"
"Commands:\n"
" status          Node public key and channel counts.\n"
" channels        List channels; params filter them by\n"
"                 is_active, is_offline, is_private,\n"
"                 is_public, partner_public_key.\n"
" best-channel    Active channel with the most outbound liquidity.\n"
" open            Open a channel.\n"
" close           Close a channel, cooperatively or by force.\n"
" pay             Pay a BOLT11 payment request.\n"
" invoice         Create an invoice.\n"
" addresses       List chain addresses.\n"
" new-address     Create a chain address ({format, is_unused}).\n"
" balance         Confirmed chain balance.\n"
" watch           Refresh channels periodically ({iterations}).\n"
"\n"
"Options:\n"
" --conf=FILE                JSON configuration file.\n"
" --socket=HOST:PORT|PATH    Node backend socket.\n"
" --cert=CERT                Backend TLS certificate.\n"
" --macaroon=MACAROON        Backend macaroon.\n"
" --partner-public-key=KEY   Default partner for open.\n"
" --partner-socket=ADDR      Default partner address for open.\n"
" --timeout=SECONDS          Backend call timeout (default 60).\n"
" --refresh-interval=SECONDS Channel refresh period (default 600).\n"
" --log-level=LEVEL          trace, debug, info, warn, error.\n"
" --version, -V              Show version.\n"
" --help, -h                 Show this help.\n"
;

}

namespace Helm {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;
	std::function<Net::Fd(std::string const&)> open_node_socket;

	Helm::Config config;
	std::string command;
	std::string params_text;
	int usage_error;
	bool is_version;
	bool is_help;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Mod::Waiter> waiter;
	std::unique_ptr<Mod::LogOutputter> logger;
	std::unique_ptr<Mod::Rpc> rpc;
	std::unique_ptr<RpcNodeClient> rpc_client;
	std::unique_ptr<TimedNodeClient> client;
	std::unique_ptr<ChannelRegistry> registry;
	std::unique_ptr<ChainFundsManager> funds;
	std::unique_ptr<ChannelLifecycleManager> lifecycle;
	std::unique_ptr<PaymentDispatcher> dispatcher;
	std::unique_ptr<InvoiceIssuer> issuer;
	std::unique_ptr<StatusReporter> status;
	std::unique_ptr<Mod::RegistryRefresher> refresher;

	/* State of the watch command.  */
	std::size_t watch_left;
	std::function<void()> watch_done;

	void parse_args(std::vector<std::string> const& argv) {
		auto conf = std::string();
		auto opts = std::vector<std::pair<std::string, std::string>>();
		auto args = std::vector<std::string>();

		for (auto i = std::size_t(1); i < argv.size(); ++i) {
			auto const& a = argv[i];
			if (a == "--version" || a == "-V") {
				is_version = true;
				return;
			}
			if (a == "--help" || a == "-h") {
				is_help = true;
				return;
			}
			if (a.size() < 2 || a.substr(0, 2) != "--") {
				args.push_back(a);
				continue;
			}
			auto eq = a.find('=');
			if (eq == std::string::npos)
				throw InvalidArgument("Option " + a + " needs a value");
			auto name = a.substr(2, eq - 2);
			auto value = a.substr(eq + 1);
			if (name == "conf")
				conf = value;
			else
				opts.emplace_back(std::move(name), std::move(value));
		}

		/* File first, so the command line wins.  */
		if (!conf.empty())
			config = config_load_file(conf);
		for (auto const& o : opts)
			if (!config_apply_option(config, o.first, o.second))
				throw InvalidArgument("Unknown option --" + o.first);
		config_check(config);

		if (args.empty())
			throw InvalidArgument("No command given");
		if (args.size() > 2)
			throw InvalidArgument("Too many arguments");
		command = args[0];
		params_text = (args.size() == 2) ? args[1] : std::string("{}");
	}

	Jsmn::Object params() {
		try {
			return Jsmn::Object::parse_json(params_text);
		} catch (Jsmn::ParseError const& e) {
			throw InvalidArgument(
				std::string("Parameters are not JSON: ")
				+ e.what()
			);
		}
	}

	void build() {
		bus = Util::make_unique<S::Bus>();
		waiter = Util::make_unique<Mod::Waiter>(*bus);
		logger = Util::make_unique<Mod::LogOutputter>(
			cerr, *bus, config.log_level
		);

		auto creds = Credentials{ config.cert
					, config.macaroon
					, config.socket
					};
		check_credentials(creds);
		rpc = Util::make_unique<Mod::Rpc>(
			*bus, open_node_socket(creds.socket), config.timeout
		);
		rpc_client = Util::make_unique<RpcNodeClient>(*rpc, creds);
		client = Util::make_unique<TimedNodeClient>(
			*rpc_client, *waiter, config.timeout
		);

		registry = Util::make_unique<ChannelRegistry>(*bus, *client);
		funds = Util::make_unique<ChainFundsManager>(*bus, *client);
		lifecycle = Util::make_unique<ChannelLifecycleManager>(
			*bus, *client, *funds, config.partner
		);
		dispatcher = Util::make_unique<PaymentDispatcher>(
			*bus, *client, *registry
		);
		issuer = Util::make_unique<InvoiceIssuer>(*bus, *client);
		status = Util::make_unique<StatusReporter>(*client, *registry);
		refresher = Util::make_unique<Mod::RegistryRefresher>(
			*bus, *registry, *waiter, config.refresh_interval
		);
	}

	Ev::Io<void> authenticate() {
		auto timeout = config.timeout;
		return waiter->timed(timeout, rpc_client->authenticate())
			.catching<Mod::Waiter::TimedOut>([timeout](Mod::Waiter::TimedOut const&) {
			throw BackendTimeout(Util::Str::fmt(
				"authenticate: no reply after %g seconds",
				timeout
			));
			return Ev::lift();
		});
	}

	Ev::Io<Json::Out> channels_json(std::vector<Channel> const& cs) {
		auto rv = Json::Out();
		auto obj = rv.start_object();
		auto arr = obj.start_array("channels");
		for (auto const& c : cs)
			arr.entry(channel_to_json(c));
		arr.end_array();
		obj.end_object();
		return Ev::lift(rv);
	}

	typedef std::function<Ev::Io<Json::Out>()> Action;

	/* Parses and checks the command and its
	 * parameters without touching the backend; the
	 * returned action runs once connected.  */
	Action prepare() {
		if (command == "status")
			return [this]() {
				return status->summary().then([](NodeSummary s) {
					return Ev::lift(node_summary_to_json(s));
				});
			};
		if (command == "channels") {
			auto filter = channel_filter_from_json(params());
			return [this, filter]() {
				return registry->refresh().then([this, filter](ChannelRegistry::Snapshot) {
					return channels_json(registry->query(filter));
				});
			};
		}
		if (command == "best-channel")
			return [this]() {
				return registry->refresh().then([this](ChannelRegistry::Snapshot) {
					auto rv = Json::Out();
					rv.start_object()
						.field("id", registry->best_outbound_channel())
					.end_object();
					return Ev::lift(rv);
				});
			};
		if (command == "open") {
			auto req = with_partner_defaults( channel_open_request_from_json(params())
							, config.partner
							);
			check_channel_open_request(req);
			return [this, req]() {
				return lifecycle->open(req).then([](ChannelTx tx) {
					return Ev::lift(channel_tx_to_json(tx));
				});
			};
		}
		if (command == "close") {
			auto req = channel_close_request_from_json(params());
			make_close_params(req);
			return [this, req]() {
				return lifecycle->close(req).then([](ChannelTx tx) {
					return Ev::lift(channel_tx_to_json(tx));
				});
			};
		}
		if (command == "pay") {
			auto req = pay_request_from_json(params());
			check_pay_request(req);
			return [this, req]() {
				return dispatcher->pay(req).then([](PaymentReceipt r) {
					return Ev::lift(payment_receipt_to_json(r));
				});
			};
		}
		if (command == "invoice") {
			auto args = create_invoice_args_from_json(params());
			check_create_invoice_args(args);
			return [this, args]() {
				return issuer->create(args).then([](Invoice inv) {
					return Ev::lift(invoice_to_json(inv));
				});
			};
		}
		if (command == "addresses")
			return [this]() {
				return funds->list_addresses().then([](std::vector<ChainAddress> as) {
					auto rv = Json::Out();
					auto obj = rv.start_object();
					auto arr = obj.start_array("addresses");
					for (auto const& a : as)
						arr.entry(chain_address_to_json(a));
					arr.end_array();
					obj.end_object();
					return Ev::lift(rv);
				});
			};
		if (command == "new-address") {
			auto f = FieldReader(params(), JsonSource::Caller, "new-address");
			f.only({"format", "is_unused"});
			auto name = f.opt_string("format");
			auto format = name ? address_format_from_string(*name)
					   : AddressFormat::P2wpkh
					   ;
			auto is_unused = f.opt_boolean("is_unused");
			return [this, format, is_unused]() {
				return funds->create_address(format, is_unused)
					.then([](ChainAddress a) {
					return Ev::lift(chain_address_to_json(a));
				});
			};
		}
		if (command == "balance")
			return [this]() {
				return funds->get_balance().then([](Ln::Amount a) {
					auto rv = Json::Out();
					rv.start_object()
						.field("chain_balance", a.to_sat())
					.end_object();
					return Ev::lift(rv);
				});
			};
		if (command == "watch") {
			auto f = FieldReader(params(), JsonSource::Caller, "watch");
			f.only({"iterations"});
			auto n = f.opt_count("iterations").value_or(1);
			if (n == 0)
				throw InvalidArgument("watch: iterations must be positive");
			return [this, n]() {
				return watch(std::size_t(n));
			};
		}
		throw InvalidArgument("Unknown command: " + command);
	}

	/* Prints a line per registry refresh until `n`
	 * refreshes have been seen.  */
	Ev::Io<Json::Out> watch(std::size_t n) {
		watch_left = n;
		bus->subscribe<Msg::ChannelsRefreshed>([this](Msg::ChannelsRefreshed const& m) {
			auto active = std::size_t(0);
			for (auto const& c : *m.channels)
				if (c.is_active)
					++active;
			auto line = Json::Out();
			line.start_object()
				.field("time", m.time)
				.field("channels", m.channels->size())
				.field("active_channels", active)
			.end_object();
			cout << line.output() << std::endl;

			if (watch_left > 0 && --watch_left == 0 && watch_done) {
				auto done = std::move(watch_done);
				watch_done = nullptr;
				done();
			}
			return Ev::lift();
		});

		auto wait_done = Ev::Io<void>([this]( std::function<void()> pass
						    , std::function<void(std::exception_ptr)>
						    ) {
			watch_done = std::move(pass);
		});
		return registry->refresh().then([this](ChannelRegistry::Snapshot) {
			if (watch_left == 0)
				return Ev::lift();
			return refresher->start();
		}).then([this, wait_done]() {
			if (watch_left == 0)
				return Ev::lift();
			return wait_done;
		}).then([]() {
			return Ev::lift(Json::Out::empty_object());
		});
	}

	/* Runs the command; any failure is printed and
	 * turned into the exit code.  */
	Ev::Io<int> execute() {
		auto prepared = std::make_shared<Action>();
		auto action = Ev::lift().then([this, prepared]() {
			/* Bad input fails here, before connecting.  */
			*prepared = prepare();
			build();
			return Helm::log( *bus, Debug
					, "Main: %s %s"
					, command.c_str()
					, params_text.c_str()
					);
		}).then([this]() {
			return authenticate();
		}).then([prepared]() {
			return (*prepared)();
		});
		return Ev::Io<int>([this, action]( std::function<void(int)> pass
						 , std::function<void(std::exception_ptr)>
						 ) {
			action.run([this, pass](Json::Out result) {
				cout << result.output() << std::endl;
				pass(0);
			}, [this, pass](std::exception_ptr e) {
				cerr << "lnhelm: " << describe_error(e) << std::endl;
				pass(1);
			});
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , std::function<Net::Fd(std::string const&)> open_node_socket_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , open_node_socket(std::move(open_node_socket_))
	      , usage_error(0)
	      , is_version(false)
	      , is_help(false)
	      , watch_left(0)
	      {
		try {
			parse_args(argv);
		} catch (Helm::Exception const& e) {
			cerr << "lnhelm: " << e.what() << std::endl;
			usage_error = 2;
		}
	}

	Ev::Io<int> run() {
		if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		}
		if (is_help || usage_error) {
			(usage_error ? cerr : cout) << usage_text;
			return Ev::lift(usage_error);
		}

		return execute().then([this](int code) {
			if (!bus)
				return Ev::lift(code);
			/* Stop timers and the backend connection.  */
			return bus->raise(Helm::Shutdown()).then([code]() {
				return Ev::lift(code);
			});
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  , std::function<Net::Fd(std::string const&)> open_node_socket
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cout
					   , cerr
					   , std::move(open_node_socket)
					   ))
	    { }
Main::Main(Main&&) =default;
Main::~Main() =default;

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
