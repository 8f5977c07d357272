#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Helm/Exception.hpp"
#include"Helm/Mod/Rpc.hpp"
#include"Helm/Shutdown.hpp"
#include"Helm/log.hpp"
#include"Jsmn/Parser.hpp"
#include"Json/Out.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<cmath>
#include<cstdint>
#include<errno.h>
#include<ev.h>
#include<functional>
#include<map>
#include<sstream>
#include<string.h>
#include<unistd.h>
#include<vector>

namespace {

std::string limited_text(Jsmn::Object const& val) {
	auto txt = val.direct_text();
	if (txt.size() > 160)
		return txt.substr(0, 160) + "...";
	return txt;
}

/* Only ids we could have sent: whole numbers in
 * the range of our counter.  */
bool to_request_id(Jsmn::Object const& id, std::uint64_t& out) {
	if (!id.is_number())
		return false;
	auto d = double(id);
	if (!(d >= 0) || d >= 18446744073709551616.0)
		return false;
	if (std::floor(d) != d)
		return false;
	out = std::uint64_t(d);
	return true;
}

}

namespace Helm { namespace Mod {

std::string RpcError::make_error_message( std::string const& method
					, Jsmn::Object const& e
					) {
	auto os = std::ostringstream();
	os << method << ": " << e;
	return os.str();
}

RpcError::RpcError( std::string method_
		  , Jsmn::Object error_
		  ) : std::runtime_error(make_error_message(method_, error_))
		    , method(std::move(method_))
		    , error(std::move(error_))
		    { }

std::string RpcError::message() const {
	if ( error.is_object()
	  && error.has("message")
	  && error["message"].is_string()
	   )
		return std::string(error["message"]);
	return error.direct_text();
}

class Rpc::Impl {
private:
	S::Bus& bus;

	Net::Fd socket;
	Jsmn::Parser parser;

	/* Once set, every command fails with
	 * BackendUnavailable carrying this reason.  */
	std::string broken;

	std::uint64_t next_id;
	/* Zero keeps pending commands until answered.  */
	double forget_after;

	struct Pending {
		std::string method;
		double sent;
		std::function<void(Jsmn::Object)> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::map<std::uint64_t, Pending> pendings;

	std::string to_write;

	ev_io read_event;
	ev_io write_event;
	bool write_active;

	void stop_watchers() {
		ev_io_stop(EV_DEFAULT_ &read_event);
		if (write_active) {
			ev_io_stop(EV_DEFAULT_ &write_event);
			write_active = false;
		}
	}

	static
	void fail_unavailable( std::function<void(std::exception_ptr)> const& fail
			     , std::string const& reason
			     ) {
		try {
			throw Helm::BackendUnavailable(reason);
		} catch (...) {
			fail(std::current_exception());
		}
	}

	/* Fails commands that have waited longer than
	 * forget_after, so a reply that never comes does
	 * not keep its entry.  A late reply is then
	 * ignored as unmatched.  */
	void forget_stale() {
		if (forget_after <= 0)
			return;
		auto limit = Ev::now() - forget_after;
		auto stale = std::vector<Pending>();
		for (auto it = pendings.begin(); it != pendings.end(); ) {
			if (it->second.sent < limit) {
				stale.push_back(std::move(it->second));
				it = pendings.erase(it);
			} else
				++it;
		}
		for (auto const& p : stale) {
			try {
				throw Helm::BackendTimeout(Util::Str::fmt(
					"%s: no reply after %g seconds",
					p.method.c_str(), forget_after
				));
			} catch (...) {
				p.fail(std::current_exception());
			}
		}
	}

	/* Fails everything pending, and everything to come.  */
	void breakdown(std::string reason) {
		if (!broken.empty())
			return;
		broken = std::move(reason);
		stop_watchers();
		to_write.clear();

		auto pendings_copy = std::move(pendings);
		pendings.clear();
		for (auto const& ip : pendings_copy)
			fail_unavailable(ip.second.fail, broken);
	}

	void process_response(Jsmn::Object const& resp) {
		/* Ignore anything we cannot match to a request.  */
		if (!resp.is_object())
			return;
		auto id = std::uint64_t();
		if (!resp.has("id") || !to_request_id(resp["id"], id))
			return;

		auto it = pendings.find(id);
		if (it == pendings.end())
			return;

		auto p = std::move(it->second);
		pendings.erase(it);

		if (resp.has("error")) {
			try {
				throw RpcError(std::move(p.method), resp["error"]);
			} catch (...) {
				p.fail(std::current_exception());
			}
		} else {
			p.pass(resp["result"]);
		}
	}

	void on_read() {
		char buf[4096];
		for (;;) {
			auto res = ssize_t();
			do {
				res = read(socket.get(), buf, sizeof(buf));
			} while (res < 0 && errno == EINTR);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				break;
			if (res < 0)
				return breakdown(std::string("read: ") + strerror(errno));
			if (res == 0)
				return breakdown("connection closed by node backend");

			auto responses = std::vector<Jsmn::Object>();
			try {
				responses = parser.feed(std::string(buf, std::size_t(res)));
			} catch (std::exception const& e) {
				return breakdown(std::string("unparseable reply: ") + e.what());
			}
			for (auto const& r : responses) {
				process_response(r);
				if (!broken.empty())
					return;
			}
		}
	}
	static
	void on_read_static(EV_P_ ev_io* e, int) {
		auto self = reinterpret_cast<Impl*>(e->data);
		self->on_read();
	}

	void on_write() {
		while (!to_write.empty()) {
			auto res = ssize_t();
			do {
				res = write(socket.get(), to_write.data(), to_write.size());
			} while (res < 0 && errno == EINTR);
			if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN))
				break;
			if (res < 0)
				return breakdown(std::string("write: ") + strerror(errno));
			to_write.erase(0, std::size_t(res));
		}
		if (to_write.empty() && write_active) {
			ev_io_stop(EV_DEFAULT_ &write_event);
			write_active = false;
		} else if (!to_write.empty() && !write_active) {
			ev_io_start(EV_DEFAULT_ &write_event);
			write_active = true;
		}
	}
	static
	void on_write_static(EV_P_ ev_io* e, int) {
		auto self = reinterpret_cast<Impl*>(e->data);
		self->on_write();
	}

	Ev::Io<Jsmn::Object> core_command( std::string const& method
					 , Json::Out params
					 ) {
		return Ev::Io<Jsmn::Object>([ this
					    , method
					    , params
					    ]( std::function<void(Jsmn::Object)> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
			if (!broken.empty())
				return fail_unavailable(fail, broken);
			forget_stale();

			auto id = next_id++;
			to_write += Json::Out()
				.start_object()
					.field("jsonrpc", std::string("2.0"))
					.field("id", id)
					.field("method", method)
					.field("params", params)
				.end_object()
				.output();
			to_write += "\n";

			pendings[id] = Pending{ method
					      , Ev::now()
					      , std::move(pass)
					      , std::move(fail)
					      };
			on_write();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Net::Fd socket_
	    , double forget_after_
	    ) : bus(bus_)
	      , socket(std::move(socket_))
	      , next_id(0)
	      , forget_after(forget_after_)
	      , write_active(false)
	      {
		if (!socket.set_nonblocking())
			throw Helm::BackendUnavailable(
				std::string("fcntl: ") + strerror(errno)
			);

		ev_io_init(&read_event, &on_read_static, socket.get(), EV_READ);
		read_event.data = this;
		ev_io_start(EV_DEFAULT_ &read_event);

		ev_io_init(&write_event, &on_write_static, socket.get(), EV_WRITE);
		write_event.data = this;

		bus.subscribe<Helm::Shutdown>([this](Helm::Shutdown const&) {
			breakdown("shutting down");
			return Ev::lift();
		});
	}

	~Impl() {
		stop_watchers();
		auto pendings_copy = std::move(pendings);
		pendings.clear();
		for (auto const& ip : pendings_copy)
			fail_unavailable(ip.second.fail, "client destroyed");
	}

	Ev::Io<Jsmn::Object> command( std::string const& method
				    , Json::Out params
				    , bool secret
				    ) {
		auto params_text = secret ? std::string("(not shown)")
					  : params.output()
					  ;
		return Helm::log( bus, Debug
				, "Rpc out: %s %s"
				, method.c_str()
				, params_text.c_str()
				).then([this, method, params]() {
			return core_command(method, params);
		}).then([this, method](Jsmn::Object result) {
			return Helm::log( bus, Debug
					, "Rpc in: %s => %s"
					, method.c_str()
					, limited_text(result).c_str()
					).then([result]() {
				return Ev::lift(result);
			});
		}).catching<RpcError>([this](RpcError const& e) {
			auto err = std::make_shared<RpcError>(e);
			return Helm::log( bus, Debug
					, "Rpc in: %s => error %s"
					, err->method.c_str()
					, limited_text(err->error).c_str()
					).then([err]() -> Ev::Io<Jsmn::Object> {
				throw *err;
			});
		});
	}
};

Rpc::Rpc( S::Bus& bus
	, Net::Fd socket
	, double forget_after
	) : pimpl(Util::make_unique<Impl>( bus
					 , std::move(socket)
					 , forget_after
					 )) { }
Rpc::Rpc(Rpc&& o) : pimpl(std::move(o.pimpl)) { }
Rpc::~Rpc() { }

Ev::Io<Jsmn::Object> Rpc::command( std::string const& method
				 , Json::Out params
				 ) {
	assert(pimpl);
	return pimpl->command(method, std::move(params), false);
}
Ev::Io<Jsmn::Object> Rpc::secret_command( std::string const& method
					, Json::Out params
					) {
	assert(pimpl);
	return pimpl->command(method, std::move(params), true);
}

}}
