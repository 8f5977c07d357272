#ifndef HELM_MOD_RPC_HPP
#define HELM_MOD_RPC_HPP

#include"Jsmn/Object.hpp"
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Json { class Out; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Helm { namespace Mod {

/* The peer answered a request with a JSON-RPC error
 * object.  */
struct RpcError : public std::runtime_error {
private:
	static
	std::string make_error_message( std::string const&
				      , Jsmn::Object const&
				      );
public:
	RpcError() =delete;
	RpcError(std::string method, Jsmn::Object error);

	std::string method;
	Jsmn::Object error;

	/* The "message" of the error object if it has one,
	 * else the error object as JSON text.  */
	std::string message() const;
};

/** class Helm::Mod::Rpc
 *
 * @brief JSON-RPC 2.0 client over a connected stream
 * socket.
 *
 * @desc requests are multiplexed by id, so any number
 * of commands may be in flight at once.
 * If the socket fails or the peer closes it, every
 * pending command and every later command fails
 * with Helm::BackendUnavailable.
 * On Helm::Shutdown the socket watchers are stopped
 * and commands likewise fail.
 *
 * If `forget_after` is positive, a command still
 * unanswered after that many seconds fails with
 * Helm::BackendTimeout when the next command is sent.
 */
class Rpc {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Rpc( S::Bus& bus
	   , Net::Fd socket
	   , double forget_after = 0
	   );
	Rpc(Rpc&&);
	~Rpc();

	Ev::Io<Jsmn::Object> command( std::string const& method
				    , Json::Out params
				    );
	/* Like command, but the parameters are not logged.  */
	Ev::Io<Jsmn::Object> secret_command( std::string const& method
					   , Json::Out params
					   );
};

}}

#endif /* !defined(HELM_MOD_RPC_HPP) */
