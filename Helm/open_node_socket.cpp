#include"Helm/Exception.hpp"
#include"Helm/open_node_socket.hpp"
#include"Net/Fd.hpp"
#include<errno.h>
#include<netdb.h>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>
#include<sys/un.h>
#include<unistd.h>

namespace {

int connect_retrying(int fd, sockaddr const* addr, socklen_t len) {
	auto res = int();
	do {
		res = connect(fd, addr, len);
	} while (res < 0 && errno == EINTR);
	return res;
}

Net::Fd open_unix(std::string const& path) {
	auto addr = sockaddr_un();
	if (path.length() + 1 > sizeof(addr.sun_path))
		throw Helm::BackendUnavailable(path + ": socket path too long");
	strcpy(addr.sun_path, path.c_str());
	addr.sun_family = AF_UNIX;

	auto fd = Net::Fd(socket(AF_UNIX, SOCK_STREAM, 0));
	if (!fd)
		throw Helm::BackendUnavailable(std::string("socket: ") + strerror(errno));

	auto res = connect_retrying( fd.get()
				   , reinterpret_cast<sockaddr const*>(&addr)
				   , sizeof(addr)
				   );
	if (res < 0)
		throw Helm::BackendUnavailable(path + ": " + strerror(errno));
	return fd;
}

/* Frees the getaddrinfo result on scope exit.  */
class AddrInfo {
private:
	addrinfo* p;
public:
	AddrInfo() : p(nullptr) { }
	AddrInfo(AddrInfo const&) =delete;
	~AddrInfo() {
		if (p)
			freeaddrinfo(p);
	}
	addrinfo*& get() { return p; }
};

Net::Fd open_tcp(std::string const& host, std::string const& port) {
	auto hint = addrinfo();
	memset(&hint, 0, sizeof(hint));
	hint.ai_family = AF_UNSPEC;
	hint.ai_socktype = SOCK_STREAM;
	hint.ai_flags = AI_ADDRCONFIG;

	auto addrs = AddrInfo();
	auto res = getaddrinfo(host.c_str(), port.c_str(), &hint, &addrs.get());
	if (res != 0)
		throw Helm::BackendUnavailable( host + ":" + port + ": "
					      + gai_strerror(res)
					      );

	auto last_err = std::string("no addresses");
	for (auto p = addrs.get(); p; p = p->ai_next) {
		auto fd = Net::Fd(socket(p->ai_family, p->ai_socktype, p->ai_protocol));
		if (!fd) {
			last_err = strerror(errno);
			continue;
		}
		if (connect_retrying(fd.get(), p->ai_addr, p->ai_addrlen) == 0)
			return fd;
		last_err = strerror(errno);
	}
	throw Helm::BackendUnavailable(host + ":" + port + ": " + last_err);
}

}

namespace Helm {

Net::Fd open_node_socket(std::string const& socket) {
	if (socket.empty())
		throw InvalidArgument("Node socket is empty");

	auto colon = socket.rfind(':');
	if (socket.find('/') != std::string::npos || colon == std::string::npos)
		return open_unix(socket);

	auto host = socket.substr(0, colon);
	auto port = socket.substr(colon + 1);
	if ( host.size() >= 2
	  && host.front() == '[' && host.back() == ']'
	   )
		host = host.substr(1, host.size() - 2);
	if (host.empty() || port.empty())
		throw InvalidArgument("Node socket must be host:port or a path: " + socket);
	return open_tcp(host, port);
}

}
