#ifndef HELM_OPEN_NODE_SOCKET_HPP
#define HELM_OPEN_NODE_SOCKET_HPP

#include<string>

namespace Net { class Fd; }

namespace Helm {

/** Helm::open_node_socket
 *
 * @brief connects to the node backend.
 *
 * @desc `socket` is either `host:port` (TCP, with
 * `[addr]:port` for IPv6) or a filesystem path to a
 * unix-domain socket.
 * Anything containing a `/`, or lacking a `:`, is
 * taken as a path.
 * Throws Helm::BackendUnavailable if the
 * connection cannot be made.
 */
Net::Fd open_node_socket(std::string const& socket);

}

#endif /* !defined(HELM_OPEN_NODE_SOCKET_HPP) */
