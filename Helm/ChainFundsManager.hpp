#ifndef HELM_CHAINFUNDSMANAGER_HPP
#define HELM_CHAINFUNDSMANAGER_HPP

#include"Helm/ChainAddress.hpp"
#include"Ln/Amount.hpp"
#include<optional>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Helm { class NodeClientIF; }
namespace S { class Bus; }

namespace Helm {

/** class Helm::ChainFundsManager
 *
 * @brief on-chain addresses and balance of the node
 * wallet.
 */
class ChainFundsManager {
private:
	S::Bus& bus;
	NodeClientIF& client;

public:
	ChainFundsManager(S::Bus& bus, NodeClientIF& client);

	Ev::Io<std::vector<ChainAddress>> list_addresses();

	/* `format` defaults to p2wpkh; an unknown format
	 * fails with Helm::InvalidArgument without
	 * contacting the backend.  */
	Ev::Io<ChainAddress> create_address( std::optional<std::string> format
					   , std::optional<bool> is_unused
					   );
	Ev::Io<ChainAddress> create_address( AddressFormat format
					   , std::optional<bool> is_unused
					   );

	/* Confirmed balance.  */
	Ev::Io<Ln::Amount> get_balance();

	/* The first listed address that is not a change
	 * address, if any.  */
	Ev::Io<std::optional<std::string>> first_non_change_address();
};

}

#endif /* !defined(HELM_CHAINFUNDSMANAGER_HPP) */
