#ifndef HELM_CHAINADDRESS_HPP
#define HELM_CHAINADDRESS_HPP

#include"Ln/Amount.hpp"
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Helm {

enum class AddressFormat {
	P2wpkh,
	Np2wpkh,
	P2tr
};

/* "p2wpkh", "np2wpkh" or "p2tr".  */
char const* to_string(AddressFormat);
/* Throws Helm::InvalidArgument on anything else.  */
AddressFormat address_format_from_string(std::string const&);

/** struct Helm::ChainAddress
 *
 * @brief an on-chain address of the node wallet.
 */
struct ChainAddress {
	std::string address;
	bool is_change;
	Ln::Amount tokens;
};

ChainAddress chain_address_from_json(Jsmn::Object const&);
Json::Out chain_address_to_json(ChainAddress const&);

}

#endif /* !defined(HELM_CHAINADDRESS_HPP) */
