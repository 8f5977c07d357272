#include"Ev/Io.hpp"
#include"Helm/ChainFundsManager.hpp"
#include"Helm/NodeClientIF.hpp"
#include"Helm/log.hpp"

namespace Helm {

ChainFundsManager::ChainFundsManager( S::Bus& bus_
				    , NodeClientIF& client_
				    ) : bus(bus_), client(client_) { }

Ev::Io<std::vector<ChainAddress>> ChainFundsManager::list_addresses() {
	return client.get_chain_addresses();
}

Ev::Io<ChainAddress>
ChainFundsManager::create_address( std::optional<std::string> format
				 , std::optional<bool> is_unused
				 ) {
	return Ev::lift().then([this, format, is_unused]() {
		auto f = format ? address_format_from_string(*format)
				: AddressFormat::P2wpkh
				;
		return create_address(f, is_unused);
	});
}

Ev::Io<ChainAddress>
ChainFundsManager::create_address( AddressFormat format
				 , std::optional<bool> is_unused
				 ) {
	return client.create_chain_address(format, is_unused)
		.then([this, format](ChainAddress addr) {
		return Helm::log( bus, Info
				, "ChainFundsManager: new %s address %s"
				, to_string(format)
				, addr.address.c_str()
				).then([addr]() {
			return Ev::lift(addr);
		});
	});
}

Ev::Io<Ln::Amount> ChainFundsManager::get_balance() {
	return client.get_chain_balance();
}

Ev::Io<std::optional<std::string>>
ChainFundsManager::first_non_change_address() {
	return list_addresses().then([](std::vector<ChainAddress> addrs) {
		for (auto const& a : addrs)
			if (!a.is_change)
				return Ev::lift(std::optional<std::string>(a.address));
		return Ev::lift(std::optional<std::string>());
	});
}

}
