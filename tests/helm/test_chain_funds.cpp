#undef NDEBUG
#include"FakeNodeClient.hpp"
#include"Ev/start.hpp"
#include"Helm/ChainFundsManager.hpp"
#include"Helm/Exception.hpp"
#include"S/Bus.hpp"
#include<assert.h>

int main() {
	S::Bus bus;
	FakeNodeClient client;
	Helm::ChainFundsManager funds(bus, client);

	assert(Helm::address_format_from_string("np2wpkh") == Helm::AddressFormat::Np2wpkh);
	assert(std::string(Helm::to_string(Helm::AddressFormat::P2tr)) == "p2tr");

	auto code = Ev::lift().then([&]() {
		/* Default format.  */
		return funds.create_address(std::nullopt, std::nullopt);
	}).then([&](Helm::ChainAddress a) {
		assert(a.address == "bc1qnew");
		assert(*client.last_format == Helm::AddressFormat::P2wpkh);
		assert(!client.last_is_unused);

		client.new_address.address = "bc1ptaproot";
		return funds.create_address(std::string("p2tr"), true);
	}).then([&](Helm::ChainAddress a) {
		assert(a.address == "bc1ptaproot");
		assert(*client.last_format == Helm::AddressFormat::P2tr);
		assert(*client.last_is_unused);

		auto before = client.count("createChainAddress");
		return funds.create_address(std::string("p2pkh"), std::nullopt).then([](Helm::ChainAddress) {
			assert(false);
			return Ev::lift(false);
		}).catching<Helm::InvalidArgument>([&, before](Helm::InvalidArgument const& e) {
			assert(std::string(e.what()).find("p2wpkh") != std::string::npos);
			assert(client.count("createChainAddress") == before);
			return Ev::lift(true);
		});
	}).then([&](bool rejected) {
		assert(rejected);

		/* Only non-change addresses qualify.  */
		auto change = Helm::ChainAddress();
		change.address = "bc1qchange";
		change.is_change = true;
		client.addresses = {change};
		return funds.first_non_change_address();
	}).then([&](std::optional<std::string> a) {
		assert(!a);
		auto spend = Helm::ChainAddress();
		spend.address = "bc1qspend";
		spend.is_change = false;
		client.addresses.push_back(spend);
		return funds.first_non_change_address();
	}).then([&](std::optional<std::string> a) {
		assert(a && *a == "bc1qspend");
		return funds.list_addresses();
	}).then([&](std::vector<Helm::ChainAddress> as) {
		assert(as.size() == 2);

		client.balance = Ln::Amount::sat(123456);
		return funds.get_balance();
	}).then([&](Ln::Amount b) {
		assert(b == Ln::Amount::sat(123456));

		client.failures["getChainBalance"] = std::make_exception_ptr(
			Helm::BackendError("wallet not ready")
		);
		return funds.get_balance().then([](Ln::Amount) {
			assert(false);
			return Ev::lift(std::string());
		}).catching<Helm::BackendError>([](Helm::BackendError const& e) {
			return Ev::lift(e.detail());
		});
	}).then([&](std::string detail) {
		assert(detail == "wallet not ready");
		return Ev::lift(0);
	});

	return Ev::start(code);
}
