#include"Helm/ChainAddress.hpp"
#include"Helm/Exception.hpp"
#include"Helm/FieldReader.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"

namespace Helm {

char const* to_string(AddressFormat f) {
	switch (f) {
	case AddressFormat::P2wpkh: return "p2wpkh";
	case AddressFormat::Np2wpkh: return "np2wpkh";
	case AddressFormat::P2tr: return "p2tr";
	}
	return "p2wpkh";
}

AddressFormat address_format_from_string(std::string const& s) {
	for (auto f : { AddressFormat::P2wpkh
		      , AddressFormat::Np2wpkh
		      , AddressFormat::P2tr
		      })
		if (s == to_string(f))
			return f;
	throw InvalidArgument( "Unknown address format \"" + s + "\", "
			       "expected p2wpkh, np2wpkh or p2tr"
			     );
}

ChainAddress chain_address_from_json(Jsmn::Object const& js) {
	auto f = FieldReader(js, JsonSource::Backend, "chain address");
	auto rv = ChainAddress();
	rv.address = f.string("address");
	rv.is_change = f.boolean("is_change", false);
	rv.tokens = f.opt_sat("tokens").value_or(Ln::Amount());
	return rv;
}

Json::Out chain_address_to_json(ChainAddress const& a) {
	auto rv = Json::Out();
	rv.start_object()
		.field("address", a.address)
		.field("is_change", a.is_change)
		.field("tokens", a.tokens.to_sat())
	.end_object();
	return rv;
}

}
