#ifndef HELM_CHANNELTX_HPP
#define HELM_CHANNELTX_HPP

#include<cstdint>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Helm {

/* Transaction produced by a channel open or close.  */
struct ChannelTx {
	std::string transaction_id;
	std::uint32_t transaction_vout;
};

ChannelTx channel_tx_from_json(Jsmn::Object const&);
Json::Out channel_tx_to_json(ChannelTx const&);

}

#endif /* !defined(HELM_CHANNELTX_HPP) */
