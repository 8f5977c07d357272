#ifndef HELM_MSG_CHANNELSREFRESHED_HPP
#define HELM_MSG_CHANNELSREFRESHED_HPP

#include"Helm/Channel.hpp"
#include<memory>
#include<vector>

namespace Helm { namespace Msg {

/** struct Helm::Msg::ChannelsRefreshed
 *
 * @brief raised each time the channel registry has
 * replaced its snapshot.
 */
struct ChannelsRefreshed {
	std::shared_ptr<std::vector<Helm::Channel> const> channels;
	/* Seconds since epoch.  */
	double time;
};

}}

#endif /* !defined(HELM_MSG_CHANNELSREFRESHED_HPP) */
