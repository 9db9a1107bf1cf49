#include <peer_info.hpp>
#include <utility>

PeerInfo::PeerInfo(std::string id, std::string ip, uint16_t port)
	: peer_id(std::move(id)), ip(std::move(ip)), port(port)
{
}

std::string PeerInfo::address() const
{
	return ip + ":" + std::to_string(port);
}
