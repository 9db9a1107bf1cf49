#ifndef PEER_INFO_H
#define PEER_INFO_H

#include <string>
#include <cstdint>

class PeerInfo {
public:
	std::string peer_id;
	std::string ip;
	uint16_t port;

	PeerInfo(std::string id, std::string ip, uint16_t port);

	/* "ip:port", used to deduplicate discovery results */
	std::string address() const;
};

#endif /* peer_info.hpp */
