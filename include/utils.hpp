#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <peer_info.hpp>

/* SHA1 digests are 20 raw bytes */
#define SHA1_DIGEST_SIZE 20
#define PEER_ID_SIZE 20

std::string sha1_hash(const std::string& data);
std::string hash_to_hex(const std::string& hash);
std::string generate_peer_id();

/* Wire bitfield: the high bit of the first byte is piece 0 */
std::string pack_bitfield(const std::vector<bool>& bits);
std::vector<bool> unpack_bitfield(const std::string& packed, size_t num_pieces);

/* Compact tracker peer list, 4 bytes IPv4 followed by a big endian port */
std::vector<PeerInfo> parse_compact_peers(const std::string& peers_bin);
PeerInfo parse_peer_address(const std::string& address);

std::string format_bytes(int64_t bytes);

#endif /* utils.hpp */
