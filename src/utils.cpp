#include <utils.hpp>
#include <errors.hpp>
#include <boost/endian/conversion.hpp>
#include <openssl/sha.h>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <random>
#include <stdexcept>

#define COMPACT_PEER_SIZE 6
#define COMPACT_IP_SIZE 4

std::string sha1_hash(const std::string &data) {
    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return std::string(reinterpret_cast<char*>(hash), SHA_DIGEST_LENGTH);
}

std::string hash_to_hex(const std::string &hash) {
    std::stringstream ss;
    for (unsigned char c : hash) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    }
    return ss.str();
}

/*
 * Generate random peer_id (20 bytes)
 * Format: -TR0001-XXXXXXXXXXXX (Azureus style)
 */
std::string generate_peer_id() {
    std::string peer_id = "-TR0001-";  /* Client ID: TR version 0.0.1 */
    const char charset[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    while (peer_id.size() < PEER_ID_SIZE) {
        peer_id += charset[dist(rng)];
    }

    return peer_id;
}

std::string pack_bitfield(const std::vector<bool>& bits)
{
	std::string packed((bits.size() + 7) / 8, '\0');
	for (size_t i = 0; i < bits.size(); i++) {
		if (bits[i]) {
			packed[i / 8] = static_cast<char>(
				static_cast<unsigned char>(packed[i / 8]) | (0x80 >> (i % 8)));
		}
	}
	return packed;
}

std::vector<bool> unpack_bitfield(const std::string& packed, size_t num_pieces)
{
	if (packed.size() != (num_pieces + 7) / 8) {
		throw ProtocolError("bitfield has " + std::to_string(packed.size())
				+ " bytes, expected " + std::to_string((num_pieces + 7) / 8));
	}

	std::vector<bool> bits(num_pieces, false);
	for (size_t i = 0; i < packed.size() * 8; i++) {
		bool set = static_cast<unsigned char>(packed[i / 8]) & (0x80 >> (i % 8));
		if (i < num_pieces) {
			bits[i] = set;
		} else if (set) {
			throw ProtocolError("bitfield has spare bits set");
		}
	}
	return bits;
}

std::vector<PeerInfo> parse_compact_peers(const std::string& peers_bin)
{
	if (peers_bin.size() % COMPACT_PEER_SIZE != 0) {
		throw std::runtime_error("malformed compact peer list (length "
				+ std::to_string(peers_bin.size()) + " not divisible by 6)");
	}

	std::vector<PeerInfo> peers;
	peers.reserve(peers_bin.size() / COMPACT_PEER_SIZE);

	for (size_t off = 0; off < peers_bin.size(); off += COMPACT_PEER_SIZE) {
		const unsigned char *p = reinterpret_cast<const unsigned char*>(peers_bin.data() + off);

		std::ostringstream ip;
		ip << (int)p[0] << "." << (int)p[1] << "." << (int)p[2] << "." << (int)p[3];

		uint16_t port_be;
		std::memcpy(&port_be, p + COMPACT_IP_SIZE, sizeof(port_be));
		uint16_t port = boost::endian::big_to_native(port_be);

		peers.emplace_back("", ip.str(), port);
	}
	return peers;
}

PeerInfo parse_peer_address(const std::string& address)
{
	size_t colon = address.rfind(':');
	if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
		throw std::invalid_argument("peer address must be ip:port, got '" + address + "'");
	}

	std::string port_str = address.substr(colon + 1);
	for (char c : port_str) {
		if (!isdigit(static_cast<unsigned char>(c))) {
			throw std::invalid_argument("invalid port in '" + address + "'");
		}
	}

	unsigned long port = std::stoul(port_str);
	if (port == 0 || port > 65535) {
		throw std::invalid_argument("port out of range in '" + address + "'");
	}

	return PeerInfo("", address.substr(0, colon), static_cast<uint16_t>(port));
}

std::string format_bytes(int64_t bytes)
{
	const char *units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
	double value = static_cast<double>(bytes);
	int unit = 0;
	while (value >= 1024.0 && unit < 4) {
		value /= 1024.0;
		unit++;
	}

	std::ostringstream out;
	if (unit == 0) {
		out << bytes << " " << units[0];
	} else {
		out << std::fixed << std::setprecision(1) << value << " " << units[unit];
	}
	return out.str();
}
