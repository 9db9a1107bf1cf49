#ifndef WIRE_PROTOCOL_HPP
#define WIRE_PROTOCOL_HPP

#include <block_info.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

#define HANDSHAKE_SIZE 68
#define PROTOCOL_VERSION 19
#define BT_PROTOCOL "BitTorrent protocol"

enum MessageId : uint8_t {
	MSG_CHOKE = 0,
	MSG_UNCHOKE = 1,
	MSG_INTERESTED = 2,
	MSG_NOT_INTERESTED = 3,
	MSG_HAVE = 4,
	MSG_BITFIELD = 5,
	MSG_REQUEST = 6,
	MSG_PIECE = 7,
	MSG_CANCEL = 8
};

struct Message {
	bool keep_alive = false;
	uint8_t id = 0;
	std::string payload;
};

struct Handshake {
	std::string info_hash;
	std::string peer_id;
};

std::string build_handshake(const std::string& info_hash, const std::string& peer_id);

/* throws HandshakeError on a foreign protocol or a different torrent */
Handshake parse_handshake(const std::string& data, const std::string& expected_info_hash);

std::string encode_message(uint8_t msg_id, const std::string& payload);
std::string encode_keep_alive();
std::string encode_have(int index);
std::string encode_request(const BlockInfo& block);
std::string encode_cancel(const BlockInfo& block);
std::string encode_piece(int index, int begin, const std::string& data);

/* payload parsers, the decoder already checked the sizes */
uint32_t read_u32(const std::string& payload, size_t pos);
BlockInfo decode_block_info(const std::string& payload);

/*
 * Incremental framer. Bytes are appended as the socket delivers them and
 * complete messages are taken out one at a time; partial frames stay
 * buffered until the rest arrives.
 */
class MessageDecoder {
private:
	std::string buffer;
	size_t max_length;

public:
	explicit MessageDecoder(size_t max_length);

	void feed(const char *data, size_t size);

	/* Take the 68 handshake bytes once they are all here */
	bool next_handshake(std::string& out);

	/* throws ProtocolError on malformed framing */
	bool next(Message& out);

	size_t buffered() const { return buffer.size(); }
};

const char *message_name(uint8_t msg_id);

#endif /* wire_protocol.hpp */
