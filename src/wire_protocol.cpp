#include <wire_protocol.hpp>
#include <errors.hpp>
#include <boost/endian/conversion.hpp>
#include <cstring>

static void append_u32(std::string& out, uint32_t value)
{
	uint32_t value_be = boost::endian::native_to_big(value); /* Big endian so fun... :( */
	out.append(reinterpret_cast<const char*>(&value_be), sizeof(value_be));
}

std::string build_handshake(const std::string& info_hash, const std::string& peer_id)
{
	std::string handshake;
	handshake.reserve(HANDSHAKE_SIZE); /* handshake is 68 bytes long */
	handshake.push_back(static_cast<char>(PROTOCOL_VERSION));
	handshake.append(BT_PROTOCOL);
	handshake.append(8, '\0'); /* reserved, no extensions */
	handshake.append(info_hash);
	handshake.append(peer_id);
	return handshake;
}

Handshake parse_handshake(const std::string& data, const std::string& expected_info_hash)
{
	if (data.size() != HANDSHAKE_SIZE) {
		throw HandshakeError("handshake must be 68 bytes");
	}

	if (static_cast<uint8_t>(data[0]) != PROTOCOL_VERSION) {
		throw HandshakeError("Invalid protocol version");
	}

	if (data.compare(1, 19, BT_PROTOCOL) != 0) {
		throw HandshakeError("Invalid protocol string");
	}

	Handshake hs;
	hs.info_hash = data.substr(28, 20);
	hs.peer_id = data.substr(48, 20);

	if (hs.info_hash != expected_info_hash) {
		throw HandshakeError("Info hash mismatch - different torrent");
	}
	return hs;
}

std::string encode_message(uint8_t msg_id, const std::string& payload)
{
	std::string message;
	message.reserve(sizeof(uint32_t) + 1 + payload.size());
	append_u32(message, static_cast<uint32_t>(payload.size() + 1));
	message.push_back(static_cast<char>(msg_id));
	message.append(payload);
	return message;
}

std::string encode_keep_alive()
{
	return std::string(sizeof(uint32_t), '\0');
}

std::string encode_have(int index)
{
	std::string payload;
	append_u32(payload, static_cast<uint32_t>(index));
	return encode_message(MSG_HAVE, payload);
}

static std::string block_payload(const BlockInfo& block)
{
	std::string payload;
	append_u32(payload, static_cast<uint32_t>(block.piece));
	append_u32(payload, static_cast<uint32_t>(block.offset));
	append_u32(payload, static_cast<uint32_t>(block.length));
	return payload;
}

std::string encode_request(const BlockInfo& block)
{
	return encode_message(MSG_REQUEST, block_payload(block));
}

std::string encode_cancel(const BlockInfo& block)
{
	return encode_message(MSG_CANCEL, block_payload(block));
}

std::string encode_piece(int index, int begin, const std::string& data)
{
	std::string payload;
	payload.reserve(8 + data.size());
	append_u32(payload, static_cast<uint32_t>(index));
	append_u32(payload, static_cast<uint32_t>(begin));
	payload.append(data);
	return encode_message(MSG_PIECE, payload);
}

uint32_t read_u32(const std::string& payload, size_t pos)
{
	uint32_t value_be;
	std::memcpy(&value_be, payload.data() + pos, sizeof(uint32_t));
	return boost::endian::big_to_native(value_be);
}

BlockInfo decode_block_info(const std::string& payload)
{
	return BlockInfo(static_cast<int>(read_u32(payload, 0)),
			static_cast<int>(read_u32(payload, 4)),
			static_cast<int>(read_u32(payload, 8)));
}

MessageDecoder::MessageDecoder(size_t max_length)
	: max_length(max_length)
{
}

void MessageDecoder::feed(const char *data, size_t size)
{
	buffer.append(data, size);
}

bool MessageDecoder::next_handshake(std::string& out)
{
	if (buffer.size() < HANDSHAKE_SIZE) {
		return false;
	}
	out = buffer.substr(0, HANDSHAKE_SIZE);
	buffer.erase(0, HANDSHAKE_SIZE);
	return true;
}

/* Expected payload size for fixed size messages, -1 when variable */
static long fixed_payload_size(uint8_t msg_id)
{
	switch (msg_id) {
		case MSG_CHOKE:
		case MSG_UNCHOKE:
		case MSG_INTERESTED:
		case MSG_NOT_INTERESTED:
			return 0;
		case MSG_HAVE:
			return 4;
		case MSG_REQUEST:
		case MSG_CANCEL:
			return 12;
		default:
			return -1;
	}
}

bool MessageDecoder::next(Message& out)
{
	if (buffer.size() < sizeof(uint32_t)) {
		return false;
	}

	uint32_t length = read_u32(buffer, 0);
	if (length > max_length) {
		throw ProtocolError("message length " + std::to_string(length) + " exceeds limit");
	}

	if (buffer.size() < sizeof(uint32_t) + length) {
		return false;
	}

	/* Handle keep-alive (length = 0) */
	if (length == 0) {
		buffer.erase(0, sizeof(uint32_t));
		out = Message();
		out.keep_alive = true;
		return true;
	}

	uint8_t msg_id = static_cast<uint8_t>(buffer[sizeof(uint32_t)]);
	size_t payload_size = length - 1;

	long expected = fixed_payload_size(msg_id);
	if (expected >= 0 && payload_size != static_cast<size_t>(expected)) {
		throw ProtocolError(std::string("invalid ") + message_name(msg_id) + " payload size "
				+ std::to_string(payload_size));
	}
	if (msg_id == MSG_PIECE && payload_size < 8) {
		throw ProtocolError("Invalid PIECE payload size");
	}

	out.keep_alive = false;
	out.id = msg_id;
	out.payload = buffer.substr(sizeof(uint32_t) + 1, payload_size);
	buffer.erase(0, sizeof(uint32_t) + length);
	return true;
}

const char *message_name(uint8_t msg_id)
{
	switch (msg_id) {
		case MSG_CHOKE: return "choke";
		case MSG_UNCHOKE: return "unchoke";
		case MSG_INTERESTED: return "interested";
		case MSG_NOT_INTERESTED: return "not interested";
		case MSG_HAVE: return "have";
		case MSG_BITFIELD: return "bitfield";
		case MSG_REQUEST: return "request";
		case MSG_PIECE: return "piece";
		case MSG_CANCEL: return "cancel";
		default: return "unknown";
	}
}
