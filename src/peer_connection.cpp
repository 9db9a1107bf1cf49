#include <peer_connection.hpp>
#include <errors.hpp>
#include <log.hpp>
#include <utils.hpp>
#include <utility>

#define READ_BUFFER_SIZE 32768

PeerTransport make_tcp_transport(std::shared_ptr<boost::asio::ip::tcp::socket> socket)
{
	PeerTransport transport;
	transport.async_read_some = [socket](boost::asio::mutable_buffer buf,
			PeerTransport::io_handler handler) {
		socket->async_read_some(buf, std::move(handler));
	};
	transport.async_write = [socket](boost::asio::const_buffer buf,
			PeerTransport::io_handler handler) {
		boost::asio::async_write(*socket, buf, std::move(handler));
	};
	transport.close = [socket]() {
		boost::system::error_code ec;
		socket->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
		socket->close(ec);
		if (ec) {
			log_debug("closing socket: " + ec.message());
		}
	};
	return transport;
}

PeerConnection::PeerConnection(boost::asio::io_context& io,
		PeerId id,
		const PeerInfo& peer,
		PeerTransport transport,
		const std::string& our_id,
		const std::string& hash,
		int num_pieces,
		const SessionSettings& settings,
		event_handler handler)
	: io(io),
	  peer_id(id),
	  peer_info(peer),
	  transport(std::move(transport)),
	  settings(settings),
	  on_event(std::move(handler)),
	  our_peer_id(our_id),
	  info_hash(hash),
	  num_pieces(num_pieces),
	  read_buf(READ_BUFFER_SIZE),
	  decoder(settings.max_message_length),
	  handshake_timer(io),
	  inactivity_timer(io),
	  keepalive_timer(io)
{
	status.pieces.resize(num_pieces, false);
	status.last_activity = clock::now();
	last_send = clock::now();
}

void PeerConnection::start(bool is_initiator)
{
	initiator = is_initiator;
	arm_handshake_timer();

	if (initiator) {
		queue_write(build_handshake(info_hash, our_peer_id));
		log_debug("sent handshake to peer " + peer_info.address());
	}
	do_read();
}

void PeerConnection::emit(PeerEvent ev)
{
	ev.peer = peer_id;
	/* delivered from the event loop, never from inside our own call stack */
	auto handler = on_event;
	boost::asio::post(io, [handler, ev]() {
		if (handler) {
			handler(ev);
		}
	});
}

void PeerConnection::do_read()
{
	auto self = shared_from_this();
	transport.async_read_some(boost::asio::buffer(read_buf),
			[this, self](const boost::system::error_code& ec, std::size_t n) {
				on_read(ec, n);
			});
}

void PeerConnection::on_read(const boost::system::error_code& ec, std::size_t n)
{
	if (conn_state == PeerState::disconnected) {
		return;
	}

	if (ec) {
		fail(ec == boost::asio::error::eof ? "connection closed by peer" : ec.message());
		return;
	}

	status.last_activity = clock::now();
	decoder.feed(read_buf.data(), n);

	try {
		process_input();
	} catch (const HandshakeError& e) {
		log_warning("handshake failed with " + peer_info.address() + ": " + e.what());
		fail(std::string("handshake failed: ") + e.what());
		return;
	} catch (const ProtocolError& e) {
		log_warning("protocol error from " + peer_info.address() + ": " + e.what());
		fail(std::string("protocol error: ") + e.what());
		return;
	}

	if (conn_state != PeerState::disconnected) {
		do_read();
	}
}

void PeerConnection::process_input()
{
	if (conn_state == PeerState::handshaking) {
		std::string raw;
		if (!decoder.next_handshake(raw)) {
			return;
		}

		Handshake hs = parse_handshake(raw, info_hash);
		remote_peer_id = hs.peer_id;

		if (!initiator) {
			queue_write(build_handshake(info_hash, our_peer_id));
		}

		conn_state = PeerState::established;
		handshake_timer.cancel();
		arm_inactivity_timer(settings.inactivity_timeout);
		arm_keepalive_timer(settings.keepalive_interval);

		log_info("handshake successful with peer " + peer_info.address());

		PeerEvent ev;
		ev.type = PeerEvent::handshake;
		ev.data = remote_peer_id;
		emit(std::move(ev));
	}

	Message msg;
	while (conn_state == PeerState::established && decoder.next(msg)) {
		if (msg.keep_alive) {
			log_debug("received keep-alive from " + peer_info.address());
			continue;
		}
		handle_message(msg);
	}
}

void PeerConnection::handle_message(const Message& msg)
{
	switch (msg.id) {
		case MSG_CHOKE:
			handle_choke();
			break;
		case MSG_UNCHOKE:
			handle_unchoke();
			break;
		case MSG_INTERESTED:
			handle_interested();
			break;
		case MSG_NOT_INTERESTED:
			handle_not_interested();
			break;
		case MSG_HAVE:
			handle_have(msg.payload);
			break;
		case MSG_BITFIELD:
			handle_bitfield(msg.payload);
			break;
		case MSG_REQUEST:
			handle_request(msg.payload);
			break;
		case MSG_PIECE:
			handle_piece(msg.payload);
			break;
		case MSG_CANCEL:
			handle_cancel(msg.payload);
			break;
		default:
			/* extension messages we never negotiated */
			log_debug("ignoring message id " + std::to_string((int)msg.id)
					+ " from " + peer_info.address());
			break;
	}
}

void PeerConnection::handle_choke()
{
	status.peer_choking = true;
	/* the peer drops whatever we asked for */
	outstanding_requests.clear();

	PeerEvent ev;
	ev.type = PeerEvent::choke;
	emit(std::move(ev));
}

void PeerConnection::handle_unchoke()
{
	status.peer_choking = false;

	PeerEvent ev;
	ev.type = PeerEvent::unchoke;
	emit(std::move(ev));
}

void PeerConnection::handle_interested()
{
	status.peer_interested = true;

	PeerEvent ev;
	ev.type = PeerEvent::interested;
	emit(std::move(ev));
}

void PeerConnection::handle_not_interested()
{
	status.peer_interested = false;

	PeerEvent ev;
	ev.type = PeerEvent::not_interested;
	emit(std::move(ev));
}

void PeerConnection::handle_have(const std::string& payload)
{
	uint32_t piece_index = read_u32(payload, 0);
	if (piece_index >= static_cast<uint32_t>(num_pieces)) {
		throw ProtocolError("have for piece " + std::to_string(piece_index) + " out of range");
	}

	status.pieces[piece_index] = true;

	PeerEvent ev;
	ev.type = PeerEvent::have;
	ev.piece = static_cast<int>(piece_index);
	emit(std::move(ev));
}

void PeerConnection::handle_bitfield(const std::string& payload)
{
	status.pieces = unpack_bitfield(payload, num_pieces);

	PeerEvent ev;
	ev.type = PeerEvent::bitfield;
	ev.bits = status.pieces;
	emit(std::move(ev));
}

void PeerConnection::handle_request(const std::string& payload)
{
	BlockInfo block = decode_block_info(payload);
	if (block.piece < 0 || block.piece >= num_pieces) {
		throw ProtocolError("request for piece " + std::to_string(block.piece) + " out of range");
	}

	if (status.am_choking) {
		return;
	}

	PeerEvent ev;
	ev.type = PeerEvent::request;
	ev.piece = block.piece;
	ev.offset = block.offset;
	ev.length = block.length;
	emit(std::move(ev));
}

void PeerConnection::handle_piece(const std::string& payload)
{
	uint32_t index = read_u32(payload, 0);
	uint32_t begin = read_u32(payload, 4);
	if (index >= static_cast<uint32_t>(num_pieces)) {
		throw ProtocolError("piece " + std::to_string(index) + " out of range");
	}

	PeerEvent ev;
	ev.type = PeerEvent::block;
	ev.piece = static_cast<int>(index);
	ev.offset = static_cast<int>(begin);
	ev.data = payload.substr(sizeof(uint32_t) * 2);
	ev.length = static_cast<int>(ev.data.size());

	outstanding_requests.erase(BlockInfo(ev.piece, ev.offset, ev.length));
	status.downloaded += ev.data.size();

	log_debug("received block " + std::to_string(index) + ":" + std::to_string(begin)
			+ " size " + std::to_string(ev.data.size()) + " from " + peer_info.address());
	emit(std::move(ev));
}

void PeerConnection::handle_cancel(const std::string& payload)
{
	BlockInfo block = decode_block_info(payload);

	PeerEvent ev;
	ev.type = PeerEvent::cancel;
	ev.piece = block.piece;
	ev.offset = block.offset;
	ev.length = block.length;
	emit(std::move(ev));
}

bool PeerConnection::is_ready() const
{
	return conn_state == PeerState::established
		&& !status.peer_choking
		&& status.am_interested;
}

bool PeerConnection::can_request() const
{
	return is_ready()
		&& outstanding_requests.size() < static_cast<size_t>(settings.max_requests_per_peer);
}

void PeerConnection::send_bitfield(const std::vector<bool>& bits)
{
	queue_write(encode_message(MSG_BITFIELD, pack_bitfield(bits)));
}

void PeerConnection::send_have(int index)
{
	if (conn_state != PeerState::established) {
		return;
	}
	queue_write(encode_have(index));
}

bool PeerConnection::send_request(const BlockInfo& block)
{
	if (!can_request()) {
		return false;
	}

	outstanding_requests.insert(block);
	queue_write(encode_request(block));
	return true;
}

void PeerConnection::send_cancel(const BlockInfo& block)
{
	if (outstanding_requests.erase(block) == 0 || conn_state != PeerState::established) {
		return;
	}
	queue_write(encode_cancel(block));
}

void PeerConnection::send_piece(int index, int begin, const std::string& data)
{
	if (conn_state != PeerState::established || status.am_choking) {
		return;
	}

	status.uploaded += data.size();
	queue_write(encode_piece(index, begin, data));
}

void PeerConnection::send_interested()
{
	if (status.am_interested) {
		return;
	}
	status.am_interested = true;
	queue_write(encode_message(MSG_INTERESTED, ""));
}

void PeerConnection::send_not_interested()
{
	if (!status.am_interested) {
		return;
	}
	status.am_interested = false;
	queue_write(encode_message(MSG_NOT_INTERESTED, ""));
}

void PeerConnection::send_choke()
{
	if (status.am_choking) {
		return;
	}
	status.am_choking = true;
	queue_write(encode_message(MSG_CHOKE, ""));
}

void PeerConnection::send_unchoke()
{
	if (!status.am_choking) {
		return;
	}
	status.am_choking = false;
	queue_write(encode_message(MSG_UNCHOKE, ""));
}

void PeerConnection::queue_write(std::string data)
{
	if (conn_state == PeerState::disconnected) {
		return;
	}

	write_queue.push_back(std::move(data));
	if (!writing) {
		do_write();
	}
}

void PeerConnection::do_write()
{
	writing = true;
	auto self = shared_from_this();
	transport.async_write(boost::asio::buffer(write_queue.front()),
			[this, self](const boost::system::error_code& ec, std::size_t) {
				on_write(ec);
			});
}

void PeerConnection::on_write(const boost::system::error_code& ec)
{
	writing = false;

	if (ec) {
		if (conn_state != PeerState::disconnected) {
			fail(ec.message());
		} else if (closing) {
			finish_close();
		}
		return;
	}

	last_send = clock::now();
	write_queue.pop_front();

	if (!write_queue.empty()) {
		do_write();
	} else if (closing) {
		finish_close();
	}
}

void PeerConnection::disconnect(const std::string& reason)
{
	if (conn_state == PeerState::disconnected) {
		return;
	}

	conn_state = PeerState::disconnected;
	close_reason = reason;
	handshake_timer.cancel();
	inactivity_timer.cancel();
	keepalive_timer.cancel();

	if (writing) {
		closing = true;
		arm_shutdown_timer();
		return;
	}
	finish_close();
}

void PeerConnection::fail(const std::string& reason)
{
	if (closed) {
		return;
	}

	conn_state = PeerState::disconnected;
	close_reason = reason;
	handshake_timer.cancel();
	inactivity_timer.cancel();
	keepalive_timer.cancel();
	if (writing) {
		/* the write in progress still points into the front buffer */
		write_queue.erase(write_queue.begin() + 1, write_queue.end());
	} else {
		write_queue.clear();
	}
	closing = false;
	finish_close();
}

void PeerConnection::finish_close()
{
	if (closed) {
		return;
	}
	closed = true;
	closing = false;
	handshake_timer.cancel();

	transport.close();
	outstanding_requests.clear();

	log_info("peer connection ended: " + peer_info.address() + " (" + close_reason + ")");

	PeerEvent ev;
	ev.type = PeerEvent::disconnected;
	ev.reason = close_reason;
	emit(std::move(ev));
}

void PeerConnection::arm_handshake_timer()
{
	auto self = shared_from_this();
	handshake_timer.expires_after(settings.handshake_timeout);
	handshake_timer.async_wait([this, self](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted
				|| conn_state != PeerState::handshaking) {
			return;
		}
		log_warning("handshake with " + peer_info.address() + " timed out");
		fail("handshake failed: timed out");
	});
}

/* A peer that stopped reading would hold a graceful close open forever */
void PeerConnection::arm_shutdown_timer()
{
	auto self = shared_from_this();
	handshake_timer.expires_after(settings.handshake_timeout);
	handshake_timer.async_wait([this, self](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted || closed) {
			return;
		}
		log_warning("pending writes to " + peer_info.address() + " never drained");
		fail("shutdown timed out");
	});
}

void PeerConnection::arm_inactivity_timer(clock::duration after)
{
	auto self = shared_from_this();
	inactivity_timer.expires_after(after);
	inactivity_timer.async_wait([this, self](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted
				|| conn_state != PeerState::established) {
			return;
		}

		clock::duration idle = clock::now() - status.last_activity;
		if (idle >= settings.inactivity_timeout) {
			log_warning("peer " + peer_info.address() + " inactive, disconnecting");
			fail("inactivity timeout");
			return;
		}
		arm_inactivity_timer(settings.inactivity_timeout - idle);
	});
}

void PeerConnection::arm_keepalive_timer(clock::duration after)
{
	auto self = shared_from_this();
	keepalive_timer.expires_after(after);
	keepalive_timer.async_wait([this, self](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted
				|| conn_state != PeerState::established) {
			return;
		}

		clock::duration quiet = clock::now() - last_send;
		if (quiet >= settings.keepalive_interval) {
			queue_write(encode_keep_alive());
			arm_keepalive_timer(settings.keepalive_interval);
			return;
		}
		arm_keepalive_timer(settings.keepalive_interval - quiet);
	});
}
