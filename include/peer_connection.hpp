#ifndef PEER_CONNECTION_HPP
#define PEER_CONNECTION_HPP

#include <boost/asio.hpp>
#include <block_info.hpp>
#include <peer_info.hpp>
#include <settings.hpp>
#include <wire_protocol.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

enum class PeerState {
	handshaking,
	established,
	disconnected
};

/*
 * What a connection needs from its byte stream. A plain TCP socket is one
 * way to provide it; anything that can read, write and close will do.
 */
struct PeerTransport {
	using io_handler = std::function<void(const boost::system::error_code&, std::size_t)>;

	std::function<void(boost::asio::mutable_buffer, io_handler)> async_read_some;
	std::function<void(boost::asio::const_buffer, io_handler)> async_write;
	std::function<void()> close;
};

PeerTransport make_tcp_transport(std::shared_ptr<boost::asio::ip::tcp::socket> socket);

/* Everything the session learns from a peer arrives as one of these */
struct PeerEvent {
	enum Type {
		handshake,
		bitfield,
		have,
		choke,
		unchoke,
		interested,
		not_interested,
		block,
		request,
		cancel,
		disconnected
	};

	Type type;
	PeerId peer = 0;
	int piece = -1;
	int offset = 0;
	int length = 0;
	std::string data;
	std::vector<bool> bits;
	std::string reason;
};

/* Protocol state of one remote peer */
struct PeerHandle {
	std::vector<bool> pieces;
	bool am_choking = true;
	bool am_interested = false;
	bool peer_choking = true;
	bool peer_interested = false;
	std::chrono::steady_clock::time_point last_activity;
	uint64_t downloaded = 0;
	uint64_t uploaded = 0;
};

class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
	using event_handler = std::function<void(const PeerEvent&)>;
	using clock = std::chrono::steady_clock;

	PeerConnection(boost::asio::io_context& io,
			PeerId id,
			const PeerInfo& peer,
			PeerTransport transport,
			const std::string& our_id,
			const std::string& hash,
			int num_pieces,
			const SessionSettings& settings,
			event_handler handler);

	/* The initiator sends its handshake first, the other side answers */
	void start(bool initiator);

	/* Flushes queued writes before the transport is closed */
	void disconnect(const std::string& reason);

	void send_bitfield(const std::vector<bool>& bits);
	void send_have(int index);
	bool send_request(const BlockInfo& block);
	void send_cancel(const BlockInfo& block);
	void send_piece(int index, int begin, const std::string& data);
	void send_interested();
	void send_not_interested();
	void send_choke();
	void send_unchoke();

	/* established, unchoked by the peer and interested in it */
	bool is_ready() const;
	bool can_request() const;

	PeerId id() const { return peer_id; }
	const PeerInfo& info() const { return peer_info; }
	PeerState state() const { return conn_state; }
	const PeerHandle& handle() const { return status; }
	const std::string& remote_id() const { return remote_peer_id; }
	const std::set<BlockInfo>& outstanding() const { return outstanding_requests; }

private:
	boost::asio::io_context& io;
	PeerId peer_id;
	PeerInfo peer_info;
	PeerTransport transport;
	SessionSettings settings;
	event_handler on_event;

	/* Torrent Protocol info */
	std::string our_peer_id;
	std::string info_hash;
	std::string remote_peer_id;
	int num_pieces;

	PeerState conn_state = PeerState::handshaking;
	PeerHandle status;
	std::set<BlockInfo> outstanding_requests;
	bool initiator = false;

	/* I/O */
	std::vector<char> read_buf;
	MessageDecoder decoder;
	std::deque<std::string> write_queue;
	bool writing = false;
	bool closing = false;
	bool closed = false;
	std::string close_reason;
	clock::time_point last_send;

	boost::asio::steady_timer handshake_timer;
	boost::asio::steady_timer inactivity_timer;
	boost::asio::steady_timer keepalive_timer;

	void do_read();
	void on_read(const boost::system::error_code& ec, std::size_t n);
	void process_input();
	void queue_write(std::string data);
	void do_write();
	void on_write(const boost::system::error_code& ec);
	void fail(const std::string& reason);
	void finish_close();
	void emit(PeerEvent ev);

	void arm_handshake_timer();
	void arm_shutdown_timer();
	void arm_inactivity_timer(clock::duration after);
	void arm_keepalive_timer(clock::duration after);

	void handle_message(const Message& msg);
	void handle_choke();
	void handle_unchoke();
	void handle_interested();
	void handle_not_interested();
	void handle_have(const std::string& payload);
	void handle_bitfield(const std::string& payload);
	void handle_request(const std::string& payload);
	void handle_piece(const std::string& payload);
	void handle_cancel(const std::string& payload);
};

#endif
