#ifndef SESSION_HPP
#define SESSION_HPP

#include <boost/asio.hpp>
#include <peer_connection.hpp>
#include <peer_info.hpp>
#include <piece_scheduler.hpp>
#include <piece_store.hpp>
#include <rarity_tracker.hpp>
#include <settings.hpp>
#include <storage.hpp>
#include <torrent_metadata.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

struct ProgressSnapshot {
	int verified_pieces = 0;
	int total_pieces = 0;
	double completion = 0.0;   /* percent */
	int64_t bytes_left = 0;
	uint64_t downloaded = 0;
	uint64_t uploaded = 0;
	double download_rate = 0.0; /* bytes per second over the last tick */
	double upload_rate = 0.0;
	size_t peers = 0;
	int in_flight = 0;
	bool endgame = false;
};

/* Hooks for whoever presents the download; all are optional */
struct SessionEvents {
	std::function<void(int)> on_piece_verified;
	std::function<void(const ProgressSnapshot&)> on_progress;
	std::function<void()> on_complete;
	std::function<void(const std::string&)> on_failure;
};

/*
 * Owns the peers, the piece store, the rarity counts and the scheduler, and
 * drives the scheduler from a timer on the io_context. Peers talk to the
 * session only through posted PeerEvents; everything here runs on the
 * thread that runs the io_context.
 */
class Session {
public:
	using clock = std::chrono::steady_clock;

	Session(boost::asio::io_context& io,
			const TorrentMetadata& meta,
			StorageSink& sink,
			SessionSettings settings = SessionSettings(),
			SessionEvents events = SessionEvents());
	~Session();

	Session(const Session&) = delete;
	Session& operator=(const Session&) = delete;

	/* Verify data already in the sink; returns the number of good pieces */
	int resume();

	void start();
	void stop();

	/* Accept incoming peers; port 0 picks a free one. Returns the bound port */
	uint16_t listen(uint16_t port);

	/* Discovery feed, duplicates of known addresses are dropped */
	void add_peer_candidates(const std::vector<PeerInfo>& candidates);

	/* Hand over an already open byte stream to a peer */
	PeerId attach_peer(PeerTransport transport, const PeerInfo& peer, bool initiator);

	/* One scheduler round; normally run by the tick timer */
	void tick();

	ProgressSnapshot progress() const;
	bool is_complete() const;
	bool has_failed() const { return failed; }
	const std::string& failure_reason() const { return failure; }

	size_t num_peers() const { return peers.size(); }
	std::shared_ptr<PeerConnection> peer(PeerId id) const;
	const std::string& peer_id() const { return our_peer_id; }

	const PieceStore& store() const { return piece_store; }
	const PieceScheduler& scheduler() const { return piece_scheduler; }
	const RarityTracker& rarity() const { return rarity_tracker; }

private:
	boost::asio::io_context& io;
	TorrentMetadata meta;
	SessionSettings settings;
	SessionEvents events;
	std::string our_peer_id;

	PieceStore piece_store;
	RarityTracker rarity_tracker;
	PieceScheduler piece_scheduler;

	std::map<PeerId, std::shared_ptr<PeerConnection>> peers;
	PeerId next_peer_id = 1;

	std::deque<PeerInfo> candidates;
	std::set<std::string> known_addresses;
	size_t connecting = 0;
	bool attempted_peers = false;

	boost::asio::steady_timer tick_timer;
	boost::asio::ip::tcp::acceptor acceptor;

	bool running = false;
	bool stopped = false;
	bool failed = false;
	bool completed = false;
	std::string failure;

	uint64_t total_downloaded = 0;
	uint64_t total_uploaded = 0;
	uint64_t last_downloaded = 0;
	uint64_t last_uploaded = 0;
	double download_rate = 0.0;
	double upload_rate = 0.0;
	clock::time_point last_tick;

	/* posted handlers check this before touching the session */
	std::shared_ptr<bool> alive;

	PeerConnection::event_handler make_event_handler();
	void handle_event(const PeerEvent& ev);
	void on_handshake(const std::shared_ptr<PeerConnection>& conn);
	void on_block(const PeerEvent& ev);
	void on_request(const std::shared_ptr<PeerConnection>& conn, const PeerEvent& ev);
	void on_disconnected(const PeerEvent& ev);
	void on_piece_verified(int piece);

	void update_interest(const std::shared_ptr<PeerConnection>& conn);
	void check_complete();
	void check_exhausted();
	void update_rates(clock::time_point now);

	void connect_candidates();
	void connect_to(const PeerInfo& peer);
	void do_accept();
	void schedule_tick();
	void fail(const std::string& reason);
};

#endif /* session.hpp */
