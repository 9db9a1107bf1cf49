#ifndef PIECE_SCHEDULER_HPP
#define PIECE_SCHEDULER_HPP

#include <block_info.hpp>
#include <piece_store.hpp>
#include <rarity_tracker.hpp>
#include <settings.hpp>
#include <chrono>
#include <map>
#include <vector>

struct BlockRequest {
	PeerId peer;
	BlockInfo block;
};

/*
 * Decides which block to request from which peer.
 *
 * Pieces are taken rarest first (ties by index), blocks within a piece
 * lowest offset first. Outside endgame a block has at most one outstanding
 * request; in endgame a block may be requested from several peers and the
 * first copy to arrive wins.
 *
 * Peers are referred to by id only. The scheduler never talks to a
 * connection, the session turns the returned BlockRequests into messages.
 */
class PieceScheduler {
public:
	using clock = std::chrono::steady_clock;

	PieceScheduler(const PieceStore& store, const RarityTracker& rarity,
			SessionSettings settings);

	void add_peer(PeerId peer);

	/* Both return the blocks that went back to the pending pool */
	std::vector<BlockInfo> remove_peer(PeerId peer);
	std::vector<BlockInfo> release_requests(PeerId peer);

	/* ready = handshake done, peer unchoked us and we are interested */
	void set_peer_ready(PeerId peer, bool ready);

	/* Watchdog: requests older than request_timeout go back to the pool */
	std::vector<BlockRequest> sweep_timeouts(clock::time_point now);

	std::vector<BlockRequest> tick(clock::time_point now);

	/* Returns the other peers still holding a request for the block */
	std::vector<PeerId> on_block_received(PeerId from, const BlockInfo& block);

	/* The request could not be sent after all */
	void abort_request(PeerId peer, const BlockInfo& block);

	void on_piece_failed(int piece);

	bool is_complete() const;
	bool in_endgame() const { return endgame; }
	int remaining_blocks() const;
	int in_flight() const { return total_in_flight; }
	int in_flight(PeerId peer) const;
	int requesters(const BlockInfo& block) const;
	bool is_requested(const BlockInfo& block) const { return requesters(block) > 0; }
	bool is_unreliable(PeerId peer) const;
	int timeouts(PeerId peer) const;
	int num_peers() const { return static_cast<int>(peers.size()); }

private:
	struct PendingRequest {
		PeerId peer;
		clock::time_point since;
	};

	struct PeerSchedule {
		bool ready = false;
		int in_flight = 0;
		int timeouts = 0;
		bool unreliable = false;
	};

	struct BlockRetry {
		int count = 0;
		PeerId last_peer = 0;
	};

	const PieceStore& store;
	const RarityTracker& rarity;
	SessionSettings settings;

	std::map<BlockInfo, std::vector<PendingRequest>> pending;
	std::map<PeerId, PeerSchedule> peers;
	std::map<BlockInfo, BlockRetry> retries;
	int total_in_flight = 0;
	bool endgame = false;

	std::vector<PeerId> eligible_peers() const;
	bool other_peer_can_take(PeerId peer, int piece, const std::vector<PeerId>& eligible) const;
	int fill_peer(PeerId peer, clock::time_point now, const std::vector<PeerId>& eligible,
			int budget, bool duplicates, std::vector<BlockRequest>& out);
	void add_request(PeerId peer, const BlockInfo& block, clock::time_point now,
			std::vector<BlockRequest>& out);
	void drop_request(PeerId peer);
	std::vector<BlockInfo> drop_peer_requests(PeerId peer);
};

#endif /* piece_scheduler.hpp */
