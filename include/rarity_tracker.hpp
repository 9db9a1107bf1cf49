#ifndef RARITY_TRACKER_HPP
#define RARITY_TRACKER_HPP

#include <block_info.hpp>
#include <map>
#include <vector>

/*
 * count[piece] = number of connected peers announcing the piece. Each peer's
 * announced bitfield is kept so a disconnect can be undone exactly.
 */
class RarityTracker {
private:
	std::vector<int> counts;
	std::map<PeerId, std::vector<bool>> peer_pieces;

	/* rarest_first() is cached until the next update */
	mutable std::vector<int> order;
	mutable bool order_dirty = true;

public:
	explicit RarityTracker(int num_pieces);

	/* Full resync from a bitfield message */
	void peer_bitfield(PeerId peer, const std::vector<bool>& bits);
	void peer_have(PeerId peer, int piece);
	void peer_disconnected(PeerId peer);

	int availability(int piece) const;
	bool peer_has(PeerId peer, int piece) const;
	bool peer_known(PeerId peer) const;
	int peer_piece_count(PeerId peer) const;
	int num_peers() const { return static_cast<int>(peer_pieces.size()); }
	int num_pieces() const { return static_cast<int>(counts.size()); }

	/* Every piece index, ascending by availability, ties by index */
	const std::vector<int>& rarest_first() const;
};

#endif /* rarity_tracker.hpp */
