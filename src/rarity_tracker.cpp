#include <rarity_tracker.hpp>
#include <algorithm>
#include <numeric>

RarityTracker::RarityTracker(int num_pieces)
	: counts(num_pieces, 0)
{
}

void RarityTracker::peer_bitfield(PeerId peer, const std::vector<bool>& bits)
{
	std::vector<bool>& owned = peer_pieces[peer];
	if (owned.empty()) {
		owned.assign(counts.size(), false);
	}

	for (size_t i = 0; i < counts.size(); i++) {
		bool has = i < bits.size() && bits[i];
		if (has && !owned[i]) {
			counts[i]++;
		} else if (!has && owned[i]) {
			counts[i]--;
		}
		owned[i] = has;
	}
	order_dirty = true;
}

void RarityTracker::peer_have(PeerId peer, int piece)
{
	if (piece < 0 || piece >= num_pieces()) {
		return;
	}

	std::vector<bool>& owned = peer_pieces[peer];
	if (owned.empty()) {
		owned.assign(counts.size(), false);
	}

	if (!owned[piece]) {
		owned[piece] = true;
		counts[piece]++;
		order_dirty = true;
	}
}

void RarityTracker::peer_disconnected(PeerId peer)
{
	auto it = peer_pieces.find(peer);
	if (it == peer_pieces.end()) {
		return;
	}

	for (size_t i = 0; i < it->second.size(); i++) {
		if (it->second[i]) {
			counts[i]--;
		}
	}
	peer_pieces.erase(it);
	order_dirty = true;
}

int RarityTracker::availability(int piece) const
{
	if (piece < 0 || piece >= num_pieces()) {
		return 0;
	}
	return counts[piece];
}

bool RarityTracker::peer_has(PeerId peer, int piece) const
{
	auto it = peer_pieces.find(peer);
	if (it == peer_pieces.end() || piece < 0 || piece >= num_pieces()) {
		return false;
	}
	return it->second[piece];
}

bool RarityTracker::peer_known(PeerId peer) const
{
	return peer_pieces.count(peer) != 0;
}

int RarityTracker::peer_piece_count(PeerId peer) const
{
	auto it = peer_pieces.find(peer);
	if (it == peer_pieces.end()) {
		return 0;
	}
	return static_cast<int>(std::count(it->second.begin(), it->second.end(), true));
}

const std::vector<int>& RarityTracker::rarest_first() const
{
	if (order_dirty) {
		order.resize(counts.size());
		std::iota(order.begin(), order.end(), 0);
		std::sort(order.begin(), order.end(), [this](int a, int b) {
			if (counts[a] != counts[b]) {
				return counts[a] < counts[b];
			}
			return a < b;
		});
		order_dirty = false;
	}
	return order;
}
