#include <piece_scheduler.hpp>
#include <log.hpp>
#include <algorithm>
#include <iterator>
#include <tuple>

PieceScheduler::PieceScheduler(const PieceStore& store, const RarityTracker& rarity,
		SessionSettings settings)
	: store(store), rarity(rarity), settings(settings)
{
}

void PieceScheduler::add_peer(PeerId peer)
{
	peers.emplace(peer, PeerSchedule());
}

std::vector<BlockInfo> PieceScheduler::remove_peer(PeerId peer)
{
	std::vector<BlockInfo> released = drop_peer_requests(peer);
	peers.erase(peer);
	return released;
}

std::vector<BlockInfo> PieceScheduler::release_requests(PeerId peer)
{
	return drop_peer_requests(peer);
}

std::vector<BlockInfo> PieceScheduler::drop_peer_requests(PeerId peer)
{
	std::vector<BlockInfo> released;
	for (auto it = pending.begin(); it != pending.end();) {
		auto& reqs = it->second;
		auto mine = std::remove_if(reqs.begin(), reqs.end(),
				[peer](const PendingRequest& r) { return r.peer == peer; });
		auto dropped = std::distance(mine, reqs.end());
		for (decltype(dropped) i = 0; i < dropped; i++) {
			released.push_back(it->first);
			drop_request(peer);
		}
		reqs.erase(mine, reqs.end());

		if (reqs.empty()) {
			it = pending.erase(it);
		} else {
			++it;
		}
	}
	return released;
}

void PieceScheduler::drop_request(PeerId peer)
{
	auto p = peers.find(peer);
	if (p != peers.end() && p->second.in_flight > 0) {
		p->second.in_flight--;
	}
	total_in_flight--;
}

void PieceScheduler::set_peer_ready(PeerId peer, bool ready)
{
	auto p = peers.find(peer);
	if (p != peers.end()) {
		p->second.ready = ready;
	}
}

std::vector<BlockRequest> PieceScheduler::sweep_timeouts(clock::time_point now)
{
	std::vector<BlockRequest> expired;

	for (auto it = pending.begin(); it != pending.end();) {
		auto& reqs = it->second;
		for (auto r = reqs.begin(); r != reqs.end();) {
			if (now - r->since < settings.request_timeout) {
				++r;
				continue;
			}

			expired.push_back(BlockRequest{ r->peer, it->first });
			drop_request(r->peer);

			BlockRetry& retry = retries[it->first];
			retry.count++;
			retry.last_peer = r->peer;

			auto p = peers.find(r->peer);
			if (p != peers.end()) {
				p->second.timeouts++;
				if (retry.count > settings.max_block_retries && !p->second.unreliable) {
					p->second.unreliable = true;
					retry.count = 0;
					log_warning("peer " + std::to_string(r->peer) + " marked unreliable after "
							"block " + std::to_string(it->first.piece) + ":"
							+ std::to_string(it->first.offset) + " kept timing out");
				}
			}
			r = reqs.erase(r);
		}

		if (reqs.empty()) {
			it = pending.erase(it);
		} else {
			++it;
		}
	}
	return expired;
}

int PieceScheduler::remaining_blocks() const
{
	int remaining = 0;
	for (int piece = 0; piece < store.get_total_pieces(); piece++) {
		if (store.have_piece(piece)) {
			continue;
		}
		std::vector<bool> have = store.block_bitmap(piece);
		remaining += static_cast<int>(std::count(have.begin(), have.end(), false));
	}
	return remaining;
}

std::vector<PeerId> PieceScheduler::eligible_peers() const
{
	std::vector<PeerId> eligible;
	for (const auto& entry : peers) {
		const PeerSchedule& p = entry.second;
		if (p.ready && !p.unreliable && p.in_flight < settings.max_requests_per_peer) {
			eligible.push_back(entry.first);
		}
	}

	/* well behaved peers pick first, penalized ones get what is left */
	std::sort(eligible.begin(), eligible.end(), [this](PeerId a, PeerId b) {
		int pa = store.penalty(a);
		int pb = store.penalty(b);
		return std::make_tuple(pa >= settings.penalty_threshold, pa, a)
			< std::make_tuple(pb >= settings.penalty_threshold, pb, b);
	});
	return eligible;
}

bool PieceScheduler::other_peer_can_take(PeerId peer, int piece,
		const std::vector<PeerId>& eligible) const
{
	for (PeerId other : eligible) {
		if (other == peer || !rarity.peer_has(other, piece)) {
			continue;
		}
		if (peers.at(other).in_flight < settings.max_requests_per_peer) {
			return true;
		}
	}
	return false;
}

std::vector<BlockRequest> PieceScheduler::tick(clock::time_point now)
{
	std::vector<BlockRequest> out;

	int remaining = remaining_blocks();
	endgame = remaining > 0 && remaining <= settings.endgame_threshold;
	if (remaining == 0) {
		return out;
	}

	std::vector<PeerId> eligible = eligible_peers();
	for (PeerId peer : eligible) {
		int budget = std::min(settings.max_requests_per_peer - peers[peer].in_flight,
				settings.max_global_requests - total_in_flight);
		if (budget <= 0) {
			continue;
		}

		budget -= fill_peer(peer, now, eligible, budget, false, out);
		if (endgame && budget > 0) {
			fill_peer(peer, now, eligible, budget, true, out);
		}
	}
	return out;
}

int PieceScheduler::fill_peer(PeerId peer, clock::time_point now,
		const std::vector<PeerId>& eligible, int budget, bool duplicates,
		std::vector<BlockRequest>& out)
{
	int issued = 0;

	for (int piece : rarity.rarest_first()) {
		if (issued >= budget) {
			break;
		}
		if (!rarity.peer_has(peer, piece) || store.have_piece(piece)) {
			continue;
		}

		std::vector<bool> have = store.block_bitmap(piece);
		for (size_t b = 0; b < have.size() && issued < budget; b++) {
			if (have[b]) {
				continue;
			}

			BlockInfo block(piece, static_cast<int>(b) * store.block_size(),
					store.block_length(piece, static_cast<int>(b)));
			auto it = pending.find(block);

			if (!duplicates) {
				if (it != pending.end()) {
					continue;
				}
				/* a block that timed out on this peer goes to someone else if possible */
				auto retry = retries.find(block);
				if (retry != retries.end() && retry->second.last_peer == peer
						&& other_peer_can_take(peer, piece, eligible)) {
					continue;
				}
			} else {
				if (it == pending.end()) {
					continue;
				}
				bool mine = std::any_of(it->second.begin(), it->second.end(),
						[peer](const PendingRequest& r) { return r.peer == peer; });
				if (mine) {
					continue;
				}
			}

			add_request(peer, block, now, out);
			issued++;
		}
	}
	return issued;
}

void PieceScheduler::add_request(PeerId peer, const BlockInfo& block,
		clock::time_point now, std::vector<BlockRequest>& out)
{
	pending[block].push_back(PendingRequest{ peer, now });
	peers[peer].in_flight++;
	total_in_flight++;
	out.push_back(BlockRequest{ peer, block });
}

std::vector<PeerId> PieceScheduler::on_block_received(PeerId from, const BlockInfo& block)
{
	std::vector<PeerId> others;

	auto it = pending.find(block);
	if (it != pending.end()) {
		for (const PendingRequest& r : it->second) {
			drop_request(r.peer);
			if (r.peer != from) {
				others.push_back(r.peer);
			}
		}
		pending.erase(it);
	}
	retries.erase(block);
	return others;
}

void PieceScheduler::abort_request(PeerId peer, const BlockInfo& block)
{
	auto it = pending.find(block);
	if (it == pending.end()) {
		return;
	}

	auto& reqs = it->second;
	for (auto r = reqs.begin(); r != reqs.end(); ++r) {
		if (r->peer == peer) {
			drop_request(peer);
			reqs.erase(r);
			break;
		}
	}
	if (reqs.empty()) {
		pending.erase(it);
	}
}

void PieceScheduler::on_piece_failed(int piece)
{
	auto first = retries.lower_bound(BlockInfo(piece, 0, 0));
	auto last = retries.lower_bound(BlockInfo(piece + 1, 0, 0));
	retries.erase(first, last);
}

bool PieceScheduler::is_complete() const
{
	return store.is_complete();
}

int PieceScheduler::in_flight(PeerId peer) const
{
	auto p = peers.find(peer);
	return p == peers.end() ? 0 : p->second.in_flight;
}

int PieceScheduler::requesters(const BlockInfo& block) const
{
	auto it = pending.find(block);
	return it == pending.end() ? 0 : static_cast<int>(it->second.size());
}

bool PieceScheduler::is_unreliable(PeerId peer) const
{
	auto p = peers.find(peer);
	return p != peers.end() && p->second.unreliable;
}

int PieceScheduler::timeouts(PeerId peer) const
{
	auto p = peers.find(peer);
	return p == peers.end() ? 0 : p->second.timeouts;
}
