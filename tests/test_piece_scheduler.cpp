#include <gtest/gtest.h>
#include <log.hpp>
#include <piece_scheduler.hpp>
#include "test_helpers.hpp"
#include <memory>

using std::chrono::milliseconds;

/*
 * Store, rarity counts and scheduler over a synthetic torrent. Peers are
 * plain ids, readiness is set directly.
 */
class PieceSchedulerTest : public ::testing::Test {
protected:
	std::string content;
	std::unique_ptr<TorrentMetadata> meta;
	std::unique_ptr<MemoryStorage> storage;
	std::unique_ptr<PieceStore> store;
	std::unique_ptr<RarityTracker> rarity;
	std::unique_ptr<PieceScheduler> scheduler;
	SessionSettings settings;
	PieceScheduler::clock::time_point t0 = PieceScheduler::clock::now();

	void SetUp() override
	{
		set_log_level(LogLevel::off);
		settings.endgame_threshold = 0;
	}

	void build(int num_pieces, int piece_length)
	{
		content = make_content(static_cast<size_t>(num_pieces) * piece_length);
		meta.reset(new TorrentMetadata(make_metadata(content, piece_length)));
		storage.reset(new MemoryStorage(piece_length));
		store.reset(new PieceStore(*meta, *storage, settings.block_size));
		rarity.reset(new RarityTracker(num_pieces));
		scheduler.reset(new PieceScheduler(*store, *rarity, settings));
	}

	void add_ready_peer(PeerId peer, std::initializer_list<int> pieces)
	{
		rarity->peer_bitfield(peer, bits_of(meta->num_pieces, pieces));
		scheduler->add_peer(peer);
		scheduler->set_peer_ready(peer, true);
	}

	void deliver(PeerId from, const BlockInfo& block)
	{
		scheduler->on_block_received(from, block);
		store->submit_block(block.piece, block.offset,
				content.substr(static_cast<size_t>(block.piece) * meta->piece_length + block.offset,
						block.length), from);
	}

	static std::vector<BlockInfo> blocks_for(const std::vector<BlockRequest>& reqs, PeerId peer)
	{
		std::vector<BlockInfo> out;
		for (const BlockRequest& r : reqs) {
			if (r.peer == peer) {
				out.push_back(r.block);
			}
		}
		return out;
	}
};

TEST_F(PieceSchedulerTest, BlocksWithinPieceInOffsetOrder)
{
	build(1, 65536);
	add_ready_peer(1, {0});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	ASSERT_EQ(reqs.size(), 4u);
	for (int i = 0; i < 4; i++) {
		EXPECT_EQ(reqs[i].peer, 1u);
		EXPECT_EQ(reqs[i].block.piece, 0);
		EXPECT_EQ(reqs[i].block.offset, i * 16384);
		EXPECT_EQ(reqs[i].block.length, 16384);
	}
	EXPECT_EQ(scheduler->in_flight(), 4);
}

TEST_F(PieceSchedulerTest, RarestPiecesFirstFromEachPeer)
{
	settings.max_requests_per_peer = 1;
	build(4, 16384);

	/* A and B own disjoint halves, C only adds availability to 1 and 3 */
	add_ready_peer(1, {0, 1});
	add_ready_peer(2, {2, 3});
	rarity->peer_bitfield(3, bits_of(4, {1, 3}));

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	ASSERT_EQ(reqs.size(), 2u);
	EXPECT_EQ(blocks_for(reqs, 1), std::vector<BlockInfo>{BlockInfo(0, 0, 16384)});
	EXPECT_EQ(blocks_for(reqs, 2), std::vector<BlockInfo>{BlockInfo(2, 0, 16384)});
}

TEST_F(PieceSchedulerTest, NoBlockRequestedTwiceOutsideEndgame)
{
	build(2, 32768);
	add_ready_peer(1, {0, 1});
	add_ready_peer(2, {0, 1});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	EXPECT_EQ(reqs.size(), 4u);
	EXPECT_FALSE(scheduler->in_endgame());

	for (const BlockRequest& r : reqs) {
		EXPECT_EQ(scheduler->requesters(r.block), 1);
	}

	EXPECT_TRUE(scheduler->tick(t0).empty());
}

TEST_F(PieceSchedulerTest, PerPeerCap)
{
	settings.max_requests_per_peer = 2;
	build(1, 65536);
	add_ready_peer(1, {0});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	ASSERT_EQ(reqs.size(), 2u);
	EXPECT_TRUE(scheduler->tick(t0).empty());

	deliver(1, reqs[0].block);
	EXPECT_EQ(scheduler->in_flight(1), 1);

	std::vector<BlockRequest> more = scheduler->tick(t0);
	ASSERT_EQ(more.size(), 1u);
	EXPECT_EQ(more[0].block.offset, 2 * 16384);
}

TEST_F(PieceSchedulerTest, GlobalCap)
{
	settings.max_global_requests = 3;
	build(4, 16384);
	add_ready_peer(1, {0, 1});
	add_ready_peer(2, {2, 3});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	EXPECT_EQ(reqs.size(), 3u);
	EXPECT_EQ(scheduler->in_flight(), 3);
	EXPECT_TRUE(scheduler->tick(t0).empty());
}

TEST_F(PieceSchedulerTest, PeersThatAreNotReadyGetNothing)
{
	build(2, 16384);
	rarity->peer_bitfield(1, bits_of(2, {0, 1}));
	scheduler->add_peer(1);

	EXPECT_TRUE(scheduler->tick(t0).empty());

	scheduler->set_peer_ready(1, true);
	EXPECT_EQ(scheduler->tick(t0).size(), 2u);

	/* choked: the session releases the requests and clears readiness */
	EXPECT_EQ(scheduler->release_requests(1).size(), 2u);
	scheduler->set_peer_ready(1, false);
	EXPECT_EQ(scheduler->in_flight(), 0);
	EXPECT_TRUE(scheduler->tick(t0).empty());
}

TEST_F(PieceSchedulerTest, OnlyPiecesThePeerHas)
{
	build(3, 16384);
	add_ready_peer(1, {1});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	ASSERT_EQ(reqs.size(), 1u);
	EXPECT_EQ(reqs[0].block.piece, 1);
}

TEST_F(PieceSchedulerTest, TimedOutBlockGoesToAnotherPeer)
{
	build(1, 16384);
	add_ready_peer(1, {0});
	add_ready_peer(2, {0});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	ASSERT_EQ(reqs.size(), 1u);
	EXPECT_EQ(reqs[0].peer, 1u);

	EXPECT_TRUE(scheduler->sweep_timeouts(t0 + milliseconds(1000)).empty());

	std::vector<BlockRequest> expired = scheduler->sweep_timeouts(t0 + settings.request_timeout);
	ASSERT_EQ(expired.size(), 1u);
	EXPECT_EQ(expired[0].peer, 1u);
	EXPECT_EQ(expired[0].block, BlockInfo(0, 0, 16384));
	EXPECT_EQ(scheduler->in_flight(), 0);
	EXPECT_EQ(scheduler->timeouts(1), 1);

	std::vector<BlockRequest> again = scheduler->tick(t0 + settings.request_timeout);
	ASSERT_EQ(again.size(), 1u);
	EXPECT_EQ(again[0].peer, 2u);
	EXPECT_EQ(again[0].block, BlockInfo(0, 0, 16384));
}

TEST_F(PieceSchedulerTest, TimedOutBlockRetriedOnSamePeerWhenAlone)
{
	build(1, 16384);
	add_ready_peer(1, {0});

	ASSERT_EQ(scheduler->tick(t0).size(), 1u);
	ASSERT_EQ(scheduler->sweep_timeouts(t0 + settings.request_timeout).size(), 1u);

	std::vector<BlockRequest> again = scheduler->tick(t0 + settings.request_timeout);
	ASSERT_EQ(again.size(), 1u);
	EXPECT_EQ(again[0].peer, 1u);
}

TEST_F(PieceSchedulerTest, RepeatedTimeoutsMarkPeerUnreliable)
{
	settings.max_block_retries = 1;
	build(1, 16384);
	add_ready_peer(1, {0});

	auto now = t0;
	ASSERT_EQ(scheduler->tick(now).size(), 1u);
	now += settings.request_timeout;
	ASSERT_EQ(scheduler->sweep_timeouts(now).size(), 1u);
	EXPECT_FALSE(scheduler->is_unreliable(1));

	ASSERT_EQ(scheduler->tick(now).size(), 1u);
	now += settings.request_timeout;
	ASSERT_EQ(scheduler->sweep_timeouts(now).size(), 1u);
	EXPECT_TRUE(scheduler->is_unreliable(1));

	EXPECT_TRUE(scheduler->tick(now).empty());

	/* a fresh peer picks the block up */
	add_ready_peer(2, {0});
	std::vector<BlockRequest> reqs = scheduler->tick(now);
	ASSERT_EQ(reqs.size(), 1u);
	EXPECT_EQ(reqs[0].peer, 2u);
}

TEST_F(PieceSchedulerTest, DisconnectReleasesExactlyItsRequests)
{
	build(3, 16384);
	add_ready_peer(1, {0, 1, 2});

	ASSERT_EQ(scheduler->tick(t0).size(), 3u);

	std::vector<BlockInfo> released = scheduler->remove_peer(1);
	EXPECT_EQ(released.size(), 3u);
	EXPECT_EQ(scheduler->in_flight(), 0);
	EXPECT_EQ(scheduler->num_peers(), 0);
	rarity->peer_disconnected(1);

	add_ready_peer(2, {0, 1, 2});
	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	EXPECT_EQ(blocks_for(reqs, 2).size(), 3u);
}

TEST_F(PieceSchedulerTest, EndgameDuplicatesAndCancels)
{
	settings.endgame_threshold = 16;
	build(1, 32768);
	add_ready_peer(1, {0});
	add_ready_peer(2, {0});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	EXPECT_TRUE(scheduler->in_endgame());
	ASSERT_EQ(reqs.size(), 4u);
	EXPECT_EQ(blocks_for(reqs, 1).size(), 2u);
	EXPECT_EQ(blocks_for(reqs, 2).size(), 2u);

	BlockInfo first(0, 0, 16384);
	EXPECT_EQ(scheduler->requesters(first), 2);

	std::vector<PeerId> others = scheduler->on_block_received(1, first);
	EXPECT_EQ(others, std::vector<PeerId>{2});
	EXPECT_FALSE(scheduler->is_requested(first));
	EXPECT_EQ(scheduler->in_flight(), 2);
}

TEST_F(PieceSchedulerTest, PenalizedPeersPickLast)
{
	settings.max_requests_per_peer = 1;
	settings.penalty_threshold = 1;
	build(3, 16384);

	/* peer 1 contributes a corrupt piece 2 */
	ASSERT_EQ(store->submit_block(2, 0, std::string(16384, 'x'), 1),
			SubmitResult::verification_failed);

	add_ready_peer(1, {0, 1});
	add_ready_peer(2, {0, 1});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	ASSERT_EQ(reqs.size(), 2u);
	EXPECT_EQ(reqs[0].peer, 2u);
	EXPECT_EQ(reqs[0].block.piece, 0);
	EXPECT_EQ(reqs[1].peer, 1u);
	EXPECT_EQ(reqs[1].block.piece, 1);
}

TEST_F(PieceSchedulerTest, AbortedRequestReturnsToPool)
{
	build(1, 16384);
	add_ready_peer(1, {0});

	std::vector<BlockRequest> reqs = scheduler->tick(t0);
	ASSERT_EQ(reqs.size(), 1u);
	scheduler->abort_request(1, reqs[0].block);
	EXPECT_EQ(scheduler->in_flight(), 0);
	EXPECT_FALSE(scheduler->is_requested(reqs[0].block));
	EXPECT_EQ(scheduler->tick(t0).size(), 1u);
}

TEST_F(PieceSchedulerTest, CompletesWhenEveryPieceVerified)
{
	build(2, 16384);
	add_ready_peer(1, {0, 1});

	for (const BlockRequest& r : scheduler->tick(t0)) {
		deliver(r.peer, r.block);
	}
	EXPECT_TRUE(scheduler->is_complete());
	EXPECT_EQ(scheduler->remaining_blocks(), 0);
	EXPECT_EQ(scheduler->in_flight(), 0);
	EXPECT_TRUE(scheduler->tick(t0).empty());
}

TEST_F(PieceSchedulerTest, SameInputsSameAssignments)
{
	build(6, 16384);
	add_ready_peer(1, {0, 2, 4});
	add_ready_peer(2, {1, 2, 3, 5});
	add_ready_peer(3, {0, 5});
	std::vector<BlockRequest> first = scheduler->tick(t0);

	build(6, 16384);
	add_ready_peer(1, {0, 2, 4});
	add_ready_peer(2, {1, 2, 3, 5});
	add_ready_peer(3, {0, 5});
	std::vector<BlockRequest> second = scheduler->tick(t0);

	ASSERT_EQ(first.size(), second.size());
	for (size_t i = 0; i < first.size(); i++) {
		EXPECT_EQ(first[i].peer, second[i].peer);
		EXPECT_EQ(first[i].block, second[i].block);
	}
}
