#include <gtest/gtest.h>
#include <log.hpp>
#include <peer_connection.hpp>
#include "test_helpers.hpp"

#define OUR_PEER_ID std::string("-TR0001-ourpeerid123")

class PeerConnectionTest : public ::testing::Test {
protected:
	boost::asio::io_context io;
	std::shared_ptr<FakeWire> wire = std::make_shared<FakeWire>(io);
	SessionSettings settings;
	std::vector<PeerEvent> events;
	std::shared_ptr<PeerConnection> conn;

	void SetUp() override
	{
		set_log_level(LogLevel::off);
	}

	void open(bool initiator, int num_pieces = 8)
	{
		conn = std::make_shared<PeerConnection>(io, 1, PeerInfo("", "127.0.0.1", 6881),
				wire->transport(), OUR_PEER_ID, TEST_INFO_HASH, num_pieces, settings,
				[this](const PeerEvent& ev) { events.push_back(ev); });
		conn->start(initiator);
		pump(io);
	}

	void establish(int num_pieces = 8)
	{
		open(true, num_pieces);
		wire->deliver(remote_handshake());
		pump(io);
		ASSERT_EQ(conn->state(), PeerState::established);
	}

	void receive(const std::string& bytes)
	{
		wire->deliver(bytes);
		pump(io);
	}

	const PeerEvent* find_event(PeerEvent::Type type) const
	{
		for (const PeerEvent& ev : events) {
			if (ev.type == type) {
				return &ev;
			}
		}
		return nullptr;
	}
};

TEST_F(PeerConnectionTest, InitiatorSendsHandshakeFirst)
{
	open(true);

	ASSERT_EQ(wire->written.size(), static_cast<size_t>(HANDSHAKE_SIZE));
	Handshake hs = parse_handshake(wire->sent_handshake(), TEST_INFO_HASH);
	EXPECT_EQ(hs.peer_id, OUR_PEER_ID);
	EXPECT_EQ(conn->state(), PeerState::handshaking);
	EXPECT_TRUE(events.empty());
}

TEST_F(PeerConnectionTest, ReceiverAnswersValidHandshake)
{
	open(false);
	EXPECT_TRUE(wire->written.empty());

	receive(remote_handshake());
	EXPECT_EQ(wire->written.size(), static_cast<size_t>(HANDSHAKE_SIZE));
	EXPECT_EQ(conn->state(), PeerState::established);
	EXPECT_EQ(conn->remote_id(), REMOTE_PEER_ID);

	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(events[0].type, PeerEvent::handshake);
	EXPECT_EQ(events[0].peer, 1u);
	EXPECT_EQ(events[0].data, REMOTE_PEER_ID);
}

TEST_F(PeerConnectionTest, HandshakeSplitAcrossReads)
{
	open(true);
	std::string hs = remote_handshake();

	receive(hs.substr(0, 30));
	EXPECT_EQ(conn->state(), PeerState::handshaking);

	receive(hs.substr(30));
	EXPECT_EQ(conn->state(), PeerState::established);
}

TEST_F(PeerConnectionTest, HandshakeForOtherTorrentDisconnects)
{
	open(true);
	receive(remote_handshake(std::string(20, 'X')));

	EXPECT_EQ(conn->state(), PeerState::disconnected);
	EXPECT_TRUE(wire->closed);

	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason.rfind("handshake failed", 0), 0u);
	EXPECT_EQ(find_event(PeerEvent::handshake), nullptr);
}

TEST_F(PeerConnectionTest, HandshakeTimesOut)
{
	settings.handshake_timeout = std::chrono::milliseconds(20);
	open(true);

	io.restart();
	io.run_for(std::chrono::seconds(2));

	EXPECT_EQ(conn->state(), PeerState::disconnected);
	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason, "handshake failed: timed out");
}

TEST_F(PeerConnectionTest, RequestsNeedUnchokeAndInterest)
{
	establish();
	BlockInfo block(0, 0, 16384);

	EXPECT_FALSE(conn->send_request(block));

	conn->send_interested();
	EXPECT_FALSE(conn->is_ready());
	EXPECT_FALSE(conn->send_request(block));

	receive(encode_message(MSG_UNCHOKE, ""));
	EXPECT_TRUE(conn->is_ready());
	EXPECT_TRUE(conn->send_request(block));
	EXPECT_EQ(conn->outstanding().size(), 1u);
	pump(io);

	EXPECT_EQ(wire->count_sent(MSG_INTERESTED), 1u);
	EXPECT_EQ(wire->count_sent(MSG_REQUEST), 1u);
	ASSERT_NE(find_event(PeerEvent::unchoke), nullptr);
}

TEST_F(PeerConnectionTest, PerPeerRequestCap)
{
	settings.max_requests_per_peer = 2;
	establish();
	conn->send_interested();
	receive(encode_message(MSG_UNCHOKE, ""));

	EXPECT_TRUE(conn->send_request(BlockInfo(0, 0, 16384)));
	EXPECT_TRUE(conn->send_request(BlockInfo(0, 16384, 16384)));
	EXPECT_FALSE(conn->can_request());
	EXPECT_FALSE(conn->send_request(BlockInfo(0, 32768, 16384)));
}

TEST_F(PeerConnectionTest, ChokeDropsOutstandingRequests)
{
	establish();
	conn->send_interested();
	receive(encode_message(MSG_UNCHOKE, ""));
	ASSERT_TRUE(conn->send_request(BlockInfo(1, 0, 16384)));

	receive(encode_message(MSG_CHOKE, ""));
	EXPECT_TRUE(conn->outstanding().empty());
	EXPECT_TRUE(conn->handle().peer_choking);
	EXPECT_FALSE(conn->is_ready());
	EXPECT_NE(find_event(PeerEvent::choke), nullptr);
}

TEST_F(PeerConnectionTest, BitfieldAndHaveUpdatePeerPieces)
{
	establish();
	receive(bitfield_message(bits_of(8, {0, 3})) + encode_have(5));

	EXPECT_EQ(conn->handle().pieces, bits_of(8, {0, 3, 5}));

	const PeerEvent* bf = find_event(PeerEvent::bitfield);
	ASSERT_NE(bf, nullptr);
	EXPECT_EQ(bf->bits, bits_of(8, {0, 3}));

	const PeerEvent* have = find_event(PeerEvent::have);
	ASSERT_NE(have, nullptr);
	EXPECT_EQ(have->piece, 5);
}

TEST_F(PeerConnectionTest, HaveOutOfRangeIsProtocolError)
{
	establish();
	receive(encode_have(8));

	EXPECT_EQ(conn->state(), PeerState::disconnected);
	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason.rfind("protocol error", 0), 0u);
}

TEST_F(PeerConnectionTest, BadFramingIsFatal)
{
	establish();
	receive(encode_message(MSG_HAVE, "abcde"));

	EXPECT_EQ(conn->state(), PeerState::disconnected);
	EXPECT_TRUE(wire->closed);
	ASSERT_NE(find_event(PeerEvent::disconnected), nullptr);
}

TEST_F(PeerConnectionTest, BitfieldWithSpareBitsIsFatal)
{
	establish(4);
	receive(encode_message(MSG_BITFIELD, std::string(1, '\xff')));

	EXPECT_EQ(conn->state(), PeerState::disconnected);
}

TEST_F(PeerConnectionTest, UnknownMessageIgnored)
{
	establish();
	receive(encode_message(20, "extension") + encode_message(MSG_UNCHOKE, ""));

	EXPECT_EQ(conn->state(), PeerState::established);
	EXPECT_NE(find_event(PeerEvent::unchoke), nullptr);
}

TEST_F(PeerConnectionTest, BlockDeliveredAsEvent)
{
	establish();
	conn->send_interested();
	receive(encode_message(MSG_UNCHOKE, ""));
	ASSERT_TRUE(conn->send_request(BlockInfo(2, 0, 4)));

	receive(encode_piece(2, 0, "wxyz"));

	const PeerEvent* ev = find_event(PeerEvent::block);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->piece, 2);
	EXPECT_EQ(ev->offset, 0);
	EXPECT_EQ(ev->length, 4);
	EXPECT_EQ(ev->data, "wxyz");
	EXPECT_TRUE(conn->outstanding().empty());
	EXPECT_EQ(conn->handle().downloaded, 4u);
}

TEST_F(PeerConnectionTest, RequestsWhileChokingAreDropped)
{
	establish();
	std::string request = encode_request(BlockInfo(1, 0, 16384));

	receive(request);
	EXPECT_EQ(find_event(PeerEvent::request), nullptr);

	conn->send_unchoke();
	receive(request);
	const PeerEvent* ev = find_event(PeerEvent::request);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->piece, 1);
	EXPECT_EQ(ev->length, 16384);
}

TEST_F(PeerConnectionTest, GracefulDisconnectFlushesQueuedWrites)
{
	establish();
	conn->send_have(2);
	conn->disconnect("done");
	pump(io);

	EXPECT_TRUE(wire->closed);
	EXPECT_EQ(wire->count_sent(MSG_HAVE), 1u);

	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason, "done");
}

TEST_F(PeerConnectionTest, RemoteHangUp)
{
	establish();
	wire->hang_up();
	pump(io);

	EXPECT_EQ(conn->state(), PeerState::disconnected);
	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason, "connection closed by peer");
}

TEST_F(PeerConnectionTest, KeepAliveAfterQuietPeriod)
{
	settings.keepalive_interval = std::chrono::milliseconds(20);
	establish();

	io.restart();
	io.run_for(std::chrono::milliseconds(100));

	ASSERT_GE(wire->written.size(), static_cast<size_t>(HANDSHAKE_SIZE + 4));
	EXPECT_EQ(wire->written.substr(HANDSHAKE_SIZE, 4), std::string(4, '\0'));
	EXPECT_EQ(conn->state(), PeerState::established);
}

TEST_F(PeerConnectionTest, SilentPeerTimesOut)
{
	settings.inactivity_timeout = std::chrono::milliseconds(30);
	establish();

	io.restart();
	io.run_for(std::chrono::seconds(2));

	EXPECT_EQ(conn->state(), PeerState::disconnected);
	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason, "inactivity timeout");
}

TEST_F(PeerConnectionTest, StuckWriteDoesNotBlockDisconnect)
{
	settings.handshake_timeout = std::chrono::milliseconds(20);
	establish();

	wire->stall_writes = true;
	conn->send_have(1);
	conn->disconnect("session shutdown");
	pump(io);

	/* still waiting for the write to drain */
	EXPECT_FALSE(wire->closed);
	EXPECT_EQ(find_event(PeerEvent::disconnected), nullptr);
	EXPECT_EQ(wire->stalled.size(), 1u);

	io.restart();
	io.run_for(std::chrono::seconds(2));

	EXPECT_TRUE(wire->closed);
	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason, "shutdown timed out");
}

TEST_F(PeerConnectionTest, DrainedWriteClosesBeforeDeadline)
{
	settings.handshake_timeout = std::chrono::milliseconds(20);
	establish();

	conn->send_have(1);
	conn->disconnect("session shutdown");
	pump(io);

	EXPECT_TRUE(wire->closed);
	const PeerEvent* ev = find_event(PeerEvent::disconnected);
	ASSERT_NE(ev, nullptr);
	EXPECT_EQ(ev->reason, "session shutdown");

	size_t seen = events.size();
	io.restart();
	io.run_for(std::chrono::milliseconds(100));
	EXPECT_EQ(events.size(), seen);
}
