#include <session.hpp>
#include <errors.hpp>
#include <log.hpp>
#include <utils.hpp>
#include <utility>

using boost::asio::ip::tcp;

/* largest block we serve, as in mainline clients */
#define MAX_UPLOAD_BLOCK 131072

Session::Session(boost::asio::io_context& io,
		const TorrentMetadata& meta,
		StorageSink& sink,
		SessionSettings settings,
		SessionEvents events)
	: io(io),
	  meta(meta),
	  settings(settings),
	  events(std::move(events)),
	  our_peer_id(generate_peer_id()),
	  piece_store(meta, sink, settings.block_size, settings.max_write_retries),
	  rarity_tracker(meta.num_pieces),
	  piece_scheduler(piece_store, rarity_tracker, settings),
	  tick_timer(io),
	  acceptor(io),
	  alive(std::make_shared<bool>(true))
{
	piece_store.set_on_piece_verified([this](int piece) { on_piece_verified(piece); });
	log_debug("our peer id: " + our_peer_id);
}

Session::~Session()
{
	stop();
	alive.reset();
}

int Session::resume()
{
	int good = piece_store.check_existing();
	if (piece_store.is_complete()) {
		log_info("file already complete - seeding only");
	}
	check_complete();
	return good;
}

void Session::start()
{
	if (running || stopped) {
		return;
	}
	running = true;
	last_tick = clock::now();

	connect_candidates();
	schedule_tick();
}

void Session::stop()
{
	if (stopped) {
		return;
	}
	stopped = true;
	running = false;
	tick_timer.cancel();

	if (acceptor.is_open()) {
		boost::system::error_code ec;
		acceptor.close(ec);
		if (ec) {
			log_debug("closing acceptor: " + ec.message());
		}
	}

	candidates.clear();

	/* copy, disconnect events erase from the map later */
	auto current = peers;
	for (auto& entry : current) {
		entry.second->disconnect("session shutdown");
	}
}

uint16_t Session::listen(uint16_t port)
{
	tcp::endpoint endpoint(tcp::v4(), port);
	acceptor.open(endpoint.protocol());
	acceptor.set_option(tcp::acceptor::reuse_address(true));
	acceptor.bind(endpoint);
	acceptor.listen();

	uint16_t bound = acceptor.local_endpoint().port();
	log_info("listening on port: " + std::to_string(bound));
	do_accept();
	return bound;
}

void Session::do_accept()
{
	auto socket = std::make_shared<tcp::socket>(io);
	std::weak_ptr<bool> token = alive;

	acceptor.async_accept(*socket, [this, socket, token](const boost::system::error_code& ec) {
		if (token.expired() || ec == boost::asio::error::operation_aborted) {
			return;
		}

		if (ec) {
			log_warning("acceptor error: " + ec.message());
		} else if (stopped || peers.size() + connecting >= settings.max_peers) {
			boost::system::error_code close_ec;
			socket->close(close_ec);
		} else {
			boost::system::error_code ep_ec;
			tcp::endpoint remote = socket->remote_endpoint(ep_ec);
			PeerInfo info("", ep_ec ? "unknown" : remote.address().to_string(),
					ep_ec ? 0 : remote.port());

			log_info("accepted incoming connection from " + info.address());
			known_addresses.insert(info.address());
			attach_peer(make_tcp_transport(socket), info, false);
		}

		if (!stopped && acceptor.is_open()) {
			do_accept();
		}
	});
}

void Session::add_peer_candidates(const std::vector<PeerInfo>& discovered)
{
	for (const PeerInfo& peer : discovered) {
		if (known_addresses.insert(peer.address()).second) {
			candidates.push_back(peer);
		}
	}

	if (running) {
		connect_candidates();
	}
}

void Session::connect_candidates()
{
	while (!stopped && !completed && !candidates.empty()
			&& peers.size() + connecting < settings.max_peers) {
		PeerInfo peer = candidates.front();
		candidates.pop_front();
		connect_to(peer);
	}
}

void Session::connect_to(const PeerInfo& peer)
{
	boost::system::error_code ec;
	boost::asio::ip::address address = boost::asio::ip::make_address(peer.ip, ec);
	if (ec) {
		log_warning("skipping peer with bad address " + peer.address());
		return;
	}

	attempted_peers = true;
	connecting++;
	log_info("connecting to peer: " + peer.address());

	auto socket = std::make_shared<tcp::socket>(io);
	std::weak_ptr<bool> token = alive;

	socket->async_connect(tcp::endpoint(address, peer.port),
			[this, socket, peer, token](const boost::system::error_code& ec) {
				if (token.expired()) {
					return;
				}
				connecting--;

				if (ec) {
					log_warning("Failed to connect to " + peer.address() + " - " + ec.message());
					if (!stopped) {
						connect_candidates();
						check_exhausted();
					}
					return;
				}

				if (stopped) {
					boost::system::error_code close_ec;
					socket->close(close_ec);
					return;
				}

				log_info("Connected to peer " + peer.address());
				attach_peer(make_tcp_transport(socket), peer, true);
			});
}

PeerId Session::attach_peer(PeerTransport transport, const PeerInfo& peer, bool initiator)
{
	if (stopped) {
		transport.close();
		return 0;
	}

	PeerId id = next_peer_id++;
	attempted_peers = true;
	known_addresses.insert(peer.address());

	auto conn = std::make_shared<PeerConnection>(io, id, peer, std::move(transport),
			our_peer_id, meta.info_hash, meta.num_pieces, settings, make_event_handler());
	peers[id] = conn;
	conn->start(initiator);
	return id;
}

PeerConnection::event_handler Session::make_event_handler()
{
	std::weak_ptr<bool> token = alive;
	return [this, token](const PeerEvent& ev) {
		if (token.expired()) {
			return;
		}
		handle_event(ev);
	};
}

void Session::handle_event(const PeerEvent& ev)
{
	auto it = peers.find(ev.peer);
	if (it == peers.end()) {
		return;
	}
	std::shared_ptr<PeerConnection> conn = it->second;

	switch (ev.type) {
		case PeerEvent::handshake:
			on_handshake(conn);
			break;
		case PeerEvent::bitfield:
			rarity_tracker.peer_bitfield(ev.peer, ev.bits);
			update_interest(conn);
			break;
		case PeerEvent::have:
			rarity_tracker.peer_have(ev.peer, ev.piece);
			update_interest(conn);
			break;
		case PeerEvent::choke: {
			std::vector<BlockInfo> released = piece_scheduler.release_requests(ev.peer);
			log_debug("choked by " + conn->info().address() + ", "
					+ std::to_string(released.size()) + " request(s) released");
			break;
		}
		case PeerEvent::unchoke:
			/* picked up by the next tick */
			break;
		case PeerEvent::interested:
			/* no choking algorithm, everyone interested gets served */
			conn->send_unchoke();
			break;
		case PeerEvent::not_interested:
			break;
		case PeerEvent::block:
			on_block(ev);
			break;
		case PeerEvent::request:
			on_request(conn, ev);
			break;
		case PeerEvent::cancel:
			/* requests are answered as they arrive, nothing is queued to cancel */
			break;
		case PeerEvent::disconnected:
			on_disconnected(ev);
			break;
	}
}

void Session::on_handshake(const std::shared_ptr<PeerConnection>& conn)
{
	piece_scheduler.add_peer(conn->id());
	if (piece_store.verified_count() > 0) {
		conn->send_bitfield(piece_store.get_bitfield());
	}
}

void Session::update_interest(const std::shared_ptr<PeerConnection>& conn)
{
	if (conn->state() != PeerState::established) {
		return;
	}

	bool wants = false;
	if (!completed) {
		for (int i = 0; i < meta.num_pieces; i++) {
			if (rarity_tracker.peer_has(conn->id(), i) && !piece_store.have_piece(i)) {
				wants = true;
				break;
			}
		}
	}

	if (wants) {
		conn->send_interested();
	} else {
		conn->send_not_interested();
	}
}

void Session::on_block(const PeerEvent& ev)
{
	BlockInfo block(ev.piece, ev.offset, ev.length);

	/* first copy wins, anyone else still fetching it is told to stop */
	for (PeerId other : piece_scheduler.on_block_received(ev.peer, block)) {
		auto it = peers.find(other);
		if (it != peers.end()) {
			it->second->send_cancel(block);
		}
	}

	SubmitResult result;
	try {
		result = piece_store.submit_block(ev.piece, ev.offset, ev.data, ev.peer);
	} catch (const PersistenceError& e) {
		fail(e.what());
		return;
	}

	switch (result) {
		case SubmitResult::accepted:
		case SubmitResult::piece_verified:
			total_downloaded += ev.data.size();
			break;
		case SubmitResult::verification_failed:
			total_downloaded += ev.data.size();
			piece_scheduler.on_piece_failed(ev.piece);
			break;
		case SubmitResult::duplicate:
			log_debug("discarding duplicate block " + std::to_string(ev.piece) + ":"
					+ std::to_string(ev.offset));
			break;
		case SubmitResult::rejected:
			log_warning("rejected block " + std::to_string(ev.piece) + ":"
					+ std::to_string(ev.offset) + " size " + std::to_string(ev.data.size()));
			break;
	}
}

void Session::on_piece_verified(int piece)
{
	log_info("Piece " + std::to_string(piece) + " complete and verified!");

	for (auto& entry : peers) {
		entry.second->send_have(piece);
	}

	if (events.on_piece_verified) {
		events.on_piece_verified(piece);
	}

	for (auto& entry : peers) {
		update_interest(entry.second);
	}
	check_complete();
}

void Session::on_request(const std::shared_ptr<PeerConnection>& conn, const PeerEvent& ev)
{
	if (ev.length <= 0 || ev.length > MAX_UPLOAD_BLOCK) {
		log_warning("ignoring request of " + std::to_string(ev.length) + " bytes from "
				+ conn->info().address());
		return;
	}

	std::string data;
	boost::system::error_code ec = piece_store.read_block(ev.piece, ev.offset, ev.length, data);
	if (ec) {
		log_debug("cannot serve " + std::to_string(ev.piece) + ":" + std::to_string(ev.offset)
				+ " to " + conn->info().address() + ": " + ec.message());
		return;
	}

	conn->send_piece(ev.piece, ev.offset, data);
	total_uploaded += data.size();
}

void Session::on_disconnected(const PeerEvent& ev)
{
	auto it = peers.find(ev.peer);
	std::string address = it->second->info().address();

	std::vector<BlockInfo> released = piece_scheduler.remove_peer(ev.peer);
	rarity_tracker.peer_disconnected(ev.peer);
	peers.erase(it);

	log_info("peer " + address + " removed (" + ev.reason + "), "
			+ std::to_string(released.size()) + " request(s) back in the pool");

	if (!stopped) {
		connect_candidates();
		check_exhausted();
	}
}

void Session::tick()
{
	if (stopped || failed) {
		return;
	}

	clock::time_point now = clock::now();

	std::set<PeerId> unreliable;
	for (const BlockRequest& expired : piece_scheduler.sweep_timeouts(now)) {
		log_debug("request " + std::to_string(expired.block.piece) + ":"
				+ std::to_string(expired.block.offset) + " to peer "
				+ std::to_string(expired.peer) + " timed out");
		auto it = peers.find(expired.peer);
		if (it != peers.end()) {
			it->second->send_cancel(expired.block);
		}
		if (piece_scheduler.is_unreliable(expired.peer)) {
			unreliable.insert(expired.peer);
		}
	}

	/* never scheduled again, so it only holds a slot */
	for (PeerId id : unreliable) {
		auto it = peers.find(id);
		if (it != peers.end()) {
			it->second->disconnect("requests kept timing out");
		}
	}

	for (auto& entry : peers) {
		piece_scheduler.set_peer_ready(entry.first, entry.second->is_ready());
	}

	for (const BlockRequest& request : piece_scheduler.tick(now)) {
		auto it = peers.find(request.peer);
		if (it == peers.end() || !it->second->send_request(request.block)) {
			piece_scheduler.abort_request(request.peer, request.block);
		}
	}

	update_rates(now);
	if (events.on_progress) {
		events.on_progress(progress());
	}
	check_exhausted();
}

void Session::update_rates(clock::time_point now)
{
	double elapsed = std::chrono::duration<double>(now - last_tick).count();
	if (elapsed <= 0.0) {
		return;
	}

	download_rate = static_cast<double>(total_downloaded - last_downloaded) / elapsed;
	upload_rate = static_cast<double>(total_uploaded - last_uploaded) / elapsed;
	last_downloaded = total_downloaded;
	last_uploaded = total_uploaded;
	last_tick = now;
}

void Session::schedule_tick()
{
	std::weak_ptr<bool> token = alive;
	tick_timer.expires_after(settings.tick_interval);
	tick_timer.async_wait([this, token](const boost::system::error_code& ec) {
		if (token.expired() || ec == boost::asio::error::operation_aborted || stopped) {
			return;
		}
		tick();
		schedule_tick();
	});
}

void Session::check_complete()
{
	if (completed || !piece_store.is_complete()) {
		return;
	}
	completed = true;
	candidates.clear();

	log_info("=== download complete! ===");
	for (auto& entry : peers) {
		entry.second->send_not_interested();
	}

	if (events.on_complete) {
		events.on_complete();
	}
}

void Session::check_exhausted()
{
	if (completed || failed || stopped || !attempted_peers) {
		return;
	}

	if (peers.empty() && connecting == 0 && candidates.empty()) {
		fail("no peers left to download from");
	}
}

void Session::fail(const std::string& reason)
{
	if (failed) {
		return;
	}
	failed = true;
	failure = reason;
	log_error("session failed: " + reason);

	stop();
	if (events.on_failure) {
		events.on_failure(reason);
	}
}

bool Session::is_complete() const
{
	return piece_store.is_complete();
}

std::shared_ptr<PeerConnection> Session::peer(PeerId id) const
{
	auto it = peers.find(id);
	return it == peers.end() ? nullptr : it->second;
}

ProgressSnapshot Session::progress() const
{
	ProgressSnapshot snap;
	snap.verified_pieces = piece_store.verified_count();
	snap.total_pieces = piece_store.get_total_pieces();
	snap.completion = piece_store.completion();
	snap.bytes_left = piece_store.bytes_left();
	snap.downloaded = total_downloaded;
	snap.uploaded = total_uploaded;
	snap.download_rate = download_rate;
	snap.upload_rate = upload_rate;
	snap.peers = peers.size();
	snap.in_flight = piece_scheduler.in_flight();
	snap.endgame = piece_scheduler.in_endgame();
	return snap;
}
