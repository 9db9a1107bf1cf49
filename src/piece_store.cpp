#include <piece_store.hpp>
#include <errors.hpp>
#include <log.hpp>
#include <utils.hpp>
#include <algorithm>
#include <set>
#include <stdexcept>

namespace errc = boost::system::errc;

PieceStore::PieceStore(const TorrentMetadata& meta, StorageSink& sink,
		int block_size, int max_write_retries)
	: meta(meta), sink(sink), block_len(block_size), max_write_retries(max_write_retries)
{
	if (block_len <= 0) {
		throw std::invalid_argument("block size must be positive");
	}

	pieces.resize(meta.num_pieces);
	for (int i = 0; i < meta.num_pieces; i++) {
		pieces[i].blocks.assign(num_blocks(i), false);
		pieces[i].sources.assign(num_blocks(i), 0);
	}
}

bool PieceStore::valid_piece(int index) const
{
	return index >= 0 && index < meta.num_pieces;
}

int PieceStore::num_blocks(int piece_index) const
{
	int64_t size = meta.piece_size(piece_index);
	return static_cast<int>((size + block_len - 1) / block_len);
}

int PieceStore::block_length(int piece_index, int block) const
{
	int64_t size = meta.piece_size(piece_index);
	int64_t begin = static_cast<int64_t>(block) * block_len;
	if (begin >= size) {
		return 0;
	}
	return static_cast<int>(std::min<int64_t>(block_len, size - begin));
}

SubmitResult PieceStore::submit_block(int piece_index, int offset,
		const std::string& data, PeerId from)
{
	SubmitResult result;
	piece_handler handler;
	{
		std::lock_guard<std::mutex> lock(state_mutex);
		result = store_block(piece_index, offset, data, from);
		handler = on_verified;
	}

	/* outside the lock, the handler usually queries the store */
	if (result == SubmitResult::piece_verified && handler) {
		handler(piece_index);
	}
	return result;
}

SubmitResult PieceStore::store_block(int piece_index, int offset,
		const std::string& data, PeerId from)
{
	if (!valid_piece(piece_index) || offset < 0 || offset % block_len != 0) {
		return SubmitResult::rejected;
	}

	int block = offset / block_len;
	if (block >= num_blocks(piece_index)
			|| static_cast<int>(data.size()) != block_length(piece_index, block)) {
		return SubmitResult::rejected;
	}

	Piece& piece = pieces[piece_index];
	if (piece.state == PieceState::verified || piece.blocks[block]) {
		return SubmitResult::duplicate;
	}

	if (piece.buffer.empty()) {
		piece.buffer.resize(meta.piece_size(piece_index));
	}
	piece.buffer.replace(offset, data.size(), data);
	piece.blocks[block] = true;
	piece.sources[block] = from;
	piece.received++;
	piece.state = PieceState::in_progress;

	if (piece.received < num_blocks(piece_index)) {
		return SubmitResult::accepted;
	}
	return finish_piece(piece_index, piece);
}

SubmitResult PieceStore::finish_piece(int piece_index, Piece& piece)
{
	if (sha1_hash(piece.buffer) != meta.piece_hashes[piece_index]) {
		/* one point per distinct contributor, a bad piece does not say who lied */
		std::set<PeerId> contributors(piece.sources.begin(), piece.sources.end());
		for (PeerId peer : contributors) {
			penalties[peer]++;
		}
		failures++;

		log_warning("piece " + std::to_string(piece_index) + " failed verification, "
				+ std::to_string(contributors.size()) + " peer(s) penalized");
		reset_piece(piece);
		return SubmitResult::verification_failed;
	}

	try {
		flush_piece(piece_index, piece);
	} catch (const PersistenceError&) {
		reset_piece(piece);
		throw;
	}

	piece.state = PieceState::verified;
	std::string().swap(piece.buffer);
	verified++;

	log_debug("piece " + std::to_string(piece_index) + " verified");
	return SubmitResult::piece_verified;
}

void PieceStore::reset_piece(Piece& piece)
{
	std::fill(piece.blocks.begin(), piece.blocks.end(), false);
	std::fill(piece.sources.begin(), piece.sources.end(), 0);
	std::string().swap(piece.buffer);
	piece.received = 0;
	piece.state = PieceState::missing;
}

void PieceStore::flush_piece(int piece_index, const Piece& piece)
{
	boost::system::error_code ec;
	for (int attempt = 0; attempt <= max_write_retries; attempt++) {
		ec = sink.write_block(piece_index, 0, piece.buffer);
		if (!ec) {
			return;
		}
		log_warning("write of piece " + std::to_string(piece_index) + " failed (attempt "
				+ std::to_string(attempt + 1) + "): " + ec.message());
	}

	throw PersistenceError("could not write piece " + std::to_string(piece_index)
			+ ": " + ec.message());
}

int PieceStore::check_existing()
{
	std::lock_guard<std::mutex> lock(state_mutex);

	int good = 0;
	for (int i = 0; i < meta.num_pieces; i++) {
		if (pieces[i].state == PieceState::verified) {
			good++;
			continue;
		}

		std::string data;
		boost::system::error_code ec = sink.read_block(i, 0,
				static_cast<int>(meta.piece_size(i)), data);
		if (ec || sha1_hash(data) != meta.piece_hashes[i]) {
			continue;
		}

		reset_piece(pieces[i]);
		std::fill(pieces[i].blocks.begin(), pieces[i].blocks.end(), true);
		pieces[i].received = num_blocks(i);
		pieces[i].state = PieceState::verified;
		verified++;
		good++;
	}

	log_info("have " + std::to_string(verified) + " / " + std::to_string(meta.num_pieces)
			+ " pieces on disk");
	return good;
}

boost::system::error_code PieceStore::read_block(int piece_index, int offset,
		int length, std::string& out)
{
	{
		std::lock_guard<std::mutex> lock(state_mutex);
		if (!valid_piece(piece_index) || pieces[piece_index].state != PieceState::verified) {
			return errc::make_error_code(errc::resource_unavailable_try_again);
		}
	}

	if (offset < 0 || length <= 0 || offset + static_cast<int64_t>(length) > meta.piece_size(piece_index)) {
		return errc::make_error_code(errc::invalid_argument);
	}
	return sink.read_block(piece_index, offset, length, out);
}

void PieceStore::set_on_piece_verified(piece_handler handler)
{
	std::lock_guard<std::mutex> lock(state_mutex);
	on_verified = std::move(handler);
}

bool PieceStore::have_piece(int index) const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	return valid_piece(index) && pieces[index].state == PieceState::verified;
}

bool PieceStore::have_block(int piece_index, int offset) const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	if (!valid_piece(piece_index) || offset < 0) {
		return false;
	}
	size_t block = offset / block_len;
	return block < pieces[piece_index].blocks.size() && pieces[piece_index].blocks[block];
}

PieceState PieceStore::piece_state(int index) const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	if (!valid_piece(index)) {
		return PieceState::missing;
	}
	return pieces[index].state;
}

std::vector<bool> PieceStore::block_bitmap(int index) const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	if (!valid_piece(index)) {
		return {};
	}
	return pieces[index].blocks;
}

std::vector<bool> PieceStore::get_bitfield() const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	std::vector<bool> bits(meta.num_pieces, false);
	for (int i = 0; i < meta.num_pieces; i++) {
		bits[i] = pieces[i].state == PieceState::verified;
	}
	return bits;
}

int PieceStore::get_total_pieces() const
{
	return meta.num_pieces;
}

int PieceStore::verified_count() const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	return verified;
}

bool PieceStore::is_complete() const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	return verified == meta.num_pieces;
}

int64_t PieceStore::bytes_verified() const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	int64_t total = 0;
	for (int i = 0; i < meta.num_pieces; i++) {
		if (pieces[i].state == PieceState::verified) {
			total += meta.piece_size(i);
		}
	}
	return total;
}

int64_t PieceStore::bytes_left() const
{
	return meta.file_length - bytes_verified();
}

double PieceStore::completion() const
{
	return 100.0 * static_cast<double>(bytes_verified()) / static_cast<double>(meta.file_length);
}

int PieceStore::penalty(PeerId peer) const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	auto it = penalties.find(peer);
	return it == penalties.end() ? 0 : it->second;
}

int PieceStore::verification_failures() const
{
	std::lock_guard<std::mutex> lock(state_mutex);
	return failures;
}
