#ifndef PIECE_STORE_HPP
#define PIECE_STORE_HPP

#include <block_info.hpp>
#include <storage.hpp>
#include <torrent_metadata.hpp>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/* a piece failing its hash check goes straight back to missing */
enum class PieceState {
	missing,
	in_progress,
	verified
};

enum class SubmitResult {
	accepted,            /* stored, piece still incomplete */
	duplicate,           /* already had the block or the whole piece */
	piece_verified,      /* completed the piece and the hash matched */
	verification_failed, /* completed the piece but the hash did not match */
	rejected             /* block does not fit the piece layout */
};

/*
 * Per-piece block bitmaps and buffers. A piece only becomes verified once
 * every block arrived and the assembled bytes hash to the expected digest,
 * after which it is flushed to the sink and its buffer released. On a hash
 * mismatch every block is dropped and the contributing peers are penalized.
 *
 * All mutation happens under one mutex, so at most one verification runs at
 * a time.
 */
class PieceStore {
public:
	using piece_handler = std::function<void(int)>;

	PieceStore(const TorrentMetadata& meta, StorageSink& sink,
			int block_size = 16384, int max_write_retries = 3);

	/* throws PersistenceError once the sink failed 1 + max_write_retries times */
	SubmitResult submit_block(int piece_index, int offset, const std::string& data, PeerId from);

	/* Verify what the sink already holds; returns the number of good pieces */
	int check_existing();

	/* Serve a block of a verified piece back out of the sink */
	boost::system::error_code read_block(int piece_index, int offset, int length, std::string& out);

	void set_on_piece_verified(piece_handler handler);

	bool have_piece(int index) const;
	bool have_block(int piece_index, int offset) const;
	PieceState piece_state(int index) const;
	std::vector<bool> block_bitmap(int index) const;
	std::vector<bool> get_bitfield() const;

	int num_blocks(int piece_index) const;
	int block_length(int piece_index, int block) const;
	int block_size() const { return block_len; }

	int get_total_pieces() const;
	int verified_count() const;
	bool is_complete() const;
	int64_t bytes_left() const;
	int64_t bytes_verified() const;
	double completion() const;

	int penalty(PeerId peer) const;
	int verification_failures() const;

	const TorrentMetadata& metadata() const { return meta; }

private:
	struct Piece {
		PieceState state = PieceState::missing;
		std::vector<bool> blocks;
		std::vector<PeerId> sources;
		std::string buffer;
		int received = 0;
	};

	TorrentMetadata meta;
	StorageSink& sink;
	int block_len;
	int max_write_retries;

	std::vector<Piece> pieces;
	std::map<PeerId, int> penalties;
	int verified = 0;
	int failures = 0;
	piece_handler on_verified;
	mutable std::mutex state_mutex;

	SubmitResult store_block(int piece_index, int offset, const std::string& data, PeerId from);
	SubmitResult finish_piece(int piece_index, Piece& piece);
	void reset_piece(Piece& piece);
	void flush_piece(int piece_index, const Piece& piece);
	bool valid_piece(int index) const;
};

#endif /* piece_store.hpp */
