#include <torrent_metadata.hpp>
#include <errors.hpp>
#include <utils.hpp>
#include <iostream>
#include <utility>

TorrentMetadata::TorrentMetadata(std::string name,
                                 int64_t length,
                                 int64_t piece_len,
                                 std::vector<std::string> hashes,
                                 std::string hash,
                                 std::string announce)
    : announce_url(std::move(announce)),
      info_hash(std::move(hash)),
      file_name(std::move(name)),
      file_length(length),
      piece_length(piece_len),
      piece_hashes(std::move(hashes)),
      num_pieces(static_cast<int>(piece_hashes.size()))
{
    if (file_length <= 0) {
        throw MetainfoError("file length must be positive");
    }
    if (piece_length <= 0) {
        throw MetainfoError("piece length must be positive");
    }

    int64_t expected = (file_length + piece_length - 1) / piece_length;
    if (expected != num_pieces) {
        throw MetainfoError("torrent lists " + std::to_string(num_pieces)
                            + " piece hashes, file needs " + std::to_string(expected));
    }

    for (const std::string& h : piece_hashes) {
        if (h.size() != SHA1_DIGEST_SIZE) {
            throw MetainfoError("piece hash is not 20 bytes");
        }
    }
}

int64_t TorrentMetadata::piece_size(int index) const
{
    if (index < 0 || index >= num_pieces) {
        return 0;
    }
    if (index == num_pieces - 1) {
        return last_piece_length();
    }
    return piece_length;
}

int64_t TorrentMetadata::last_piece_length() const
{
    return file_length - static_cast<int64_t>(num_pieces - 1) * piece_length;
}

void TorrentMetadata::print_info() const {
    std::cout << "=== torrent metadata ===" << std::endl;
    std::cout << "File name: " << file_name << std::endl;
    std::cout << "File size: " << file_length << " bytes" << std::endl;
    std::cout << "Piece length: " << piece_length << " bytes" << std::endl;
    std::cout << "Number of pieces: " << num_pieces << std::endl;
    if (!announce_url.empty()) {
        std::cout << "Tracker URL: " << announce_url << std::endl;
    }
    std::cout << "Info hash (hex): " << hash_to_hex(info_hash) << std::endl;
}
