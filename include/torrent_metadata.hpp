#ifndef TORRENT_METADATA_HPP
#define TORRENT_METADATA_HPP

#include <string>
#include <vector>
#include <cstdint>

/*
 * Pre-parsed metainfo: the layout of the pieces and their expected hashes.
 * Only single-file torrents are described here.
 */
class TorrentMetadata {
public:
    std::string announce_url;
    std::string info_hash;
    std::string file_name;
    int64_t file_length;
    int64_t piece_length;
    std::vector<std::string> piece_hashes;
    int num_pieces;

    /* throws MetainfoError if the hashes do not cover the file exactly */
    TorrentMetadata(std::string name,
                    int64_t length,
                    int64_t piece_len,
                    std::vector<std::string> hashes,
                    std::string hash = "",
                    std::string announce = "");

    int64_t piece_size(int index) const;
    int64_t last_piece_length() const;
    void print_info() const;
};

#endif /* torrent_metadata.hpp */
