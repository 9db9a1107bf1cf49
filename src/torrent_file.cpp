#include <torrent_file.hpp>
#include <errors.hpp>
#include <utils.hpp>
#include <bencode.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <variant>

static bencode::data decode_torrent(const std::string& file_data)
{
    try {
        return bencode::decode(file_data);
    } catch (const std::exception& e) {
        throw MetainfoError(std::string("invalid bencode: ") + e.what());
    }
}

TorrentMetadata parse_torrent(const std::string& file_data)
{
    bencode::data data = decode_torrent(file_data);

    try {
        auto root_dict = std::get<bencode::dict>(data);

        std::string announce_url;
        if (root_dict.count("announce")) {
            announce_url = std::get<bencode::string>(root_dict["announce"]);
        }

        if (!root_dict.count("info")) {
            throw MetainfoError("No info dictionary in torrent file");
        }
        auto info = std::get<bencode::dict>(root_dict["info"]);

        /* Name of file to be downloaded */
        if (!info.count("name")) {
            throw MetainfoError("No file name in torrent");
        }
        std::string file_name = std::get<bencode::string>(info["name"]);

        /* Total length; multi-file torrents carry "files" instead */
        if (!info.count("length")) {
            throw MetainfoError("No file length in torrent (multi-file torrents are not supported)");
        }
        int64_t file_length = std::get<bencode::integer>(info["length"]);

        /* Size of each piece in bytes */
        if (!info.count("piece length")) {
            throw MetainfoError("No piece length in torrent");
        }
        int64_t piece_length = std::get<bencode::integer>(info["piece length"]);

        /* SHA1 hashes of pieces for verification */
        if (!info.count("pieces")) {
            throw MetainfoError("No pieces in torrent");
        }
        std::string pieces_str = std::get<bencode::string>(info["pieces"]);
        if (pieces_str.size() % SHA1_DIGEST_SIZE != 0) {
            throw MetainfoError("pieces string is not a multiple of 20 bytes");
        }

        std::vector<std::string> piece_hashes;
        for (size_t i = 0; i < pieces_str.size(); i += SHA1_DIGEST_SIZE) {
            piece_hashes.push_back(pieces_str.substr(i, SHA1_DIGEST_SIZE));
        }

        std::string info_hash = sha1_hash(bencode::encode(info));

        return TorrentMetadata(file_name, file_length, piece_length,
                               std::move(piece_hashes), info_hash, announce_url);
    } catch (const std::bad_variant_access&) {
        throw MetainfoError("torrent field has the wrong bencode type");
    }
}

TorrentMetadata load_torrent_file(const std::string& torrent_filename)
{
    std::ifstream file(torrent_filename, std::ios::binary);
    if (!file) {
        throw MetainfoError("Could not open torrent file: " + torrent_filename);
    }

    std::string file_data(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );

    if (file.bad()) {
        throw MetainfoError("Error reading torrent file");
    }

    return parse_torrent(file_data);
}
