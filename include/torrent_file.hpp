#ifndef TORRENT_FILE_HPP
#define TORRENT_FILE_HPP

#include <string>
#include <torrent_metadata.hpp>

/* Decode a single-file .torrent; throws MetainfoError */
TorrentMetadata parse_torrent(const std::string& file_data);
TorrentMetadata load_torrent_file(const std::string& torrent_filename);

#endif /* torrent_file.hpp */
