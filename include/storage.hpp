#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <boost/system/error_code.hpp>
#include <cstdint>
#include <mutex>
#include <string>

/*
 * Where verified data ends up. The engine only speaks in (piece, offset)
 * coordinates; mapping them onto files is the sink's business.
 */
class StorageSink {
public:
	virtual ~StorageSink() = default;

	virtual boost::system::error_code write_block(int piece_index, int offset,
			const std::string& data) = 0;
	virtual boost::system::error_code read_block(int piece_index, int offset,
			int length, std::string& out) = 0;
};

/* Single file, piece i starts at i * piece_length */
class FileStorage : public StorageSink {
private:
	std::string file_path;
	int64_t piece_length;
	std::mutex file_mutex;

public:
	FileStorage(const std::string& path, int64_t piece_length);

	boost::system::error_code write_block(int piece_index, int offset,
			const std::string& data) override;
	boost::system::error_code read_block(int piece_index, int offset,
			int length, std::string& out) override;

	const std::string& path() const { return file_path; }
};

#endif /* storage.hpp */
