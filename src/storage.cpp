#include <storage.hpp>
#include <boost/system/error_code.hpp>
#include <fstream>
#include <vector>

namespace errc = boost::system::errc;

FileStorage::FileStorage(const std::string& path, int64_t piece_length)
	: file_path(path), piece_length(piece_length)
{
}

boost::system::error_code FileStorage::write_block(int piece_index, int offset,
		const std::string& data)
{
	std::lock_guard<std::mutex> lock(file_mutex);
	std::fstream file(file_path, std::ios::out | std::ios::in | std::ios::binary);
	if (!file.is_open()) {
		file.open(file_path, std::ios::out | std::ios::binary); /* Create file */
		file.close();
		file.open(file_path, std::ios::out | std::ios::in | std::ios::binary);
	}

	if (!file.is_open()) {
		return errc::make_error_code(errc::permission_denied);
	}

	file.seekp(static_cast<std::streamoff>(piece_index) * piece_length + offset);
	file.write(data.data(), data.size());
	file.flush();

	if (!file) {
		return errc::make_error_code(errc::io_error);
	}
	return boost::system::error_code();
}

boost::system::error_code FileStorage::read_block(int piece_index, int offset,
		int length, std::string& out)
{
	std::lock_guard<std::mutex> lock(file_mutex);
	std::ifstream file(file_path, std::ios::binary);
	if (!file.good()) {
		return errc::make_error_code(errc::no_such_file_or_directory);
	}

	file.seekg(static_cast<std::streamoff>(piece_index) * piece_length + offset);
	std::vector<char> buf(length);
	file.read(buf.data(), length);
	if (file.gcount() != length) {
		/* short read, the file was never written this far */
		return errc::make_error_code(errc::io_error);
	}

	out.assign(buf.begin(), buf.end());
	return boost::system::error_code();
}
