#include <gtest/gtest.h>
#include <errors.hpp>
#include <torrent_metadata.hpp>

static std::vector<std::string> fake_hashes(int n)
{
	return std::vector<std::string>(n, std::string(20, 'h'));
}

TEST(TorrentMetadataTest, PieceLayout)
{
	TorrentMetadata meta("file.bin", 100000, 32768, fake_hashes(4));

	EXPECT_EQ(meta.num_pieces, 4);
	EXPECT_EQ(meta.piece_size(0), 32768);
	EXPECT_EQ(meta.piece_size(3), 100000 - 3 * 32768);
	EXPECT_EQ(meta.last_piece_length(), 100000 - 3 * 32768);
	EXPECT_EQ(meta.piece_size(4), 0);
	EXPECT_EQ(meta.piece_size(-1), 0);
}

TEST(TorrentMetadataTest, ExactMultipleHasFullLastPiece)
{
	TorrentMetadata meta("file.bin", 65536, 16384, fake_hashes(4));
	EXPECT_EQ(meta.last_piece_length(), 16384);
}

TEST(TorrentMetadataTest, HashCountMustCoverFile)
{
	EXPECT_THROW(TorrentMetadata("file.bin", 100000, 32768, fake_hashes(3)), MetainfoError);
	EXPECT_THROW(TorrentMetadata("file.bin", 100000, 32768, fake_hashes(5)), MetainfoError);
}

TEST(TorrentMetadataTest, RejectsBadSizes)
{
	EXPECT_THROW(TorrentMetadata("file.bin", 0, 32768, fake_hashes(0)), MetainfoError);
	EXPECT_THROW(TorrentMetadata("file.bin", 100, 0, fake_hashes(1)), MetainfoError);
}

TEST(TorrentMetadataTest, RejectsShortDigest)
{
	std::vector<std::string> hashes = { std::string(19, 'h') };
	EXPECT_THROW(TorrentMetadata("file.bin", 100, 100, hashes), MetainfoError);
}
