#ifndef BLOCK_INFO_HPP
#define BLOCK_INFO_HPP

#include <cstdint>
#include <tuple>

/* Stable identifier handed out by the session, never reused while it runs */
using PeerId = uint32_t;

/* A sub-range of a piece, the unit of request and transfer */
struct BlockInfo {
	int piece = 0;
	int offset = 0;
	int length = 0;

	BlockInfo() = default;
	BlockInfo(int piece, int offset, int length)
		: piece(piece), offset(offset), length(length) {}
};

/* Blocks are keyed by (piece, offset), the length follows from the layout */
inline bool operator<(const BlockInfo& a, const BlockInfo& b)
{
	return std::tie(a.piece, a.offset) < std::tie(b.piece, b.offset);
}

inline bool operator==(const BlockInfo& a, const BlockInfo& b)
{
	return a.piece == b.piece && a.offset == b.offset;
}

inline bool operator!=(const BlockInfo& a, const BlockInfo& b)
{
	return !(a == b);
}

#endif /* block_info.hpp */
