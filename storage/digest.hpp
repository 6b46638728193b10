#ifndef CHUNKSTREAM_DIGEST_HPP
#define CHUNKSTREAM_DIGEST_HPP

#include <storage/sha256.hpp>
#include <ostream>
#include <string>

namespace chunkstream
{
	//! content hash of one stored piece. A piece is addressed by nothing else.
	using piece_root = sha256_digest;

	inline std::string format_digest(piece_root const &value)
	{
		std::string formatted;
		append_hex(value.bytes.begin(), value.bytes.end(), formatted);
		return formatted;
	}

	inline std::ostream &operator << (std::ostream &out, piece_root const &value)
	{
		return out << format_digest(value);
	}
}

#endif
