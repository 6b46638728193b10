#ifndef CHUNKSTREAM_PIECE_STORE_HPP
#define CHUNKSTREAM_PIECE_STORE_HPP

#include <storage/digest.hpp>
#include <retrieval/cancellation.hpp>
#include <silicium/error_or.hpp>
#include <boost/cstdint.hpp>
#include <vector>

namespace chunkstream
{
	//! ceiling on the cost per millisecond of latency a caller is willing to
	//! pay. Passed through to the piece reader, which decides how to use it.
	using price_per_ms = boost::uint64_t;

	//! where pieces come from. Calls block the calling thread; they should
	//! return operation_aborted soon after the given scope is cancelled.
	struct piece_reader
	{
		virtual ~piece_reader();
		virtual Si::error_or<bool> has_piece(piece_root const &root, cancellation const &cancelled) = 0;
		virtual Si::error_or<std::vector<byte>> read_piece(piece_root const &root, std::size_t offset,
		                                                   std::size_t length, price_per_ms price,
		                                                   cancellation const &cancelled) = 0;
	};

	struct piece_writer
	{
		virtual ~piece_writer();
		virtual boost::system::error_code write_piece(piece_root const &root, std::vector<byte> const &content) = 0;
	};
}

#endif
