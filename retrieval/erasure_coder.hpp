#ifndef CHUNKSTREAM_ERASURE_CODER_HPP
#define CHUNKSTREAM_ERASURE_CODER_HPP

#include <storage/hexadecimal.hpp>
#include <silicium/config.hpp>
#include <silicium/error_or.hpp>
#include <boost/cstdint.hpp>
#include <memory>
#include <vector>

namespace chunkstream
{
	//! a byte range of one encoded piece of a chunk
	struct piece_range
	{
		std::size_t piece_index;
		std::size_t offset;
		std::size_t length;
	};

	inline bool operator==(piece_range const &left, piece_range const &right)
	{
		return (left.piece_index == right.piece_index) && (left.offset == right.offset) &&
		       (left.length == right.length);
	}

	//! A chunk consists of data_pieces() * piece_size() addressable bytes
	//! spread over total_pieces() encoded pieces of piece_size() bytes each.
	//! Parity pieces add redundancy, never addressable bytes.
	struct erasure_coder
	{
		virtual ~erasure_coder();

		virtual std::size_t data_pieces() const = 0;
		virtual std::size_t parity_pieces() const = 0;
		virtual std::size_t piece_size() const = 0;

		std::size_t total_pieces() const
		{
			return data_pieces() + parity_pieces();
		}

		boost::uint64_t chunk_size() const
		{
			return static_cast<boost::uint64_t>(data_pieces()) * piece_size();
		}

		//! decides which piece ranges are fetched to recover [offset, offset + length) of
		//! the chunk. usable[i] is false for pieces known to be unavailable.
		virtual Si::error_or<std::vector<piece_range>> plan_recovery(boost::uint64_t offset, boost::uint64_t length,
		                                                             std::vector<bool> const &usable) const = 0;

		//! fetched[i] contains the bytes of plan[i]
		virtual Si::error_or<std::vector<byte>> recover(std::vector<piece_range> const &plan,
		                                                std::vector<std::vector<byte>> const &fetched,
		                                                boost::uint64_t offset, boost::uint64_t length) const = 0;

		//! splits a chunk of at most chunk_size() bytes into total_pieces() pieces
		virtual Si::error_or<std::vector<std::vector<byte>>> encode(std::vector<byte> const &chunk) const = 0;
	};

	//! The data pieces hold the chunk verbatim, one after the other. With one
	//! data piece every parity piece is a replica, so any piece can serve a
	//! read. With several data pieces all touched data pieces must be present;
	//! recovering from parity needs a real erasure code and is not done here.
	struct passthrough_erasure_coder : erasure_coder
	{
		passthrough_erasure_coder(std::size_t data_pieces, std::size_t parity_pieces, std::size_t piece_size);

		virtual std::size_t data_pieces() const SILICIUM_OVERRIDE;
		virtual std::size_t parity_pieces() const SILICIUM_OVERRIDE;
		virtual std::size_t piece_size() const SILICIUM_OVERRIDE;
		virtual Si::error_or<std::vector<piece_range>> plan_recovery(boost::uint64_t offset, boost::uint64_t length,
		                                                             std::vector<bool> const &usable) const SILICIUM_OVERRIDE;
		virtual Si::error_or<std::vector<byte>> recover(std::vector<piece_range> const &plan,
		                                                std::vector<std::vector<byte>> const &fetched,
		                                                boost::uint64_t offset,
		                                                boost::uint64_t length) const SILICIUM_OVERRIDE;
		virtual Si::error_or<std::vector<std::vector<byte>>> encode(std::vector<byte> const &chunk) const SILICIUM_OVERRIDE;

	private:
		std::size_t data;
		std::size_t parity;
		std::size_t size_of_piece;
	};

	//! fails with unsupported_redundancy for zero data pieces or a zero piece size
	Si::error_or<std::shared_ptr<erasure_coder const>> make_passthrough_erasure_coder(std::size_t data_pieces,
	                                                                                   std::size_t parity_pieces,
	                                                                                   std::size_t piece_size);
}

#endif
