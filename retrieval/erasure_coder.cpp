#include "erasure_coder.hpp"
#include <retrieval/retrieval_error.hpp>
#include <boost/concept_check.hpp>
#include <algorithm>
#include <stdexcept>

namespace chunkstream
{
	erasure_coder::~erasure_coder()
	{
	}

	passthrough_erasure_coder::passthrough_erasure_coder(std::size_t data_pieces, std::size_t parity_pieces,
	                                                     std::size_t piece_size)
		: data(data_pieces)
		, parity(parity_pieces)
		, size_of_piece(piece_size)
	{
	}

	std::size_t passthrough_erasure_coder::data_pieces() const
	{
		return data;
	}

	std::size_t passthrough_erasure_coder::parity_pieces() const
	{
		return parity;
	}

	std::size_t passthrough_erasure_coder::piece_size() const
	{
		return size_of_piece;
	}

	Si::error_or<std::vector<piece_range>> passthrough_erasure_coder::plan_recovery(boost::uint64_t offset,
	                                                                                 boost::uint64_t length,
	                                                                                 std::vector<bool> const &usable) const
	{
		if ((length > chunk_size()) || (offset > (chunk_size() - length)))
		{
			return boost::system::error_code(retrieval_error::range_exceeds_chunk);
		}
		if (usable.size() != total_pieces())
		{
			throw std::logic_error("expected one usability flag per piece");
		}
		std::vector<piece_range> plan;
		if (length == 0)
		{
			return std::move(plan);
		}
		if (data == 1)
		{
			auto const replica = std::find(usable.begin(), usable.end(), true);
			if (replica == usable.end())
			{
				return boost::system::error_code(retrieval_error::insufficient_pieces);
			}
			plan.push_back(piece_range{static_cast<std::size_t>(replica - usable.begin()),
			                           static_cast<std::size_t>(offset), static_cast<std::size_t>(length)});
			return std::move(plan);
		}
		boost::uint64_t position = offset;
		boost::uint64_t const end = offset + length;
		while (position < end)
		{
			std::size_t const index = static_cast<std::size_t>(position / size_of_piece);
			if (!usable[index])
			{
				return boost::system::error_code(retrieval_error::insufficient_pieces);
			}
			std::size_t const offset_in_piece = static_cast<std::size_t>(position % size_of_piece);
			std::size_t const piece_length =
			    static_cast<std::size_t>(std::min<boost::uint64_t>(size_of_piece - offset_in_piece, end - position));
			plan.push_back(piece_range{index, offset_in_piece, piece_length});
			position += piece_length;
		}
		return std::move(plan);
	}

	Si::error_or<std::vector<byte>> passthrough_erasure_coder::recover(std::vector<piece_range> const &plan,
	                                                                   std::vector<std::vector<byte>> const &fetched,
	                                                                   boost::uint64_t offset,
	                                                                   boost::uint64_t length) const
	{
		boost::ignore_unused_variable_warning(offset);
		if (plan.size() != fetched.size())
		{
			throw std::logic_error("expected the bytes of every planned piece range");
		}
		std::vector<byte> recovered;
		recovered.reserve(static_cast<std::size_t>(length));
		for (std::size_t i = 0; i < plan.size(); ++i)
		{
			if (fetched[i].size() != plan[i].length)
			{
				return boost::system::error_code(retrieval_error::short_read);
			}
			recovered.insert(recovered.end(), fetched[i].begin(), fetched[i].end());
		}
		if (recovered.size() != length)
		{
			return boost::system::error_code(retrieval_error::short_read);
		}
		return std::move(recovered);
	}

	Si::error_or<std::vector<std::vector<byte>>> passthrough_erasure_coder::encode(std::vector<byte> const &chunk) const
	{
		if (chunk.size() > chunk_size())
		{
			return boost::system::error_code(retrieval_error::range_exceeds_chunk);
		}
		if ((data > 1) && (parity > 0))
		{
			return boost::system::error_code(retrieval_error::unsupported_redundancy);
		}
		std::vector<std::vector<byte>> pieces;
		for (std::size_t i = 0; i < data; ++i)
		{
			std::size_t const begin = std::min(chunk.size(), i * size_of_piece);
			std::size_t const end = std::min(chunk.size(), begin + size_of_piece);
			std::vector<byte> piece(chunk.begin() + begin, chunk.begin() + end);
			piece.resize(size_of_piece, 0);
			pieces.emplace_back(std::move(piece));
		}
		for (std::size_t i = 0; i < parity; ++i)
		{
			// only reachable with one data piece: parity pieces are replicas
			pieces.push_back(pieces.front());
		}
		return std::move(pieces);
	}

	Si::error_or<std::shared_ptr<erasure_coder const>> make_passthrough_erasure_coder(std::size_t data_pieces,
	                                                                                   std::size_t parity_pieces,
	                                                                                   std::size_t piece_size)
	{
		if ((data_pieces == 0) || (piece_size == 0))
		{
			return boost::system::error_code(retrieval_error::unsupported_redundancy);
		}
		return std::shared_ptr<erasure_coder const>(
		    std::make_shared<passthrough_erasure_coder>(data_pieces, parity_pieces, piece_size));
	}
}
