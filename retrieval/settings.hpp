#ifndef CHUNKSTREAM_SETTINGS_HPP
#define CHUNKSTREAM_SETTINGS_HPP

#include <cstddef>

namespace chunkstream
{
	std::size_t const default_piece_size = 1 << 22;

	//! suggested to callers as the size of their reads
	std::size_t const default_preferred_request_size = 1 << 18;

	struct retrieval_settings
	{
		//! the fixed size of every stored piece
		std::size_t piece_size;
		std::size_t preferred_request_size;
		std::size_t worker_threads;

		retrieval_settings()
			: piece_size(default_piece_size)
			, preferred_request_size(default_preferred_request_size)
			, worker_threads(8)
		{
		}
	};

	struct publish_settings
	{
		std::size_t piece_size;
		std::size_t data_pieces;
		std::size_t parity_pieces;

		publish_settings()
			: piece_size(default_piece_size)
			, data_pieces(1)
			, parity_pieces(0)
		{
		}
	};
}

#endif
