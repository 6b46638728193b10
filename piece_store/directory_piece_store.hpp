#ifndef CHUNKSTREAM_DIRECTORY_PIECE_STORE_HPP
#define CHUNKSTREAM_DIRECTORY_PIECE_STORE_HPP

#include "piece_store.hpp"
#include <ventura/absolute_path.hpp>

namespace chunkstream
{
	//! keeps every piece in a file named after the hex digits of its root.
	struct directory_piece_store : piece_reader, piece_writer
	{
		explicit directory_piece_store(ventura::absolute_path root);

		virtual Si::error_or<bool> has_piece(piece_root const &root, cancellation const &cancelled) SILICIUM_OVERRIDE;
		virtual Si::error_or<std::vector<byte>> read_piece(piece_root const &root, std::size_t offset,
		                                                   std::size_t length, price_per_ms price,
		                                                   cancellation const &cancelled) SILICIUM_OVERRIDE;
		virtual boost::system::error_code write_piece(piece_root const &root,
		                                              std::vector<byte> const &content) SILICIUM_OVERRIDE;

	private:
		ventura::absolute_path root;

		ventura::absolute_path piece_file(piece_root const &piece) const;
	};
}

#endif
