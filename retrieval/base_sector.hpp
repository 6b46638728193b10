#ifndef CHUNKSTREAM_BASE_SECTOR_HPP
#define CHUNKSTREAM_BASE_SECTOR_HPP

#include <retrieval/chunk_fetcher.hpp>
#include <retrieval/key_resolver.hpp>
#include <retrieval/log_sink.hpp>

namespace chunkstream
{
	//! Downloads [offset, offset + length) of the piece with the given root
	//! through a single piece fetcher without redundancy or encryption. The
	//! fetcher only lives for this call. Fails with
	//! insufficient_base_sector_data if less than a layout was fetched.
	Si::error_or<std::vector<byte>> download_base_sector(fetch_executor &executor, piece_reader &pieces,
	                                                     std::size_t piece_size, piece_root const &root,
	                                                     boost::uint64_t offset, boost::uint64_t length,
	                                                     price_per_ms price, cancellation const &call,
	                                                     log_sink &log);

	struct resolved_base_sector
	{
		parsed_base_sector parsed;
		//! the null key unless the base sector was encrypted
		content_key file_key;
	};

	//! decrypts the base sector if it is encrypted, then parses it
	Si::error_or<resolved_base_sector> decrypt_and_parse(std::vector<byte> base_sector, key_resolver &keys,
	                                                     log_sink &log);
}

#endif
