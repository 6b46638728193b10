#include "base_sector.hpp"

namespace chunkstream
{
	Si::error_or<std::vector<byte>> download_base_sector(fetch_executor &executor, piece_reader &pieces,
	                                                     std::size_t piece_size, piece_root const &root,
	                                                     boost::uint64_t offset, boost::uint64_t length,
	                                                     price_per_ms price, cancellation const &call,
	                                                     log_sink &log)
	{
		// The base sector is always uploaded as one piece without redundancy.
		// If it turns out to be encrypted, it is decrypted after the download.
		auto const coder = std::make_shared<passthrough_erasure_coder>(1, 0, piece_size);
		erasure_chunk_fetcher fetcher(executor, pieces, fanout_chunk{root}, coder, content_key(), 0, call);

		Si::error_or<chunk_download> started = fetcher.download(call, price, offset, length);
		if (started.is_error())
		{
			log.error("base sector", "unable to start download", started.error());
			return started.error();
		}
		Si::error_or<std::vector<byte>> downloaded = started.get().get();
		if (downloaded.is_error())
		{
			log.error("base sector", "base sector download did not succeed", downloaded.error());
			return downloaded.error();
		}
		if (downloaded.get().size() < layout_size)
		{
			boost::system::error_code const ec = retrieval_error::insufficient_base_sector_data;
			log.error("base sector", "layout cannot be decoded", ec);
			return ec;
		}
		return downloaded;
	}

	Si::error_or<resolved_base_sector> decrypt_and_parse(std::vector<byte> base_sector, key_resolver &keys,
	                                                     log_sink &log)
	{
		resolved_base_sector resolved;
		if (is_encrypted_base_sector(base_sector))
		{
			Si::error_or<content_key> const file_key = keys.resolve_decryption_key(base_sector);
			if (file_key.is_error())
			{
				log.error("base sector", "unable to decrypt base sector", file_key.error());
				return file_key.error();
			}
			boost::system::error_code const decrypted = keys.decrypt_base_sector(base_sector, file_key.get());
			if (decrypted)
			{
				log.error("base sector", "unable to decrypt base sector", decrypted);
				return decrypted;
			}
			resolved.file_key = file_key.get();
		}
		Si::error_or<parsed_base_sector> parsed = parse_base_sector(base_sector);
		if (parsed.is_error())
		{
			log.error("base sector", "error parsing metadata", parsed.error());
			return parsed.error();
		}
		resolved.parsed = std::move(parsed.get());
		return std::move(resolved);
	}
}
