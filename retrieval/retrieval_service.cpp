#include "retrieval_service.hpp"
#include <retrieval/base_sector.hpp>
#include <boost/asio/error.hpp>
#include <stdexcept>

namespace chunkstream
{
	retrieval_service::retrieval_service(piece_reader &pieces, key_resolver &keys, log_sink &log,
	                                     retrieval_settings settings)
		: configured(settings)
		, pieces(pieces)
		, keys(keys)
		, log(log)
		, pool(settings.worker_threads)
	{
		if (settings.piece_size == 0)
		{
			throw std::invalid_argument("the piece size must not be zero");
		}
		if (settings.worker_threads == 0)
		{
			throw std::invalid_argument("at least one worker thread is required");
		}
	}

	retrieval_service::~retrieval_service()
	{
		stop();
	}

	Si::error_or<std::shared_ptr<data_source>> retrieval_service::open(object_locator const &locator,
	                                                                   price_per_ms price, cancellation const &call)
	{
		return sources.get_or_build(make_data_source_id(locator), [this, &locator, price, &call]
		                            {
			                            return build_data_source(locator, price, call);
			                        });
	}

	Si::error_or<std::shared_ptr<data_source>>
	retrieval_service::build_data_source(object_locator const &locator, price_per_ms price, cancellation const &call)
	{
		if (scope.is_cancelled())
		{
			return boost::system::error_code(boost::asio::error::operation_aborted);
		}

		// The data source outlives the request that created it, so its scope
		// hangs below the service and not below the caller.
		cancellation const source_scope = scope.make_child();
		Si::error_or<std::shared_ptr<data_source>> built = assemble_data_source(locator, price, call, source_scope);
		if (built.is_error())
		{
			source_scope.cancel();
		}
		return built;
	}

	Si::error_or<std::shared_ptr<data_source>> retrieval_service::assemble_data_source(object_locator const &locator,
	                                                                                   price_per_ms price,
	                                                                                   cancellation const &call,
	                                                                                   cancellation const &source_scope)
	{
		if (locator.length == 0)
		{
			boost::system::error_code const ec = retrieval_error::invalid_locator;
			log.error("data source", "unable to parse locator", ec);
			return ec;
		}

		Si::error_or<std::vector<byte>> base_sector =
		    download_by_root(locator.root, locator.offset, locator.length, price, call);
		if (base_sector.is_error())
		{
			log.error("data source", "unable to download base sector", base_sector.error());
			return base_sector.error();
		}

		Si::error_or<resolved_base_sector> resolved = decrypt_and_parse(std::move(base_sector.get()), keys, log);
		if (resolved.is_error())
		{
			return resolved.error();
		}
		parsed_base_sector &parsed = resolved.get().parsed;

		std::vector<std::unique_ptr<chunk_fetcher>> fetchers;
		if (!parsed.fanout.empty())
		{
			Si::error_or<content_key> const fanout_key =
			    keys.derive_fanout_key(parsed.object_layout, resolved.get().file_key);
			if (fanout_key.is_error())
			{
				log.error("data source", "unable to derive encryption key", fanout_key.error());
				return fanout_key.error();
			}

			Si::error_or<std::shared_ptr<erasure_coder const>> const coder = make_passthrough_erasure_coder(
			    parsed.object_layout.fanout_data_pieces, parsed.object_layout.fanout_parity_pieces,
			    configured.piece_size);
			if (coder.is_error())
			{
				log.error("data source", "unable to derive erasure coding settings for fanout", coder.error());
				return coder.error();
			}

			Si::error_or<std::vector<fanout_chunk>> chunks = decode_fanout(parsed.object_layout, parsed.fanout);
			if (chunks.is_error())
			{
				log.error("data source", "error parsing fanout", chunks.error());
				return chunks.error();
			}

			boost::uint64_t const chunk_size = coder.get()->chunk_size();
			boost::uint64_t const expected_chunks =
			    (parsed.object_layout.file_size / chunk_size) + ((parsed.object_layout.file_size % chunk_size) != 0);
			if (chunks.get().size() != expected_chunks)
			{
				boost::system::error_code const ec = retrieval_error::malformed_fanout;
				log.error("data source", "fanout does not cover the file size", ec);
				return ec;
			}

			fetchers.reserve(chunks.get().size());
			for (std::size_t i = 0; i < chunks.get().size(); ++i)
			{
				fetchers.emplace_back(Si::make_unique<erasure_chunk_fetcher>(
				    pool, pieces, std::move(chunks.get()[i]), coder.get(), fanout_key.get(), i, source_scope));
			}
		}
		else if (parsed.payload.size() != parsed.object_layout.file_size)
		{
			boost::system::error_code const ec = retrieval_error::malformed_base_sector;
			log.error("data source", "inline payload does not match the file size", ec);
			return ec;
		}

		return std::make_shared<data_source>(make_data_source_id(locator), parsed.object_layout,
		                                     std::move(parsed.metadata), std::move(parsed.payload),
		                                     std::move(fetchers), configured.piece_size,
		                                     configured.preferred_request_size, source_scope);
	}

	Si::error_or<std::vector<byte>> retrieval_service::download_by_root(piece_root const &root, boost::uint64_t offset,
	                                                                    boost::uint64_t length, price_per_ms price,
	                                                                    cancellation const &call)
	{
		return download_base_sector(pool, pieces, configured.piece_size, root, offset, length, price, call, log);
	}

	void retrieval_service::stop()
	{
		scope.cancel();
		sources.close_all();
	}

	fetch_executor &retrieval_service::executor()
	{
		return pool;
	}

	data_source_cache &retrieval_service::cache()
	{
		return sources;
	}

	retrieval_settings const &retrieval_service::settings() const
	{
		return configured;
	}
}
