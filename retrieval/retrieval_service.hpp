#ifndef CHUNKSTREAM_RETRIEVAL_SERVICE_HPP
#define CHUNKSTREAM_RETRIEVAL_SERVICE_HPP

#include <retrieval/data_source_cache.hpp>
#include <retrieval/key_resolver.hpp>
#include <retrieval/log_sink.hpp>
#include <retrieval/settings.hpp>

namespace chunkstream
{
	//! Owns the worker pool and the scope every data source lives in. The
	//! piece reader, the key resolver and the log have to outlive the service.
	//! Data sources handed out must not be used after the service is destroyed.
	struct retrieval_service
	{
		retrieval_service(piece_reader &pieces, key_resolver &keys, log_sink &log, retrieval_settings settings);
		~retrieval_service();

		//! the cached data source of the object, built on the first request
		Si::error_or<std::shared_ptr<data_source>> open(object_locator const &locator, price_per_ms price,
		                                                cancellation const &call);

		//! Builds a new data source without looking at the cache. Returns when
		//! the base sector has been fetched and parsed and every chunk fetcher
		//! has been created. The call scope only limits this call, the data
		//! source itself lives in the service scope.
		Si::error_or<std::shared_ptr<data_source>> build_data_source(object_locator const &locator,
		                                                             price_per_ms price, cancellation const &call);

		Si::error_or<std::vector<byte>> download_by_root(piece_root const &root, boost::uint64_t offset,
		                                                 boost::uint64_t length, price_per_ms price,
		                                                 cancellation const &call);

		//! closes every data source of this service; idempotent
		void stop();

		fetch_executor &executor();
		data_source_cache &cache();
		retrieval_settings const &settings() const;

	private:
		retrieval_settings configured;
		piece_reader &pieces;
		key_resolver &keys;
		log_sink &log;
		fetch_executor pool;
		cancellation scope;
		data_source_cache sources;

		Si::error_or<std::shared_ptr<data_source>> assemble_data_source(object_locator const &locator,
		                                                                price_per_ms price, cancellation const &call,
		                                                                cancellation const &source_scope);
	};
}

#endif
