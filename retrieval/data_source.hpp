#ifndef CHUNKSTREAM_DATA_SOURCE_HPP
#define CHUNKSTREAM_DATA_SOURCE_HPP

#include <retrieval/chunk_fetcher.hpp>
#include <retrieval/layout.hpp>
#include <retrieval/locator.hpp>
#include <memory>

namespace chunkstream
{
	using read_response = completion<std::vector<byte>>;

	//! A streamable object. Small objects keep their content in memory, large
	//! objects keep one chunk fetcher per chunk of the fanout so that seeking
	//! does not pay for setting up the download of a chunk.
	//!
	//! Data sources are cached and shared between callers, so the scope they
	//! own must not be the scope of any single caller. Everything except
	//! close() is read-only after construction.
	struct data_source
	{
		data_source(data_source_id id, layout object_layout, object_metadata metadata, std::vector<byte> payload,
		            std::vector<std::unique_ptr<chunk_fetcher>> fetchers, std::size_t piece_size,
		            std::size_t preferred_request_size, cancellation scope);
		~data_source();

		data_source_id const &id() const;
		boost::uint64_t total_size() const;
		std::size_t preferred_request_size() const;
		object_metadata const &metadata() const;
		layout const &object_layout() const;
		std::size_t chunk_count() const;

		//! cancels every download of this data source, including the ones in progress
		void close();
		bool is_closed() const;

		//! The response carries exactly length bytes or an error. Ranges
		//! beyond total_size() are rejected before anything is fetched. The
		//! call scope limits this call only.
		read_response read(cancellation const &call, boost::uint64_t offset, boost::uint64_t length,
		                   price_per_ms price);

	private:
		data_source_id source_id;
		layout source_layout;
		object_metadata source_metadata;
		std::vector<byte> payload;
		std::vector<std::unique_ptr<chunk_fetcher>> fetchers;
		boost::uint64_t chunk_size;
		std::size_t request_size;
		cancellation scope;

		read_response read_fanout(cancellation const &call, boost::uint64_t offset, boost::uint64_t length,
		                          price_per_ms price);
	};
}

#endif
