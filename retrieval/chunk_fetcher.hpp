#ifndef CHUNKSTREAM_CHUNK_FETCHER_HPP
#define CHUNKSTREAM_CHUNK_FETCHER_HPP

#include <piece_store/piece_store.hpp>
#include <retrieval/completion.hpp>
#include <retrieval/content_key.hpp>
#include <retrieval/erasure_coder.hpp>
#include <retrieval/layout.hpp>
#include <retrieval/pool_executor.hpp>
#include <silicium/std_threading.hpp>
#include <boost/optional.hpp>

namespace chunkstream
{
	using chunk_download = completion<std::vector<byte>>;

	using fetch_executor = pool_executor<Si::std_threading>;

	//! asynchronous ranged reads of one chunk of plaintext
	struct chunk_fetcher
	{
		virtual ~chunk_fetcher();

		//! Starts reading [offset, offset + length) of the chunk. An error
		//! means that nothing has been started. The download fails with
		//! operation_aborted when the call scope or the fetcher's own scope is
		//! cancelled before it completes. Any number of downloads may be
		//! outstanding at the same time.
		virtual Si::error_or<chunk_download> download(cancellation const &call, price_per_ms price,
		                                              boost::uint64_t offset, boost::uint64_t length) = 0;
	};

	//! Recovers a chunk from its erasure coded pieces. Construction starts
	//! probing which pieces are available so that the first download does not
	//! wait for it. All work runs on the executor and stops when the owner
	//! scope is cancelled or the fetcher is destroyed.
	struct erasure_chunk_fetcher : chunk_fetcher
	{
		erasure_chunk_fetcher(fetch_executor &executor, piece_reader &pieces, fanout_chunk roots,
		                      std::shared_ptr<erasure_coder const> coder, content_key key,
		                      boost::uint64_t chunk_index, cancellation const &owner);
		~erasure_chunk_fetcher();

		virtual Si::error_or<chunk_download> download(cancellation const &call, price_per_ms price,
		                                              boost::uint64_t offset, boost::uint64_t length) SILICIUM_OVERRIDE;

		boost::uint64_t chunk_index() const;

		//! per piece: none while unknown, otherwise whether the piece can be read
		std::vector<boost::optional<bool>> availability() const;

	private:
		struct shared_state;

		std::shared_ptr<shared_state> state;
	};
}

#endif
