#ifndef CHUNKSTREAM_DATA_SOURCE_CACHE_HPP
#define CHUNKSTREAM_DATA_SOURCE_CACHE_HPP

#include <retrieval/data_source.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/unordered_map.hpp>
#include <functional>

namespace chunkstream
{
	//! Live data sources by identity. At most one data source is built for
	//! an identity at a time; concurrent callers wait for the build that is
	//! already running. Failed builds are not remembered.
	struct data_source_cache
	{
		using builder = std::function<Si::error_or<std::shared_ptr<data_source>>()>;

		Si::error_or<std::shared_ptr<data_source>> get_or_build(data_source_id const &id, builder const &build);

		//! closes and forgets the data source, if there is one
		void evict(data_source_id const &id);
		void close_all();

		std::size_t size() const;

	private:
		struct entry
		{
			std::shared_ptr<data_source> source;
			bool building;

			entry()
				: building(true)
			{
			}
		};

		mutable boost::mutex mutex;
		boost::condition_variable build_finished;
		boost::unordered_map<data_source_id, entry> entries;
	};
}

#endif
