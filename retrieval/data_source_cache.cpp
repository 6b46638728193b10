#include "data_source_cache.hpp"
#include <boost/thread/locks.hpp>
#include <cassert>

namespace chunkstream
{
	Si::error_or<std::shared_ptr<data_source>> data_source_cache::get_or_build(data_source_id const &id,
	                                                                           builder const &build)
	{
		{
			boost::unique_lock<boost::mutex> lock(mutex);
			for (;;)
			{
				auto const existing = entries.find(id);
				if (existing == entries.end())
				{
					entries.insert(std::make_pair(id, entry()));
					break;
				}
				if (!existing->second.building)
				{
					return existing->second.source;
				}
				build_finished.wait(lock);
			}
		}

		Si::error_or<std::shared_ptr<data_source>> built = [this, &id, &build]() -> Si::error_or<std::shared_ptr<data_source>>
		{
			try
			{
				return build();
			}
			catch (...)
			{
				boost::unique_lock<boost::mutex> lock(mutex);
				entries.erase(id);
				build_finished.notify_all();
				throw;
			}
		}();

		boost::unique_lock<boost::mutex> lock(mutex);
		if (built.is_error())
		{
			entries.erase(id);
		}
		else
		{
			auto const building = entries.find(id);
			assert(building != entries.end());
			building->second.source = built.get();
			building->second.building = false;
		}
		build_finished.notify_all();
		return built;
	}

	void data_source_cache::evict(data_source_id const &id)
	{
		std::shared_ptr<data_source> evicted;
		{
			boost::unique_lock<boost::mutex> lock(mutex);
			auto const found = entries.find(id);
			if ((found == entries.end()) || found->second.building)
			{
				return;
			}
			evicted = std::move(found->second.source);
			entries.erase(found);
		}
		evicted->close();
	}

	void data_source_cache::close_all()
	{
		std::vector<std::shared_ptr<data_source>> evicted;
		{
			boost::unique_lock<boost::mutex> lock(mutex);
			for (auto i = entries.begin(); i != entries.end();)
			{
				if (i->second.building)
				{
					++i;
					continue;
				}
				evicted.emplace_back(std::move(i->second.source));
				i = entries.erase(i);
			}
		}
		for (std::shared_ptr<data_source> const &source : evicted)
		{
			source->close();
		}
	}

	std::size_t data_source_cache::size() const
	{
		boost::unique_lock<boost::mutex> lock(mutex);
		return entries.size();
	}
}
