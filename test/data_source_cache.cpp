#include <retrieval/data_source_cache.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/thread/thread.hpp>
#include <atomic>

namespace
{
	std::shared_ptr<chunkstream::data_source> make_source(chunkstream::data_source_id const &id)
	{
		chunkstream::layout object_layout;
		object_layout.file_size = 1;
		object_layout.fanout_data_pieces = 1;
		return std::make_shared<chunkstream::data_source>(
		    id, object_layout, chunkstream::object_metadata(), std::vector<chunkstream::byte>(1, 1),
		    std::vector<std::unique_ptr<chunkstream::chunk_fetcher>>(), 16, 16, chunkstream::cancellation());
	}

	chunkstream::data_source_id make_id(chunkstream::byte fill)
	{
		chunkstream::data_source_id id;
		id.bytes.fill(fill);
		return id;
	}
}

BOOST_AUTO_TEST_CASE(data_source_cache_builds_once)
{
	chunkstream::data_source_cache cache;
	int builds = 0;
	auto const build = [&builds]() -> Si::error_or<std::shared_ptr<chunkstream::data_source>>
	{
		++builds;
		return make_source(make_id(1));
	};
	auto const first = cache.get_or_build(make_id(1), build);
	auto const second = cache.get_or_build(make_id(1), build);
	BOOST_REQUIRE(!first.is_error());
	BOOST_CHECK(first.get() == second.get());
	BOOST_CHECK_EQUAL(1, builds);
	BOOST_CHECK_EQUAL(1u, cache.size());
}

BOOST_AUTO_TEST_CASE(data_source_cache_forgets_failures)
{
	chunkstream::data_source_cache cache;
	auto const failing = []() -> Si::error_or<std::shared_ptr<chunkstream::data_source>>
	{
		return boost::system::error_code(chunkstream::retrieval_error::malformed_base_sector);
	};
	BOOST_CHECK(cache.get_or_build(make_id(1), failing).error() == chunkstream::retrieval_error::malformed_base_sector);
	BOOST_CHECK_EQUAL(0u, cache.size());

	auto const throwing = []() -> Si::error_or<std::shared_ptr<chunkstream::data_source>>
	{
		throw std::runtime_error("build failed");
	};
	BOOST_CHECK_THROW(cache.get_or_build(make_id(1), throwing), std::runtime_error);
	BOOST_CHECK_EQUAL(0u, cache.size());

	auto const built = cache.get_or_build(make_id(1), []() -> Si::error_or<std::shared_ptr<chunkstream::data_source>>
	                                      {
		                                      return make_source(make_id(1));
		                                  });
	BOOST_CHECK(!built.is_error());
}

BOOST_AUTO_TEST_CASE(data_source_cache_concurrent_callers_share_one_build)
{
	chunkstream::data_source_cache cache;
	std::atomic<int> builds(0);
	auto const slow_build = [&builds]() -> Si::error_or<std::shared_ptr<chunkstream::data_source>>
	{
		++builds;
		boost::this_thread::sleep_for(boost::chrono::milliseconds(20));
		return make_source(make_id(2));
	};
	std::vector<std::shared_ptr<chunkstream::data_source>> results(6);
	std::vector<boost::thread> callers;
	for (std::size_t i = 0; i < results.size(); ++i)
	{
		callers.emplace_back([&cache, &results, &slow_build, i]
		                     {
			                     results[i] = cache.get_or_build(make_id(2), slow_build).get();
			                 });
	}
	for (boost::thread &caller : callers)
	{
		caller.join();
	}
	BOOST_CHECK_EQUAL(1, builds.load());
	for (auto const &result : results)
	{
		BOOST_CHECK(result == results.front());
	}
}

BOOST_AUTO_TEST_CASE(data_source_cache_eviction_closes)
{
	chunkstream::data_source_cache cache;
	auto const first = cache.get_or_build(make_id(1), []() -> Si::error_or<std::shared_ptr<chunkstream::data_source>>
	                                      {
		                                      return make_source(make_id(1));
		                                  }).get();
	auto const second = cache.get_or_build(make_id(2), []() -> Si::error_or<std::shared_ptr<chunkstream::data_source>>
	                                       {
		                                       return make_source(make_id(2));
		                                   }).get();
	cache.evict(make_id(1));
	BOOST_CHECK(first->is_closed());
	BOOST_CHECK(!second->is_closed());
	BOOST_CHECK_EQUAL(1u, cache.size());
	cache.evict(make_id(3));
	cache.close_all();
	BOOST_CHECK(second->is_closed());
	BOOST_CHECK_EQUAL(0u, cache.size());
}
