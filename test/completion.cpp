#include <retrieval/completion.hpp>
#include <boost/test/unit_test.hpp>
#include <boost/thread/thread.hpp>

BOOST_AUTO_TEST_CASE(completion_get_after_send)
{
	auto channel = chunkstream::make_completion<int>();
	BOOST_CHECK(!channel.first.is_ready());
	BOOST_CHECK(channel.second.send(3));
	BOOST_CHECK(channel.first.is_ready());
	Si::error_or<int> const received = channel.first.get();
	BOOST_REQUIRE(!received.is_error());
	BOOST_CHECK_EQUAL(3, received.get());
}

BOOST_AUTO_TEST_CASE(completion_first_send_wins)
{
	auto channel = chunkstream::make_completion<int>();
	BOOST_CHECK(channel.second.send(1));
	BOOST_CHECK(!channel.second.send(2));
	BOOST_CHECK(!channel.second.send(boost::system::error_code(chunkstream::retrieval_error::short_read)));
	BOOST_CHECK_EQUAL(1, channel.first.get().get());
}

BOOST_AUTO_TEST_CASE(completion_handler_registered_before_send)
{
	auto channel = chunkstream::make_completion<int>();
	int calls = 0;
	channel.first.async_get_one([&calls](Si::error_or<int> result)
	                            {
		                            BOOST_CHECK_EQUAL(5, result.get());
		                            ++calls;
		                        });
	BOOST_CHECK_EQUAL(0, calls);
	channel.second.send(5);
	BOOST_CHECK_EQUAL(1, calls);
	channel.second.send(6);
	BOOST_CHECK_EQUAL(1, calls);
}

BOOST_AUTO_TEST_CASE(completion_handler_registered_after_send)
{
	auto channel = chunkstream::make_completion<int>();
	channel.second.send(5);
	int calls = 0;
	channel.first.async_get_one([&calls](Si::error_or<int> result)
	                            {
		                            BOOST_CHECK_EQUAL(5, result.get());
		                            ++calls;
		                        });
	BOOST_CHECK_EQUAL(1, calls);
}

BOOST_AUTO_TEST_CASE(completion_abandoned_by_sender)
{
	chunkstream::completion<int> receiver;
	{
		auto channel = chunkstream::make_completion<int>();
		receiver = std::move(channel.first);
		chunkstream::completion_sender<int> const copy = channel.second;
	}
	Si::error_or<int> const received = receiver.get();
	BOOST_REQUIRE(received.is_error());
	BOOST_CHECK(received.error() == chunkstream::retrieval_error::abandoned_completion);
}

BOOST_AUTO_TEST_CASE(completion_abandoned_by_receiver)
{
	auto channel = chunkstream::make_completion<int>();
	channel.first = chunkstream::completion<int>();
	BOOST_CHECK(!channel.first.valid());
	BOOST_CHECK(channel.second.send(1));
}

BOOST_AUTO_TEST_CASE(completion_can_be_received_once)
{
	auto channel = chunkstream::make_completion<int>();
	channel.second.send(1);
	channel.first.get();
	BOOST_CHECK_THROW(channel.first.get(), std::logic_error);
}

BOOST_AUTO_TEST_CASE(completion_get_waits_for_another_thread)
{
	auto channel = chunkstream::make_completion<std::string>();
	chunkstream::completion_sender<std::string> const sender = channel.second;
	boost::thread sending([sender]
	                      {
		                      boost::this_thread::sleep_for(boost::chrono::milliseconds(20));
		                      sender.send(std::string("done"));
		                  });
	Si::error_or<std::string> const received = channel.first.get();
	sending.join();
	BOOST_REQUIRE(!received.is_error());
	BOOST_CHECK_EQUAL("done", received.get());
}
