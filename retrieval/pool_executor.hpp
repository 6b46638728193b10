#ifndef CHUNKSTREAM_POOL_EXECUTOR_HPP
#define CHUNKSTREAM_POOL_EXECUTOR_HPP

#include <boost/asio/io_service.hpp>
#include <boost/optional.hpp>
#include <silicium/utility.hpp>
#include <cassert>
#include <memory>
#include <vector>

namespace chunkstream
{
	//! runs posted work on a fixed number of threads. The destructor lets the
	//! work that has been posted so far finish and joins the threads.
	template <class ThreadingAPI>
	struct pool_executor
	{
		pool_executor()
		{
		}

		explicit pool_executor(std::size_t threads)
			: m_immovable(Si::make_unique<immovable>())
		{
			for (std::size_t i = 0; i < threads; ++i)
			{
				boost::asio::io_service &queue = m_immovable->m_work_queue;
				m_workers.emplace_back(ThreadingAPI::launch_async([&queue]
				{
					queue.run();
				}));
			}
		}

		~pool_executor()
		{
			if (!m_immovable)
			{
				return;
			}
			m_immovable->m_waiting_for_work = boost::none;
			for (auto &worker : m_workers)
			{
				worker.get();
			}
		}

		template <class Action>
		void submit(Action &&work)
		{
			assert(m_immovable);
			m_immovable->m_work_queue.post(std::forward<Action>(work));
		}

		boost::asio::io_service &get_io_service()
		{
			assert(m_immovable);
			return m_immovable->m_work_queue;
		}

	private:

		struct immovable
		{
			boost::asio::io_service m_work_queue;
			boost::optional<boost::asio::io_service::work> m_waiting_for_work;

			immovable()
			{
				m_waiting_for_work.emplace(m_work_queue);
			}
		};

		std::unique_ptr<immovable> m_immovable;
		std::vector<typename ThreadingAPI::template future<void>::type> m_workers;
	};
}

#endif
