#ifndef CHUNKSTREAM_CANCELLATION_HPP
#define CHUNKSTREAM_CANCELLATION_HPP

#include <boost/asio/io_service.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/cstdint.hpp>
#include <functional>
#include <memory>

namespace chunkstream
{
	//! A node in a tree of cancellation scopes. Copies refer to the same node.
	//! Cancelling a node cancels every descendant and runs every connected
	//! handler exactly once. A node that is already cancelled runs newly
	//! connected handlers immediately.
	struct cancellation
	{
		struct state;

		struct connection
		{
			connection() BOOST_NOEXCEPT
				: id(0)
			{
			}

			connection(std::weak_ptr<state> owner, boost::uint64_t id) BOOST_NOEXCEPT;
			connection(connection &&other) BOOST_NOEXCEPT;
			connection &operator=(connection &&other) BOOST_NOEXCEPT;
			~connection();

			void disconnect();

		private:
			std::weak_ptr<state> owner;
			boost::uint64_t id;

			connection(connection const &);
			connection &operator=(connection const &);
		};

		cancellation();

		cancellation make_child() const;
		void cancel() const;
		bool is_cancelled() const;
		connection connect(std::function<void()> handler) const;

	private:
		std::shared_ptr<state> m_state;

		explicit cancellation(std::shared_ptr<state> existing);
	};

	//! cancels a scope when a timeout elapses before the watchdog is destroyed.
	struct watchdog
	{
		template <class Duration>
		watchdog(boost::asio::io_service &io, Duration timeout, cancellation watched)
			: timer(io)
		{
			timer.expires_from_now(timeout);
			timer.async_wait([watched](boost::system::error_code const &ec)
			                 {
				                 if (!ec)
				                 {
					                 watched.cancel();
				                 }
				             });
		}

		~watchdog()
		{
			boost::system::error_code ignored;
			timer.cancel(ignored);
		}

	private:
		boost::asio::steady_timer timer;
	};
}

#endif
