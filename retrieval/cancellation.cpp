#include "cancellation.hpp"
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <map>

namespace chunkstream
{
	struct cancellation::state
	{
		boost::mutex mutex;
		bool cancelled = false;
		boost::uint64_t next_id = 1;
		std::map<boost::uint64_t, std::function<void()>> handlers;
		connection parent;
	};

	cancellation::connection::connection(std::weak_ptr<state> owner, boost::uint64_t id) BOOST_NOEXCEPT
		: owner(std::move(owner))
		, id(id)
	{
	}

	cancellation::connection::connection(connection &&other) BOOST_NOEXCEPT
		: owner(std::move(other.owner))
		, id(other.id)
	{
		other.id = 0;
	}

	cancellation::connection &cancellation::connection::operator=(connection &&other) BOOST_NOEXCEPT
	{
		if (this != &other)
		{
			disconnect();
			owner = std::move(other.owner);
			id = other.id;
			other.id = 0;
		}
		return *this;
	}

	cancellation::connection::~connection()
	{
		disconnect();
	}

	void cancellation::connection::disconnect()
	{
		if (id == 0)
		{
			return;
		}
		std::shared_ptr<state> const locked = owner.lock();
		if (locked)
		{
			boost::unique_lock<boost::mutex> lock(locked->mutex);
			locked->handlers.erase(id);
		}
		owner.reset();
		id = 0;
	}

	cancellation::cancellation()
		: m_state(std::make_shared<state>())
	{
	}

	cancellation::cancellation(std::shared_ptr<state> existing)
		: m_state(std::move(existing))
	{
	}

	cancellation cancellation::make_child() const
	{
		cancellation child;
		std::weak_ptr<state> weak_child = child.m_state;
		connection link = connect([weak_child]()
		                          {
			                          std::shared_ptr<state> locked = weak_child.lock();
			                          if (locked)
			                          {
				                          cancellation(std::move(locked)).cancel();
			                          }
			                      });
		boost::unique_lock<boost::mutex> lock(child.m_state->mutex);
		child.m_state->parent = std::move(link);
		return child;
	}

	void cancellation::cancel() const
	{
		std::map<boost::uint64_t, std::function<void()>> handlers;
		{
			boost::unique_lock<boost::mutex> lock(m_state->mutex);
			if (m_state->cancelled)
			{
				return;
			}
			m_state->cancelled = true;
			handlers.swap(m_state->handlers);
		}
		for (auto &entry : handlers)
		{
			entry.second();
		}
	}

	bool cancellation::is_cancelled() const
	{
		boost::unique_lock<boost::mutex> lock(m_state->mutex);
		return m_state->cancelled;
	}

	cancellation::connection cancellation::connect(std::function<void()> handler) const
	{
		{
			boost::unique_lock<boost::mutex> lock(m_state->mutex);
			if (!m_state->cancelled)
			{
				boost::uint64_t const id = m_state->next_id++;
				m_state->handlers.insert(std::make_pair(id, std::move(handler)));
				return connection(m_state, id);
			}
		}
		handler();
		return connection();
	}
}
