#ifndef CHUNKSTREAM_COMPLETION_HPP
#define CHUNKSTREAM_COMPLETION_HPP

#include <retrieval/retrieval_error.hpp>
#include <silicium/error_or.hpp>
#include <boost/chrono/duration.hpp>
#include <boost/optional.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <functional>
#include <memory>
#include <stdexcept>

namespace chunkstream
{
	namespace detail
	{
		template <class Value>
		struct completion_state
		{
			boost::mutex mutex;
			boost::condition_variable ready;
			boost::optional<Si::error_or<Value>> result;
			std::function<void(Si::error_or<Value>)> handler;
			bool sent = false;
			bool received = false;

			bool send(Si::error_or<Value> sent_result)
			{
				std::function<void(Si::error_or<Value>)> receiver;
				{
					boost::unique_lock<boost::mutex> lock(mutex);
					if (sent)
					{
						return false;
					}
					sent = true;
					if (handler)
					{
						receiver = std::move(handler);
						handler = nullptr;
					}
					else
					{
						result = std::move(sent_result);
						ready.notify_all();
						return true;
					}
				}
				receiver(std::move(sent_result));
				return true;
			}
		};
	}

	//! The sending end of a completion. Copies share the same slot. The first
	//! send wins, later sends are ignored. When the last copy is destroyed
	//! without having sent anything the receiver gets abandoned_completion.
	template <class Value>
	struct completion_sender
	{
		completion_sender()
		{
		}

		explicit completion_sender(std::shared_ptr<detail::completion_state<Value>> state)
			: slot(std::make_shared<guard>(std::move(state)))
		{
		}

		//! \return false if a result had already been sent
		bool send(Si::error_or<Value> result) const
		{
			if (!slot)
			{
				throw std::logic_error("send on an empty completion_sender");
			}
			return slot->state->send(std::move(result));
		}

	private:
		struct guard
		{
			std::shared_ptr<detail::completion_state<Value>> state;

			explicit guard(std::shared_ptr<detail::completion_state<Value>> state)
				: state(std::move(state))
			{
			}

			~guard()
			{
				state->send(boost::system::error_code(retrieval_error::abandoned_completion));
			}
		};

		std::shared_ptr<guard> slot;
	};

	//! The receiving end of a single-slot result channel. Exactly one result
	//! can be received, either by blocking in get() or by a handler passed to
	//! async_get_one(). A completion may be dropped without receiving.
	template <class Value>
	struct completion
	{
		completion()
		{
		}

		explicit completion(std::shared_ptr<detail::completion_state<Value>> state)
			: state(std::move(state))
		{
		}

		bool valid() const
		{
			return state != nullptr;
		}

		bool is_ready() const
		{
			assume_valid();
			boost::unique_lock<boost::mutex> lock(state->mutex);
			return state->result.is_initialized();
		}

		template <class Rep, class Period>
		bool wait_for(boost::chrono::duration<Rep, Period> const &timeout) const
		{
			assume_valid();
			boost::unique_lock<boost::mutex> lock(state->mutex);
			return state->ready.wait_for(lock, timeout, [this]
			                             {
				                             return state->result.is_initialized();
				                         });
		}

		Si::error_or<Value> get()
		{
			assume_valid();
			boost::unique_lock<boost::mutex> lock(state->mutex);
			take_receive_right();
			while (!state->result)
			{
				state->ready.wait(lock);
			}
			Si::error_or<Value> received = std::move(*state->result);
			state->result = boost::none;
			return received;
		}

		template <class Handler>
		void async_get_one(Handler &&handler)
		{
			assume_valid();
			boost::optional<Si::error_or<Value>> already_sent;
			{
				boost::unique_lock<boost::mutex> lock(state->mutex);
				take_receive_right();
				if (state->result)
				{
					already_sent = std::move(state->result);
					state->result = boost::none;
				}
				else
				{
					state->handler = std::forward<Handler>(handler);
					return;
				}
			}
			handler(std::move(*already_sent));
		}

	private:
		std::shared_ptr<detail::completion_state<Value>> state;

		void assume_valid() const
		{
			if (!state)
			{
				throw std::logic_error("use of an empty completion");
			}
		}

		void take_receive_right()
		{
			if (state->received)
			{
				throw std::logic_error("a completion can be received only once");
			}
			state->received = true;
		}
	};

	template <class Value>
	std::pair<completion<Value>, completion_sender<Value>> make_completion()
	{
		auto state = std::make_shared<detail::completion_state<Value>>();
		return std::make_pair(completion<Value>(state), completion_sender<Value>(state));
	}

	template <class Value>
	completion<Value> make_ready_completion(Si::error_or<Value> result)
	{
		auto channel = make_completion<Value>();
		channel.second.send(std::move(result));
		return std::move(channel.first);
	}
}

#endif
