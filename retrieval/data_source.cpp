#include "data_source.hpp"
#include <boost/asio/error.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <algorithm>
#include <cassert>
#include <stdexcept>

namespace chunkstream
{
	namespace
	{
		//! Collects the sub-reads of one read. Sub-reads are drained strictly
		//! in the order they were issued, whatever order they complete in. The
		//! first failure is the response. It cancels the sub-reads that are
		//! still running and everything drained after it is discarded.
		struct read_aggregation
		{
			read_aggregation(std::vector<std::size_t> expected_sizes, boost::uint64_t total,
			                 completion_sender<std::vector<byte>> respond, cancellation sub_reads)
				: arrived(expected_sizes.size())
				, expected(std::move(expected_sizes))
				, next(0)
				, assembled(static_cast<std::size_t>(total))
				, written(0)
				, failed(false)
				, respond(std::move(respond))
				, sub_reads(std::move(sub_reads))
			{
			}

			void complete(std::size_t index, Si::error_or<std::vector<byte>> result)
			{
				boost::optional<Si::error_or<std::vector<byte>>> response;
				{
					boost::unique_lock<boost::mutex> lock(mutex);
					arrived[index] = std::move(result);
					bool const was_complete = (next == arrived.size());
					while ((next < arrived.size()) && arrived[next])
					{
						drain(*arrived[next], expected[next], response);
						arrived[next] = boost::none;
						++next;
					}
					if (!was_complete && (next == arrived.size()) && !failed)
					{
						assert(written == assembled.size());
						response = Si::error_or<std::vector<byte>>(std::move(assembled));
					}
				}
				if (response)
				{
					bool const is_failure = response->is_error();
					respond.send(std::move(*response));
					if (is_failure)
					{
						sub_reads.cancel();
					}
				}
			}

		private:
			boost::mutex mutex;
			std::vector<boost::optional<Si::error_or<std::vector<byte>>>> arrived;
			std::vector<std::size_t> expected;
			std::size_t next;
			std::vector<byte> assembled;
			std::size_t written;
			bool failed;
			completion_sender<std::vector<byte>> respond;
			cancellation sub_reads;

			void drain(Si::error_or<std::vector<byte>> const &sub_read, std::size_t expected_size,
			           boost::optional<Si::error_or<std::vector<byte>>> &response)
			{
				if (failed)
				{
					return;
				}
				if (sub_read.is_error())
				{
					failed = true;
					response = Si::error_or<std::vector<byte>>(sub_read.error());
					return;
				}
				std::vector<byte> const &data = sub_read.get();
				if (data.size() != expected_size)
				{
					failed = true;
					response = Si::error_or<std::vector<byte>>(boost::system::error_code(retrieval_error::short_read));
					return;
				}
				std::copy(data.begin(), data.end(), assembled.begin() + written);
				written += data.size();
			}
		};
	}

	data_source::data_source(data_source_id id, layout object_layout, object_metadata metadata,
	                         std::vector<byte> payload, std::vector<std::unique_ptr<chunk_fetcher>> fetchers,
	                         std::size_t piece_size, std::size_t preferred_request_size, cancellation scope)
		: source_id(id)
		, source_layout(object_layout)
		, source_metadata(std::move(metadata))
		, payload(std::move(payload))
		, fetchers(std::move(fetchers))
		, chunk_size(static_cast<boost::uint64_t>(object_layout.fanout_data_pieces) * piece_size)
		, request_size(preferred_request_size)
		, scope(std::move(scope))
	{
		if (!this->payload.empty() && !this->fetchers.empty())
		{
			throw std::invalid_argument("a data source has either inline content or chunk fetchers");
		}
		if (this->fetchers.empty() && (this->payload.size() != source_layout.file_size))
		{
			throw std::invalid_argument("the inline content has to be exactly as large as the object");
		}
		if (!this->fetchers.empty() && (chunk_size == 0))
		{
			throw std::invalid_argument("a fanout needs a chunk size");
		}
	}

	data_source::~data_source()
	{
		close();
	}

	data_source_id const &data_source::id() const
	{
		return source_id;
	}

	boost::uint64_t data_source::total_size() const
	{
		return source_layout.file_size;
	}

	std::size_t data_source::preferred_request_size() const
	{
		return request_size;
	}

	object_metadata const &data_source::metadata() const
	{
		return source_metadata;
	}

	layout const &data_source::object_layout() const
	{
		return source_layout;
	}

	std::size_t data_source::chunk_count() const
	{
		return fetchers.size();
	}

	void data_source::close()
	{
		scope.cancel();
	}

	bool data_source::is_closed() const
	{
		return scope.is_cancelled();
	}

	read_response data_source::read(cancellation const &call, boost::uint64_t offset, boost::uint64_t length,
	                                price_per_ms price)
	{
		if ((length > total_size()) || (offset > (total_size() - length)))
		{
			return make_ready_completion<std::vector<byte>>(
			    boost::system::error_code(retrieval_error::range_exceeds_object));
		}
		if (scope.is_cancelled() || call.is_cancelled())
		{
			return make_ready_completion<std::vector<byte>>(
			    boost::system::error_code(boost::asio::error::operation_aborted));
		}

		// A small object without a fanout is served from memory. Unlike the
		// fanout path this clamps a length that runs past the payload.
		if (!payload.empty())
		{
			boost::uint64_t const bytes_left = payload.size() - std::min<boost::uint64_t>(offset, payload.size());
			boost::uint64_t const clamped = std::min(length, bytes_left);
			auto const begin = payload.begin() + static_cast<std::ptrdiff_t>(offset);
			return make_ready_completion<std::vector<byte>>(
			    std::vector<byte>(begin, begin + static_cast<std::ptrdiff_t>(clamped)));
		}
		return read_fanout(call, offset, length, price);
	}

	read_response data_source::read_fanout(cancellation const &call, boost::uint64_t offset, boost::uint64_t length,
	                                       price_per_ms price)
	{
		if (length == 0)
		{
			return make_ready_completion<std::vector<byte>>(std::vector<byte>());
		}

		// one scope for all the sub-reads of this read
		cancellation const sub_reads = call.make_child();
		std::vector<chunk_download> downloads;
		std::vector<std::size_t> expected_sizes;
		downloads.reserve(static_cast<std::size_t>((length + chunk_size - 1) / chunk_size) + 1);
		boost::uint64_t position = offset;
		boost::uint64_t scheduled = 0;
		while ((scheduled < length) && (position < total_size()))
		{
			boost::uint64_t const chunk_index = position / chunk_size;
			boost::uint64_t const offset_in_chunk = position % chunk_size;
			boost::uint64_t const sub_length = std::min(chunk_size - offset_in_chunk, length - scheduled);
			if (chunk_index >= fetchers.size())
			{
				throw std::logic_error("the fanout has fewer chunks than the object size requires");
			}

			Si::error_or<chunk_download> started =
			    fetchers[static_cast<std::size_t>(chunk_index)]->download(sub_reads, price, offset_in_chunk, sub_length);
			if (started.is_error())
			{
				sub_reads.cancel();
				return make_ready_completion<std::vector<byte>>(started.error());
			}
			downloads.emplace_back(std::move(started.get()));
			expected_sizes.push_back(static_cast<std::size_t>(sub_length));

			position += sub_length;
			scheduled += sub_length;
		}

		auto response = make_completion<std::vector<byte>>();
		auto const aggregation =
		    std::make_shared<read_aggregation>(std::move(expected_sizes), length, std::move(response.second),
		                                       sub_reads);
		for (std::size_t i = 0; i < downloads.size(); ++i)
		{
			downloads[i].async_get_one([aggregation, i](Si::error_or<std::vector<byte>> result)
			                           {
				                           aggregation->complete(i, std::move(result));
				                       });
		}
		return std::move(response.first);
	}
}
