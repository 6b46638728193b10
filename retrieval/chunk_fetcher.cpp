#include "chunk_fetcher.hpp"
#include <boost/asio/error.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <algorithm>
#include <stdexcept>

namespace chunkstream
{
	chunk_fetcher::~chunk_fetcher()
	{
	}

	struct erasure_chunk_fetcher::shared_state
	{
		fetch_executor *executor;
		piece_reader *pieces;
		fanout_chunk roots;
		std::shared_ptr<erasure_coder const> coder;
		//! already derived for this chunk
		content_key key;
		boost::uint64_t chunk_index;
		cancellation scope;

		mutable boost::mutex mutex;
		std::vector<boost::optional<bool>> available;

		void set_availability(piece_root const &root, bool is_available)
		{
			boost::unique_lock<boost::mutex> lock(mutex);
			for (std::size_t i = 0; i < roots.size(); ++i)
			{
				if (roots[i] == root)
				{
					available[i] = is_available;
				}
			}
		}

		std::vector<bool> get_usable_pieces() const
		{
			boost::unique_lock<boost::mutex> lock(mutex);
			std::vector<bool> usable(available.size());
			for (std::size_t i = 0; i < available.size(); ++i)
			{
				usable[i] = !available[i] || *available[i];
			}
			return usable;
		}

		void probe(piece_root const &root)
		{
			if (scope.is_cancelled())
			{
				return;
			}
			Si::error_or<bool> const found = pieces->has_piece(root, scope);
			if (found.is_error())
			{
				// unknown stays unknown, a download will find out
				return;
			}
			set_availability(root, found.get());
		}

		void fetch(cancellation const &request, std::vector<piece_range> const &plan, boost::uint64_t offset,
		           boost::uint64_t length, price_per_ms price, completion_sender<std::vector<byte>> const &sender)
		{
			std::vector<std::vector<byte>> fetched;
			fetched.reserve(plan.size());
			for (piece_range const &range : plan)
			{
				if (request.is_cancelled())
				{
					sender.send(boost::system::error_code(boost::asio::error::operation_aborted));
					return;
				}
				piece_root const &root = roots[range.piece_index];
				Si::error_or<std::vector<byte>> piece =
				    pieces->read_piece(root, range.offset, range.length, price, request);
				if (piece.is_error())
				{
					if (piece.error() == retrieval_error::piece_not_found)
					{
						set_availability(root, false);
					}
					sender.send(piece.error());
					return;
				}
				fetched.emplace_back(std::move(piece.get()));
			}
			Si::error_or<std::vector<byte>> recovered = coder->recover(plan, fetched, offset, length);
			if (recovered.is_error())
			{
				sender.send(recovered.error());
				return;
			}
			boost::system::error_code const decrypted = key.apply(recovered.get(), offset);
			if (decrypted)
			{
				sender.send(decrypted);
				return;
			}
			sender.send(std::move(recovered));
		}
	};

	erasure_chunk_fetcher::erasure_chunk_fetcher(fetch_executor &executor, piece_reader &pieces, fanout_chunk roots,
	                                             std::shared_ptr<erasure_coder const> coder, content_key key,
	                                             boost::uint64_t chunk_index, cancellation const &owner)
		: state(std::make_shared<shared_state>())
	{
		if (roots.size() != coder->total_pieces())
		{
			throw std::invalid_argument("a chunk needs one root per encoded piece");
		}
		state->executor = &executor;
		state->pieces = &pieces;
		state->roots = std::move(roots);
		state->coder = std::move(coder);
		state->key = key.derive(chunk_index);
		state->chunk_index = chunk_index;
		state->scope = owner.make_child();
		state->available.resize(state->roots.size());

		std::vector<piece_root> distinct = state->roots;
		std::sort(distinct.begin(), distinct.end());
		distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
		for (piece_root const &root : distinct)
		{
			std::shared_ptr<shared_state> const probing = state;
			executor.submit([probing, root]()
			                {
				                probing->probe(root);
				            });
		}
	}

	erasure_chunk_fetcher::~erasure_chunk_fetcher()
	{
		state->scope.cancel();
	}

	Si::error_or<chunk_download> erasure_chunk_fetcher::download(cancellation const &call, price_per_ms price,
	                                                             boost::uint64_t offset, boost::uint64_t length)
	{
		if (state->scope.is_cancelled() || call.is_cancelled())
		{
			return boost::system::error_code(boost::asio::error::operation_aborted);
		}
		Si::error_or<std::vector<piece_range>> plan =
		    state->coder->plan_recovery(offset, length, state->get_usable_pieces());
		if (plan.is_error())
		{
			return plan.error();
		}

		auto channel = make_completion<std::vector<byte>>();
		completion_sender<std::vector<byte>> const sender = channel.second;
		cancellation const request = state->scope.make_child();
		auto const abort_on_cancel = std::make_shared<cancellation::connection>(request.connect([sender]()
		                                                                                         {
			                                                                                         sender.send(boost::system::error_code(
			                                                                                             boost::asio::error::operation_aborted));
			                                                                                     }));
		auto const call_link = std::make_shared<cancellation::connection>(call.connect([request]()
		                                                                               {
			                                                                               request.cancel();
			                                                                           }));
		std::shared_ptr<shared_state> const fetching = state;
		std::vector<piece_range> const planned = std::move(plan.get());
		state->executor->submit([fetching, request, planned, offset, length, price, sender, abort_on_cancel, call_link]()
		                        {
			                        fetching->fetch(request, planned, offset, length, price, sender);
			                    });
		return std::move(channel.first);
	}

	boost::uint64_t erasure_chunk_fetcher::chunk_index() const
	{
		return state->chunk_index;
	}

	std::vector<boost::optional<bool>> erasure_chunk_fetcher::availability() const
	{
		boost::unique_lock<boost::mutex> lock(state->mutex);
		return state->available;
	}
}
