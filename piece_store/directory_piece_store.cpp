#include "directory_piece_store.hpp"
#include <retrieval/retrieval_error.hpp>
#include <silicium/memory_range.hpp>
#include <silicium/source/source.hpp>
#include <ventura/file_operations.hpp>
#include <ventura/open.hpp>
#include <ventura/source/file_source.hpp>
#include <boost/asio/error.hpp>
#include <boost/concept_check.hpp>
#include <boost/filesystem/operations.hpp>
#include <algorithm>
#include <array>
#include <limits>
#include <string>
#ifndef _WIN32
#	include <unistd.h>
#endif

namespace chunkstream
{
	piece_reader::~piece_reader()
	{
	}

	piece_writer::~piece_writer()
	{
	}

	namespace
	{
		boost::system::error_code write_all(Si::native_file_descriptor destination, byte const *begin, std::size_t size)
		{
			std::size_t total_written = 0;
			while (total_written < size)
			{
#ifdef _WIN32
				DWORD written = 0;
				DWORD const piece = static_cast<DWORD>(
				    std::min(size - total_written, static_cast<size_t>(std::numeric_limits<DWORD>::max())));
				if (!WriteFile(destination, begin + total_written, piece, &written, nullptr))
				{
					return boost::system::error_code(GetLastError(), boost::system::native_ecat);
				}
				total_written += written;
#else
				ssize_t rc = write(destination, begin + total_written, size - total_written);
				if (rc < 0)
				{
					return boost::system::error_code(errno, boost::system::system_category());
				}
				total_written += static_cast<size_t>(rc);
#endif
			}
			return boost::system::error_code();
		}
	}

	directory_piece_store::directory_piece_store(ventura::absolute_path root)
		: root(std::move(root))
	{
	}

	Si::error_or<bool> directory_piece_store::has_piece(piece_root const &root, cancellation const &cancelled)
	{
		if (cancelled.is_cancelled())
		{
			return boost::system::error_code(boost::asio::error::operation_aborted);
		}
		boost::system::error_code ec;
		bool const exists = boost::filesystem::exists(piece_file(root).to_boost_path(), ec);
		if (ec)
		{
			return ec;
		}
		return exists;
	}

	Si::error_or<std::vector<byte>> directory_piece_store::read_piece(piece_root const &root, std::size_t offset,
	                                                                  std::size_t length, price_per_ms price,
	                                                                  cancellation const &cancelled)
	{
		// a local directory has one price: free
		boost::ignore_unused_variable_warning(price);
		if (cancelled.is_cancelled())
		{
			return boost::system::error_code(boost::asio::error::operation_aborted);
		}
		ventura::absolute_path const file = piece_file(root);
		Si::error_or<Si::file_handle> opening = ventura::open_reading(ventura::safe_c_str(to_native_range(file)));
		if (opening.is_error())
		{
			if (opening.error() == boost::system::errc::no_such_file_or_directory)
			{
				return boost::system::error_code(retrieval_error::piece_not_found);
			}
			return opening.error();
		}
		Si::file_handle opened = opening.move_value();
		{
			boost::system::error_code const ec = ventura::seek_absolute(opened.handle, offset);
			if (ec)
			{
				return ec;
			}
		}
		std::vector<byte> content;
		content.reserve(length);
		std::array<char, 8192> buffer;
		auto file_content = ventura::make_file_source(
		    opened.handle, Si::make_memory_range(buffer.data(), buffer.data() + buffer.size()));
		while (content.size() < length)
		{
			if (cancelled.is_cancelled())
			{
				return boost::system::error_code(boost::asio::error::operation_aborted);
			}
			auto piece = Si::get(file_content);
			if (!piece)
			{
				break;
			}
			if (piece->is_error())
			{
				return piece->error();
			}
			Si::memory_range const received = piece->get();
			if (received.empty())
			{
				break;
			}
			std::size_t const wanted =
			    std::min(length - content.size(), static_cast<std::size_t>(received.size()));
			content.insert(content.end(), received.begin(), received.begin() + wanted);
		}
		if (content.size() != length)
		{
			return boost::system::error_code(retrieval_error::short_read);
		}
		return std::move(content);
	}

	boost::system::error_code directory_piece_store::write_piece(piece_root const &root,
	                                                             std::vector<byte> const &content)
	{
		ventura::absolute_path const file = piece_file(root);
		{
			boost::system::error_code ec;
			if (boost::filesystem::exists(file.to_boost_path(), ec))
			{
				// content addressed: an existing file already has this content
				return boost::system::error_code();
			}
		}
		Si::error_or<Si::file_handle> created = ventura::create_file(file);
		if (created.is_error())
		{
			return created.error();
		}
		return write_all(created.get().handle, content.data(), content.size());
	}

	ventura::absolute_path directory_piece_store::piece_file(piece_root const &piece) const
	{
		return root / ventura::relative_path(format_digest(piece));
	}
}
