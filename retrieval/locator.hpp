#ifndef CHUNKSTREAM_LOCATOR_HPP
#define CHUNKSTREAM_LOCATOR_HPP

#include <storage/digest.hpp>
#include <silicium/error_or.hpp>
#include <boost/cstdint.hpp>
#include <array>
#include <string>

namespace chunkstream
{
	//! names an object: the piece holding its base sector and the part of
	//! that piece the base sector occupies
	struct object_locator
	{
		piece_root root;
		boost::uint32_t offset;
		boost::uint32_t length;

		object_locator()
			: offset(0)
			, length(0)
		{
		}

		object_locator(piece_root root, boost::uint32_t offset, boost::uint32_t length)
			: root(root)
			, offset(offset)
			, length(length)
		{
		}
	};

	inline bool operator==(object_locator const &left, object_locator const &right)
	{
		return (left.root == right.root) && (left.offset == right.offset) && (left.length == right.length);
	}

	std::size_t const encoded_locator_size = 40;

	std::array<byte, encoded_locator_size> encode_locator(object_locator const &locator);
	std::string format_locator(object_locator const &locator);
	Si::error_or<object_locator> parse_locator(std::string const &formatted);

	//! stable identity of the object behind a locator, the key of the data source cache
	using data_source_id = sha256_digest;

	data_source_id make_data_source_id(object_locator const &locator);
}

#endif
