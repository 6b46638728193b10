#include "locator.hpp"
#include <retrieval/retrieval_error.hpp>
#include <storage/little_endian.hpp>
#include <algorithm>

namespace chunkstream
{
	std::array<byte, encoded_locator_size> encode_locator(object_locator const &locator)
	{
		std::array<byte, encoded_locator_size> encoded;
		auto out = std::copy(locator.root.bytes.begin(), locator.root.bytes.end(), encoded.begin());
		out = write_little_endian(locator.offset, out);
		write_little_endian(locator.length, out);
		return encoded;
	}

	std::string format_locator(object_locator const &locator)
	{
		std::array<byte, encoded_locator_size> const encoded = encode_locator(locator);
		std::string formatted;
		append_hex(encoded.begin(), encoded.end(), formatted);
		return formatted;
	}

	Si::error_or<object_locator> parse_locator(std::string const &formatted)
	{
		boost::optional<std::array<byte, encoded_locator_size>> const decoded =
		    parse_hex_bytes<encoded_locator_size>(formatted);
		if (!decoded)
		{
			return boost::system::error_code(retrieval_error::invalid_locator);
		}
		object_locator parsed(piece_root(decoded->begin()), read_little_endian<boost::uint32_t>(decoded->data() + 32),
		                      read_little_endian<boost::uint32_t>(decoded->data() + 36));
		if (parsed.length == 0)
		{
			return boost::system::error_code(retrieval_error::invalid_locator);
		}
		return parsed;
	}

	data_source_id make_data_source_id(object_locator const &locator)
	{
		return sha256(encode_locator(locator));
	}
}
