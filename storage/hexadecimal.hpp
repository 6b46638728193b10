#ifndef CHUNKSTREAM_HEXADECIMAL_HPP
#define CHUNKSTREAM_HEXADECIMAL_HPP

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>
#include <array>
#include <string>

namespace chunkstream
{
	using byte = boost::uint8_t;

	//! appends two lower case digits per byte
	template <class ByteIterator>
	void append_hex(ByteIterator begin, ByteIterator end, std::string &out)
	{
		static char const digits[] = "0123456789abcdef";
		for (; begin != end; ++begin)
		{
			byte const value = *begin;
			out.push_back(digits[value >> 4u]);
			out.push_back(digits[value & 0x0fu]);
		}
	}

	inline boost::optional<byte> decode_hex_digit(char digit)
	{
		if ((digit >= '0') && (digit <= '9'))
		{
			return static_cast<byte>(digit - '0');
		}
		if ((digit >= 'a') && (digit <= 'f'))
		{
			return static_cast<byte>(digit - 'a' + 10);
		}
		if ((digit >= 'A') && (digit <= 'F'))
		{
			return static_cast<byte>(digit - 'A' + 10);
		}
		return boost::none;
	}

	//! accepts exactly 2 * Size digits of either case and nothing else
	template <std::size_t Size>
	boost::optional<std::array<byte, Size>> parse_hex_bytes(std::string const &formatted)
	{
		if (formatted.size() != (2 * Size))
		{
			return boost::none;
		}
		std::array<byte, Size> decoded;
		for (std::size_t i = 0; i < Size; ++i)
		{
			boost::optional<byte> const high = decode_hex_digit(formatted[2 * i]);
			boost::optional<byte> const low = decode_hex_digit(formatted[(2 * i) + 1]);
			if (!high || !low)
			{
				return boost::none;
			}
			decoded[i] = static_cast<byte>((*high << 4u) | *low);
		}
		return decoded;
	}
}

#endif
