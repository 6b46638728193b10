#ifndef CHUNKSTREAM_LITTLE_ENDIAN_HPP
#define CHUNKSTREAM_LITTLE_ENDIAN_HPP

#include <storage/hexadecimal.hpp>
#include <cstddef>

namespace chunkstream
{
	template <class Integer, class OutputIterator>
	OutputIterator write_little_endian(Integer value, OutputIterator destination)
	{
		for (std::size_t i = 0; i < sizeof(value); ++i)
		{
			*destination++ = static_cast<byte>(static_cast<boost::uint64_t>(value) >> (8 * i));
		}
		return destination;
	}

	template <class Integer>
	Integer read_little_endian(byte const *source)
	{
		boost::uint64_t value = 0;
		for (std::size_t i = 0; i < sizeof(Integer); ++i)
		{
			value |= static_cast<boost::uint64_t>(source[i]) << (8 * i);
		}
		return static_cast<Integer>(value);
	}
}

#endif
