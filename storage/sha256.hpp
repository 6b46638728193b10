#ifndef CHUNKSTREAM_SHA256_HPP
#define CHUNKSTREAM_SHA256_HPP

#include <storage/hexadecimal.hpp>
#include <openssl/sha.h>
#include <boost/functional/hash.hpp>
#include <boost/range/begin.hpp>
#include <boost/range/end.hpp>
#include <algorithm>
#include <array>
#include <iterator>

namespace chunkstream
{
	template <std::size_t ByteSize>
	struct fixed_digest
	{
		std::array<byte, ByteSize> bytes;

		fixed_digest() BOOST_NOEXCEPT
		{
			bytes.fill(0);
		}

		template <class InputIterator>
		explicit fixed_digest(InputIterator from)
		{
			std::copy_n(from, bytes.size(), bytes.begin());
		}
	};

	template <std::size_t ByteSize>
	bool operator == (fixed_digest<ByteSize> const &left, fixed_digest<ByteSize> const &right)
	{
		return left.bytes == right.bytes;
	}

	template <std::size_t ByteSize>
	bool operator != (fixed_digest<ByteSize> const &left, fixed_digest<ByteSize> const &right)
	{
		return !(left == right);
	}

	template <std::size_t ByteSize>
	bool operator < (fixed_digest<ByteSize> const &left, fixed_digest<ByteSize> const &right)
	{
		return left.bytes < right.bytes;
	}

	template <std::size_t ByteSize>
	std::size_t hash_value(fixed_digest<ByteSize> const &value)
	{
		return boost::hash_range(value.bytes.begin(), value.bytes.end());
	}

	using sha256_digest = fixed_digest<256 / 8>;

	struct sha256_hasher
	{
		sha256_hasher()
		{
			SHA256_Init(&state);
		}

		void update(void const *data, std::size_t size)
		{
			SHA256_Update(&state, data, size);
		}

		template <class ByteRange>
		void update(ByteRange const &content)
		{
			auto const size = std::distance(boost::begin(content), boost::end(content));
			if (size > 0)
			{
				update(&*boost::begin(content), static_cast<std::size_t>(size));
			}
		}

		sha256_digest finish()
		{
			sha256_digest result;
			SHA256_Final(result.bytes.data(), &state);
			return result;
		}

	private:
		SHA256_CTX state;
	};

	template <class ByteRange>
	sha256_digest sha256(ByteRange const &content)
	{
		sha256_hasher hasher;
		hasher.update(content);
		return hasher.finish();
	}
}

#endif
