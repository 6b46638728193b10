#ifndef CHUNKSTREAM_CONTENT_KEY_HPP
#define CHUNKSTREAM_CONTENT_KEY_HPP

#include <storage/hexadecimal.hpp>
#include <boost/cstdint.hpp>
#include <boost/system/error_code.hpp>
#include <array>
#include <vector>

namespace chunkstream
{
	enum class cipher_type : boost::uint64_t
	{
		plain = 0,
		aes256_ctr = 1
	};

	using key_bytes = std::array<byte, 32>;

	//! key of a stream of content. The null key leaves content unchanged.
	struct content_key
	{
		cipher_type type;
		key_bytes key;

		content_key()
			: type(cipher_type::plain)
		{
			key.fill(0);
		}

		content_key(cipher_type type, key_bytes const &key)
			: type(type)
			, key(key)
		{
		}

		bool is_plain() const
		{
			return type == cipher_type::plain;
		}

		//! the independent key of one chunk of a fanout
		content_key derive(boost::uint64_t chunk_index) const;

		//! xors the key stream starting at stream_offset into content. The
		//! same call encrypts and decrypts.
		boost::system::error_code apply(byte *content, std::size_t size, boost::uint64_t stream_offset) const;

		boost::system::error_code apply(std::vector<byte> &content, boost::uint64_t stream_offset) const
		{
			return apply(content.data(), content.size(), stream_offset);
		}
	};
}

#endif
