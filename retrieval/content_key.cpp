#include "content_key.hpp"
#include <retrieval/retrieval_error.hpp>
#include <storage/sha256.hpp>
#include <openssl/evp.h>
#include <algorithm>
#include <memory>

namespace chunkstream
{
	namespace
	{
		struct cipher_context_deleter
		{
			void operator()(EVP_CIPHER_CTX *context) const
			{
				EVP_CIPHER_CTX_free(context);
			}
		};

		std::array<byte, 16> make_counter_block(boost::uint64_t block_index)
		{
			std::array<byte, 16> counter;
			counter.fill(0);
			for (std::size_t i = 0; i < 8; ++i)
			{
				counter[15 - i] = static_cast<byte>(block_index >> (8 * i));
			}
			return counter;
		}
	}

	content_key content_key::derive(boost::uint64_t chunk_index) const
	{
		if (is_plain())
		{
			return *this;
		}
		sha256_hasher hasher;
		hasher.update(key);
		static char const label[] = "chunk";
		hasher.update(label, sizeof(label) - 1);
		std::array<byte, 8> index;
		for (std::size_t i = 0; i < index.size(); ++i)
		{
			index[i] = static_cast<byte>(chunk_index >> (8 * i));
		}
		hasher.update(index);
		sha256_digest const derived = hasher.finish();
		return content_key(type, derived.bytes);
	}

	boost::system::error_code content_key::apply(byte *content, std::size_t size, boost::uint64_t stream_offset) const
	{
		if (is_plain() || (size == 0))
		{
			return boost::system::error_code();
		}
		if (type != cipher_type::aes256_ctr)
		{
			return retrieval_error::decryption_failed;
		}
		std::unique_ptr<EVP_CIPHER_CTX, cipher_context_deleter> const context(EVP_CIPHER_CTX_new());
		if (!context)
		{
			return retrieval_error::decryption_failed;
		}
		std::array<byte, 16> const counter = make_counter_block(stream_offset / 16);
		if (EVP_EncryptInit_ex(context.get(), EVP_aes_256_ctr(), nullptr, key.data(), counter.data()) != 1)
		{
			return retrieval_error::decryption_failed;
		}
		int written = 0;
		std::size_t const skipped = static_cast<std::size_t>(stream_offset % 16);
		if (skipped > 0)
		{
			std::array<byte, 16> discarded;
			discarded.fill(0);
			if (EVP_EncryptUpdate(context.get(), discarded.data(), &written, discarded.data(),
			                      static_cast<int>(skipped)) != 1)
			{
				return retrieval_error::decryption_failed;
			}
		}
		std::size_t done = 0;
		while (done < size)
		{
			int const piece = static_cast<int>(std::min<std::size_t>(size - done, 1 << 20));
			if (EVP_EncryptUpdate(context.get(), content + done, &written, content + done, piece) != 1)
			{
				return retrieval_error::decryption_failed;
			}
			done += static_cast<std::size_t>(piece);
		}
		return boost::system::error_code();
	}
}
