#include "keyring.hpp"
#include <retrieval/retrieval_error.hpp>
#include <storage/sha256.hpp>
#include <boost/thread/locks.hpp>
#include <algorithm>

namespace chunkstream
{
	key_resolver::~key_resolver()
	{
	}

	void keyring::add(key_id const &id, key_bytes const &master_key)
	{
		boost::unique_lock<boost::mutex> lock(mutex);
		keys[id] = master_key;
	}

	boost::optional<key_bytes> keyring::find(key_id const &id) const
	{
		boost::unique_lock<boost::mutex> lock(mutex);
		auto const found = keys.find(id);
		if (found == keys.end())
		{
			return boost::none;
		}
		return found->second;
	}

	Si::error_or<content_key> keyring::resolve_decryption_key(std::vector<byte> const &base_sector)
	{
		Si::error_or<layout> const decoded = decode_layout(base_sector.data(), base_sector.size());
		if (decoded.is_error())
		{
			return decoded.error();
		}
		boost::optional<key_bytes> const master_key = find(get_key_id(decoded.get()));
		if (!master_key)
		{
			return boost::system::error_code(retrieval_error::decryption_key_not_found);
		}
		return derive_file_key(*master_key, get_key_nonce(decoded.get()));
	}

	boost::system::error_code keyring::decrypt_base_sector(std::vector<byte> &base_sector, content_key const &file_key)
	{
		if (base_sector.size() < layout_size)
		{
			return retrieval_error::insufficient_base_sector_data;
		}
		return file_key.apply(base_sector.data() + layout_size, base_sector.size() - layout_size, 0);
	}

	Si::error_or<content_key> keyring::derive_fanout_key(layout const &object_layout, content_key const &file_key)
	{
		if (object_layout.cipher == cipher_type::plain)
		{
			return content_key();
		}
		if (file_key.is_plain())
		{
			return boost::system::error_code(retrieval_error::decryption_key_not_found);
		}
		sha256_hasher hasher;
		hasher.update(file_key.key);
		static char const label[] = "fanout";
		hasher.update(label, sizeof(label) - 1);
		return content_key(object_layout.cipher, hasher.finish().bytes);
	}

	content_key derive_file_key(key_bytes const &master_key, key_nonce const &nonce)
	{
		sha256_hasher hasher;
		hasher.update(master_key);
		hasher.update(nonce);
		return content_key(cipher_type::aes256_ctr, hasher.finish().bytes);
	}

	key_id get_key_id(layout const &object_layout)
	{
		key_id id;
		std::copy(object_layout.key_data.begin(), object_layout.key_data.begin() + id.size(), id.begin());
		return id;
	}

	key_nonce get_key_nonce(layout const &object_layout)
	{
		key_nonce nonce;
		auto const begin = object_layout.key_data.begin() + key_id().size();
		std::copy(begin, begin + nonce.size(), nonce.begin());
		return nonce;
	}

	void set_key_data(layout &object_layout, key_id const &id, key_nonce const &nonce)
	{
		object_layout.key_data.fill(0);
		auto out = std::copy(id.begin(), id.end(), object_layout.key_data.begin());
		std::copy(nonce.begin(), nonce.end(), out);
	}
}
