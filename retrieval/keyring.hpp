#ifndef CHUNKSTREAM_KEYRING_HPP
#define CHUNKSTREAM_KEYRING_HPP

#include <retrieval/key_resolver.hpp>
#include <boost/optional.hpp>
#include <boost/thread/mutex.hpp>
#include <map>

namespace chunkstream
{
	using key_id = std::array<byte, 16>;
	using key_nonce = std::array<byte, 16>;

	//! master keys by id. The key of a file is derived from the master key
	//! and the nonce in the layout's key data.
	struct keyring : key_resolver
	{
		void add(key_id const &id, key_bytes const &master_key);
		boost::optional<key_bytes> find(key_id const &id) const;

		virtual Si::error_or<content_key> resolve_decryption_key(std::vector<byte> const &base_sector) SILICIUM_OVERRIDE;
		virtual boost::system::error_code decrypt_base_sector(std::vector<byte> &base_sector,
		                                                      content_key const &file_key) SILICIUM_OVERRIDE;
		virtual Si::error_or<content_key> derive_fanout_key(layout const &object_layout,
		                                                    content_key const &file_key) SILICIUM_OVERRIDE;

	private:
		mutable boost::mutex mutex;
		std::map<key_id, key_bytes> keys;
	};

	content_key derive_file_key(key_bytes const &master_key, key_nonce const &nonce);
	key_id get_key_id(layout const &object_layout);
	key_nonce get_key_nonce(layout const &object_layout);
	void set_key_data(layout &object_layout, key_id const &id, key_nonce const &nonce);
}

#endif
