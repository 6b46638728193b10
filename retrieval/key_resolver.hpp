#ifndef CHUNKSTREAM_KEY_RESOLVER_HPP
#define CHUNKSTREAM_KEY_RESOLVER_HPP

#include <retrieval/content_key.hpp>
#include <retrieval/layout.hpp>
#include <silicium/error_or.hpp>
#include <vector>

namespace chunkstream
{
	//! supplies the keys of encrypted objects
	struct key_resolver
	{
		virtual ~key_resolver();

		//! the key of the file whose encrypted base sector is given
		virtual Si::error_or<content_key> resolve_decryption_key(std::vector<byte> const &base_sector) = 0;

		//! decrypts everything after the layout in place
		virtual boost::system::error_code decrypt_base_sector(std::vector<byte> &base_sector,
		                                                      content_key const &file_key) = 0;

		//! the key the chunks of the fanout are encrypted with. The null key
		//! for a plaintext object.
		virtual Si::error_or<content_key> derive_fanout_key(layout const &object_layout,
		                                                    content_key const &file_key) = 0;
	};
}

#endif
