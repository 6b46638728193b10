#include "object_writer.hpp"
#include <retrieval/erasure_coder.hpp>
#include <retrieval/retrieval_error.hpp>
#include <storage/sha256.hpp>
#include <openssl/rand.h>
#include <algorithm>
#include <limits>

namespace chunkstream
{
	namespace
	{
		Si::error_or<piece_root> store_piece(piece_writer &pieces, std::vector<byte> const &content)
		{
			piece_root const root = sha256(content);
			boost::system::error_code const ec = pieces.write_piece(root, content);
			if (ec)
			{
				return ec;
			}
			return root;
		}

		struct object_keys
		{
			content_key file_key;
			content_key fanout_key;
		};

		Si::error_or<object_keys> prepare_encryption(layout &object_layout,
		                                             boost::optional<publish_encryption> const &encryption)
		{
			object_keys keys;
			if (!encryption)
			{
				return keys;
			}
			boost::optional<key_bytes> const master_key = encryption->keys->find(encryption->id);
			if (!master_key)
			{
				return boost::system::error_code(retrieval_error::decryption_key_not_found);
			}
			key_nonce nonce;
			if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1)
			{
				return boost::system::error_code(retrieval_error::nonce_generation_failed);
			}
			object_layout.cipher = cipher_type::aes256_ctr;
			set_key_data(object_layout, encryption->id, nonce);
			keys.file_key = derive_file_key(*master_key, nonce);

			// derive_fanout_key does not depend on the state of the key ring
			keyring derivation;
			Si::error_or<content_key> const fanout_key = derivation.derive_fanout_key(object_layout, keys.file_key);
			if (fanout_key.is_error())
			{
				return fanout_key.error();
			}
			keys.fanout_key = fanout_key.get();
			return keys;
		}

		Si::error_or<std::vector<fanout_chunk>> store_chunks(piece_writer &pieces, std::vector<byte> const &content,
		                                                     erasure_coder const &coder, content_key const &fanout_key)
		{
			std::vector<fanout_chunk> chunks;
			boost::uint64_t const chunk_size = coder.chunk_size();
			for (boost::uint64_t begin = 0, index = 0; begin < content.size(); begin += chunk_size, ++index)
			{
				std::size_t const end = static_cast<std::size_t>(std::min<boost::uint64_t>(content.size(), begin + chunk_size));
				std::vector<byte> chunk(content.begin() + static_cast<std::ptrdiff_t>(begin),
				                        content.begin() + static_cast<std::ptrdiff_t>(end));
				boost::system::error_code const encrypted = fanout_key.derive(index).apply(chunk, 0);
				if (encrypted)
				{
					return encrypted;
				}
				Si::error_or<std::vector<std::vector<byte>>> const encoded = coder.encode(chunk);
				if (encoded.is_error())
				{
					return encoded.error();
				}
				fanout_chunk roots;
				for (std::vector<byte> const &piece : encoded.get())
				{
					Si::error_or<piece_root> const stored = store_piece(pieces, piece);
					if (stored.is_error())
					{
						return stored.error();
					}
					roots.push_back(stored.get());
				}
				chunks.emplace_back(std::move(roots));
			}
			return std::move(chunks);
		}
	}

	Si::error_or<object_locator> publish_object(piece_writer &pieces, std::vector<byte> const &content,
	                                            object_metadata metadata, publish_settings const &settings,
	                                            boost::optional<publish_encryption> const &encryption)
	{
		if ((settings.data_pieces > std::numeric_limits<boost::uint8_t>::max()) ||
		    (settings.parity_pieces > std::numeric_limits<boost::uint8_t>::max()))
		{
			return boost::system::error_code(retrieval_error::unsupported_redundancy);
		}
		Si::error_or<std::shared_ptr<erasure_coder const>> const coder =
		    make_passthrough_erasure_coder(settings.data_pieces, settings.parity_pieces, settings.piece_size);
		if (coder.is_error())
		{
			return coder.error();
		}

		metadata.length = content.size();
		std::vector<byte> const serialized_metadata = serialize_metadata(metadata);

		layout object_layout;
		object_layout.file_size = content.size();
		object_layout.fanout_data_pieces = static_cast<boost::uint8_t>(settings.data_pieces);
		object_layout.fanout_parity_pieces = static_cast<boost::uint8_t>(settings.parity_pieces);
		Si::error_or<object_keys> const keys = prepare_encryption(object_layout, encryption);
		if (keys.is_error())
		{
			return keys.error();
		}

		std::vector<byte> base_sector;
		if ((layout_size + serialized_metadata.size() + content.size()) <= settings.piece_size)
		{
			base_sector = serialize_base_sector(object_layout, std::vector<byte>(), serialized_metadata, content);
		}
		else
		{
			Si::error_or<std::vector<fanout_chunk>> const chunks =
			    store_chunks(pieces, content, *coder.get(), keys.get().fanout_key);
			if (chunks.is_error())
			{
				return chunks.error();
			}
			base_sector = serialize_base_sector(object_layout, encode_fanout(object_layout, chunks.get()),
			                                    serialized_metadata, std::vector<byte>());
		}
		if ((base_sector.size() > settings.piece_size) ||
		    (base_sector.size() > std::numeric_limits<boost::uint32_t>::max()))
		{
			return boost::system::error_code(retrieval_error::base_sector_too_large);
		}

		if (encryption)
		{
			boost::system::error_code const encrypted =
			    keys.get().file_key.apply(base_sector.data() + layout_size, base_sector.size() - layout_size, 0);
			if (encrypted)
			{
				return encrypted;
			}
		}

		// The base sector is the only piece that is not padded to the piece size.
		Si::error_or<piece_root> const root = store_piece(pieces, base_sector);
		if (root.is_error())
		{
			return root.error();
		}
		return object_locator(root.get(), 0, static_cast<boost::uint32_t>(base_sector.size()));
	}
}
