#ifndef CHUNKSTREAM_LAYOUT_HPP
#define CHUNKSTREAM_LAYOUT_HPP

#include <storage/digest.hpp>
#include <retrieval/content_key.hpp>
#include <silicium/error_or.hpp>
#include <boost/cstdint.hpp>
#include <array>
#include <string>
#include <vector>

namespace chunkstream
{
	std::size_t const layout_size = 99;
	boost::uint8_t const current_layout_version = 1;

	//! the fixed size header at the beginning of every base sector
	struct layout
	{
		boost::uint8_t version;
		boost::uint64_t file_size;
		boost::uint64_t metadata_size;
		boost::uint64_t fanout_size;
		boost::uint8_t fanout_data_pieces;
		boost::uint8_t fanout_parity_pieces;
		cipher_type cipher;
		//! 16 bytes key id, 16 bytes nonce, the rest is reserved
		std::array<byte, 64> key_data;

		layout()
			: version(current_layout_version)
			, file_size(0)
			, metadata_size(0)
			, fanout_size(0)
			, fanout_data_pieces(0)
			, fanout_parity_pieces(0)
			, cipher(cipher_type::plain)
		{
			key_data.fill(0);
		}
	};

	std::array<byte, layout_size> encode_layout(layout const &value);
	Si::error_or<layout> decode_layout(byte const *data, std::size_t size);

	struct object_metadata
	{
		std::string filename;
		boost::uint64_t length;
		boost::uint32_t mode;

		object_metadata()
			: length(0)
			, mode(0644)
		{
		}
	};

	std::vector<byte> serialize_metadata(object_metadata const &metadata);
	Si::error_or<object_metadata> parse_metadata(byte const *data, std::size_t size);

	//! the roots of the pieces of one chunk, in piece index order
	using fanout_chunk = std::vector<piece_root>;

	//! true when a fanout chunk is stored as one root standing for all of its replicas
	bool has_compressed_fanout(layout const &object_layout);
	std::vector<byte> encode_fanout(layout const &object_layout, std::vector<fanout_chunk> const &chunks);
	//! every returned chunk has fanout_data_pieces + fanout_parity_pieces roots
	Si::error_or<std::vector<fanout_chunk>> decode_fanout(layout const &object_layout,
	                                                      std::vector<byte> const &fanout_bytes);

	struct parsed_base_sector
	{
		layout object_layout;
		std::vector<byte> fanout;
		object_metadata metadata;
		//! the whole object if the fanout is empty
		std::vector<byte> payload;
	};

	bool is_encrypted_base_sector(std::vector<byte> const &sector);
	Si::error_or<parsed_base_sector> parse_base_sector(std::vector<byte> const &sector);
	std::vector<byte> serialize_base_sector(layout const &object_layout, std::vector<byte> const &fanout,
	                                        std::vector<byte> const &metadata, std::vector<byte> const &payload);
}

#endif
