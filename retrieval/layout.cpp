#include "layout.hpp"
#include <retrieval/retrieval_error.hpp>
#include <storage/little_endian.hpp>

//workaround for a bug in rapidjson (SizeType is "unsigned" by default)
#define RAPIDJSON_NO_SIZETYPEDEFINE
namespace rapidjson
{
	typedef ::std::size_t SizeType;
}
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <algorithm>
#include <cassert>
#include <stdexcept>

namespace chunkstream
{
	std::array<byte, layout_size> encode_layout(layout const &value)
	{
		std::array<byte, layout_size> encoded;
		auto out = encoded.begin();
		*out++ = value.version;
		out = write_little_endian(value.file_size, out);
		out = write_little_endian(value.metadata_size, out);
		out = write_little_endian(value.fanout_size, out);
		*out++ = value.fanout_data_pieces;
		*out++ = value.fanout_parity_pieces;
		out = write_little_endian(static_cast<boost::uint64_t>(value.cipher), out);
		out = std::copy(value.key_data.begin(), value.key_data.end(), out);
		assert(out == encoded.end());
		return encoded;
	}

	Si::error_or<layout> decode_layout(byte const *data, std::size_t size)
	{
		if (size < layout_size)
		{
			return boost::system::error_code(retrieval_error::insufficient_base_sector_data);
		}
		layout decoded;
		decoded.version = data[0];
		decoded.file_size = read_little_endian<boost::uint64_t>(data + 1);
		decoded.metadata_size = read_little_endian<boost::uint64_t>(data + 9);
		decoded.fanout_size = read_little_endian<boost::uint64_t>(data + 17);
		decoded.fanout_data_pieces = data[25];
		decoded.fanout_parity_pieces = data[26];
		boost::uint64_t const cipher = read_little_endian<boost::uint64_t>(data + 27);
		std::copy(data + 35, data + 35 + decoded.key_data.size(), decoded.key_data.begin());
		if (decoded.version != current_layout_version)
		{
			return boost::system::error_code(retrieval_error::malformed_base_sector);
		}
		switch (cipher)
		{
		case static_cast<boost::uint64_t>(cipher_type::plain):
		case static_cast<boost::uint64_t>(cipher_type::aes256_ctr):
			decoded.cipher = static_cast<cipher_type>(cipher);
			break;

		default:
			return boost::system::error_code(retrieval_error::malformed_base_sector);
		}
		return decoded;
	}

	std::vector<byte> serialize_metadata(object_metadata const &metadata)
	{
		rapidjson::StringBuffer buffer;
		rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
		writer.StartObject();
		writer.Key("filename");
		writer.String(metadata.filename.data(), metadata.filename.size());
		writer.Key("length");
		writer.Uint64(metadata.length);
		writer.Key("mode");
		writer.Uint(metadata.mode);
		writer.EndObject();
		char const *const serialized = buffer.GetString();
		return std::vector<byte>(serialized, serialized + buffer.GetSize());
	}

	Si::error_or<object_metadata> parse_metadata(byte const *data, std::size_t size)
	{
		rapidjson::Document document;
		document.Parse(reinterpret_cast<char const *>(data), size);
		if (document.HasParseError() || !document.IsObject())
		{
			return boost::system::error_code(retrieval_error::malformed_metadata);
		}
		object_metadata parsed;
		auto const filename = document.FindMember("filename");
		if ((filename == document.MemberEnd()) || !filename->value.IsString())
		{
			return boost::system::error_code(retrieval_error::malformed_metadata);
		}
		parsed.filename.assign(filename->value.GetString(), filename->value.GetStringLength());
		auto const length = document.FindMember("length");
		if (length != document.MemberEnd())
		{
			if (!length->value.IsUint64())
			{
				return boost::system::error_code(retrieval_error::malformed_metadata);
			}
			parsed.length = length->value.GetUint64();
		}
		auto const mode = document.FindMember("mode");
		if (mode != document.MemberEnd())
		{
			if (!mode->value.IsUint())
			{
				return boost::system::error_code(retrieval_error::malformed_metadata);
			}
			parsed.mode = mode->value.GetUint();
		}
		return std::move(parsed);
	}

	bool has_compressed_fanout(layout const &object_layout)
	{
		return (object_layout.fanout_data_pieces == 1) && (object_layout.cipher == cipher_type::plain);
	}

	namespace
	{
		std::size_t roots_per_stored_chunk(layout const &object_layout)
		{
			if (has_compressed_fanout(object_layout))
			{
				return 1;
			}
			return static_cast<std::size_t>(object_layout.fanout_data_pieces) + object_layout.fanout_parity_pieces;
		}
	}

	std::vector<byte> encode_fanout(layout const &object_layout, std::vector<fanout_chunk> const &chunks)
	{
		std::size_t const stored = roots_per_stored_chunk(object_layout);
		std::vector<byte> encoded;
		for (fanout_chunk const &chunk : chunks)
		{
			if (chunk.size() < stored)
			{
				throw std::logic_error("a fanout chunk lacks piece roots");
			}
			for (std::size_t i = 0; i < stored; ++i)
			{
				encoded.insert(encoded.end(), chunk[i].bytes.begin(), chunk[i].bytes.end());
			}
		}
		return encoded;
	}

	Si::error_or<std::vector<fanout_chunk>> decode_fanout(layout const &object_layout,
	                                                      std::vector<byte> const &fanout_bytes)
	{
		if (object_layout.fanout_data_pieces == 0)
		{
			return boost::system::error_code(retrieval_error::malformed_fanout);
		}
		std::size_t const stored = roots_per_stored_chunk(object_layout);
		std::size_t const total =
		    static_cast<std::size_t>(object_layout.fanout_data_pieces) + object_layout.fanout_parity_pieces;
		std::size_t const stored_chunk_size = stored * piece_root().bytes.size();
		if ((fanout_bytes.size() % stored_chunk_size) != 0)
		{
			return boost::system::error_code(retrieval_error::malformed_fanout);
		}
		std::vector<fanout_chunk> chunks;
		chunks.reserve(fanout_bytes.size() / stored_chunk_size);
		for (auto chunk_begin = fanout_bytes.begin(); chunk_begin != fanout_bytes.end();
		     chunk_begin += stored_chunk_size)
		{
			fanout_chunk chunk;
			chunk.reserve(total);
			for (std::size_t i = 0; i < stored; ++i)
			{
				chunk.emplace_back(chunk_begin + (i * piece_root().bytes.size()));
			}
			while (chunk.size() < total)
			{
				chunk.push_back(chunk.front());
			}
			chunks.emplace_back(std::move(chunk));
		}
		return std::move(chunks);
	}

	bool is_encrypted_base_sector(std::vector<byte> const &sector)
	{
		Si::error_or<layout> const decoded = decode_layout(sector.data(), sector.size());
		return !decoded.is_error() && (decoded.get().cipher != cipher_type::plain);
	}

	Si::error_or<parsed_base_sector> parse_base_sector(std::vector<byte> const &sector)
	{
		Si::error_or<layout> decoded = decode_layout(sector.data(), sector.size());
		if (decoded.is_error())
		{
			return decoded.error();
		}
		parsed_base_sector parsed;
		parsed.object_layout = decoded.get();
		layout const &object_layout = parsed.object_layout;

		std::size_t position = layout_size;
		std::size_t remaining = sector.size() - position;
		if (object_layout.fanout_size > remaining)
		{
			return boost::system::error_code(retrieval_error::malformed_base_sector);
		}
		std::size_t const fanout_size = static_cast<std::size_t>(object_layout.fanout_size);
		parsed.fanout.assign(sector.begin() + position, sector.begin() + position + fanout_size);
		position += fanout_size;
		remaining -= fanout_size;

		if (object_layout.metadata_size > remaining)
		{
			return boost::system::error_code(retrieval_error::malformed_base_sector);
		}
		std::size_t const metadata_size = static_cast<std::size_t>(object_layout.metadata_size);
		Si::error_or<object_metadata> metadata = parse_metadata(sector.data() + position, metadata_size);
		if (metadata.is_error())
		{
			return metadata.error();
		}
		parsed.metadata = std::move(metadata.get());
		position += metadata_size;
		remaining -= metadata_size;

		if (parsed.fanout.empty())
		{
			if (object_layout.file_size > remaining)
			{
				return boost::system::error_code(retrieval_error::malformed_base_sector);
			}
			parsed.payload.assign(sector.begin() + position,
			                      sector.begin() + position + static_cast<std::size_t>(object_layout.file_size));
		}
		return std::move(parsed);
	}

	std::vector<byte> serialize_base_sector(layout const &object_layout, std::vector<byte> const &fanout,
	                                        std::vector<byte> const &metadata, std::vector<byte> const &payload)
	{
		layout sized = object_layout;
		sized.fanout_size = fanout.size();
		sized.metadata_size = metadata.size();
		std::array<byte, layout_size> const header = encode_layout(sized);
		std::vector<byte> sector(header.begin(), header.end());
		sector.insert(sector.end(), fanout.begin(), fanout.end());
		sector.insert(sector.end(), metadata.begin(), metadata.end());
		sector.insert(sector.end(), payload.begin(), payload.end());
		return sector;
	}
}
