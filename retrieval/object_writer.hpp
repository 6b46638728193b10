#ifndef CHUNKSTREAM_OBJECT_WRITER_HPP
#define CHUNKSTREAM_OBJECT_WRITER_HPP

#include <retrieval/keyring.hpp>
#include <retrieval/locator.hpp>
#include <retrieval/settings.hpp>
#include <piece_store/piece_store.hpp>
#include <boost/optional.hpp>

namespace chunkstream
{
	struct publish_encryption
	{
		//! the master key has to be in this key ring
		keyring const *keys;
		key_id id;
	};

	//! Stores an object as pieces and returns the locator of its base
	//! sector. An object that fits into the base sector together with its
	//! layout and metadata is stored inline, larger objects get a fanout.
	//! metadata.length is set to the size of the content.
	Si::error_or<object_locator> publish_object(piece_writer &pieces, std::vector<byte> const &content,
	                                            object_metadata metadata, publish_settings const &settings,
	                                            boost::optional<publish_encryption> const &encryption);
}

#endif
