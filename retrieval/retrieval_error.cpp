#include "retrieval_error.hpp"

namespace chunkstream
{
	const char *retrieval_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "retrieval error";
	}

	std::string retrieval_error_category::message(int ev) const
	{
		switch (static_cast<retrieval_error>(ev))
		{
		case retrieval_error::range_exceeds_object:
			return "given offset and length exceed the size of the object";
		case retrieval_error::range_exceeds_chunk:
			return "given offset and length exceed the size of the chunk";
		case retrieval_error::insufficient_base_sector_data:
			return "download did not fetch enough data, layout cannot be decoded";
		case retrieval_error::malformed_base_sector:
			return "base sector is malformed";
		case retrieval_error::malformed_fanout:
			return "fanout is malformed";
		case retrieval_error::malformed_metadata:
			return "metadata is malformed";
		case retrieval_error::decryption_key_not_found:
			return "no key is known for this encrypted base sector";
		case retrieval_error::decryption_failed:
			return "decryption failed";
		case retrieval_error::insufficient_pieces:
			return "not enough pieces are available to recover the chunk";
		case retrieval_error::piece_not_found:
			return "piece not found";
		case retrieval_error::short_read:
			return "fetched fewer bytes than requested";
		case retrieval_error::abandoned_completion:
			return "the operation was abandoned before it completed";
		case retrieval_error::invalid_locator:
			return "invalid object locator";
		case retrieval_error::unsupported_redundancy:
			return "this redundancy scheme is not supported";
		case retrieval_error::base_sector_too_large:
			return "the base sector does not fit into one piece";
		case retrieval_error::nonce_generation_failed:
			return "could not generate a random nonce";
		}
		SILICIUM_UNREACHABLE();
	}

	boost::system::error_category const &get_retrieval_error_category()
	{
		static retrieval_error_category const instance;
		return instance;
	}
}
