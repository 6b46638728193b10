#ifndef CHUNKSTREAM_RETRIEVAL_ERROR_HPP
#define CHUNKSTREAM_RETRIEVAL_ERROR_HPP

#include <silicium/config.hpp>
#include <boost/system/system_error.hpp>

namespace chunkstream
{
	enum class retrieval_error
	{
		range_exceeds_object = 1,
		range_exceeds_chunk,
		insufficient_base_sector_data,
		malformed_base_sector,
		malformed_fanout,
		malformed_metadata,
		decryption_key_not_found,
		decryption_failed,
		insufficient_pieces,
		piece_not_found,
		short_read,
		abandoned_completion,
		invalid_locator,
		unsupported_redundancy,
		base_sector_too_large,
		nonce_generation_failed
	};

	struct retrieval_error_category : boost::system::error_category
	{
		virtual const char *name() const BOOST_SYSTEM_NOEXCEPT SILICIUM_OVERRIDE;
		virtual std::string message(int ev) const SILICIUM_OVERRIDE;
	};

	boost::system::error_category const &get_retrieval_error_category();

	inline boost::system::error_code make_error_code(retrieval_error error)
	{
		return boost::system::error_code(static_cast<int>(error), get_retrieval_error_category());
	}
}

namespace boost
{
	namespace system
	{
		template <>
		struct is_error_code_enum<chunkstream::retrieval_error> : std::true_type
		{
		};
	}
}

#endif
