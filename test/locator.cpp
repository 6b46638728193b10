#include <retrieval/locator.hpp>
#include <retrieval/retrieval_error.hpp>
#include <storage/sha256.hpp>
#include <boost/test/unit_test.hpp>

namespace
{
	chunkstream::object_locator make_locator()
	{
		std::string const name = "base sector";
		return chunkstream::object_locator(chunkstream::sha256(name), 0x01020304u, 4096);
	}
}

BOOST_AUTO_TEST_CASE(locator_text_form)
{
	chunkstream::object_locator const locator = make_locator();
	std::string const formatted = chunkstream::format_locator(locator);
	BOOST_REQUIRE_EQUAL(80u, formatted.size());
	BOOST_CHECK_EQUAL(chunkstream::format_digest(locator.root), formatted.substr(0, 64));
	BOOST_CHECK_EQUAL("04030201" "00100000", formatted.substr(64));

	Si::error_or<chunkstream::object_locator> const parsed = chunkstream::parse_locator(formatted);
	BOOST_REQUIRE(!parsed.is_error());
	BOOST_CHECK(locator == parsed.get());
}

BOOST_AUTO_TEST_CASE(locator_rejects_invalid_text)
{
	std::string const valid = chunkstream::format_locator(make_locator());
	std::string const invalid[] = {"", valid.substr(0, 78), valid + "00", valid.substr(0, 79) + "x",
	                               valid.substr(0, 72) + "00000000"};
	for (std::string const &text : invalid)
	{
		Si::error_or<chunkstream::object_locator> const parsed = chunkstream::parse_locator(text);
		BOOST_REQUIRE(parsed.is_error());
		BOOST_CHECK(parsed.error() == chunkstream::retrieval_error::invalid_locator);
	}
}

BOOST_AUTO_TEST_CASE(locator_identity_depends_on_every_field)
{
	chunkstream::object_locator const locator = make_locator();
	chunkstream::data_source_id const id = chunkstream::make_data_source_id(locator);
	BOOST_CHECK(id == chunkstream::make_data_source_id(make_locator()));

	chunkstream::object_locator other_offset = locator;
	other_offset.offset += 1;
	BOOST_CHECK(id != chunkstream::make_data_source_id(other_offset));

	chunkstream::object_locator other_length = locator;
	other_length.length += 1;
	BOOST_CHECK(id != chunkstream::make_data_source_id(other_length));
}
