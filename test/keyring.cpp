#include "test_doubles.hpp"
#include <retrieval/keyring.hpp>
#include <boost/test/unit_test.hpp>

namespace
{
	using chunkstream::byte;

	chunkstream::key_bytes make_key(byte fill)
	{
		chunkstream::key_bytes key;
		key.fill(fill);
		return key;
	}

	chunkstream::key_id make_id(byte fill)
	{
		chunkstream::key_id id;
		id.fill(fill);
		return id;
	}
}

BOOST_AUTO_TEST_CASE(content_key_null_key_changes_nothing)
{
	std::vector<byte> const original = chunkstream::test::make_pattern(100);
	std::vector<byte> content = original;
	chunkstream::content_key const null_key;
	BOOST_CHECK(!null_key.apply(content, 17));
	BOOST_CHECK(original == content);
	BOOST_CHECK(null_key.derive(3).is_plain());
}

BOOST_AUTO_TEST_CASE(content_key_stream_offset_is_random_access)
{
	chunkstream::content_key const key(chunkstream::cipher_type::aes256_ctr, make_key(7));
	std::vector<byte> const original = chunkstream::test::make_pattern(200);
	std::vector<byte> whole = original;
	BOOST_REQUIRE(!key.apply(whole, 0));
	BOOST_CHECK(original != whole);

	std::size_t const offsets[] = {0, 1, 15, 16, 17, 100, 199};
	for (std::size_t offset : offsets)
	{
		std::vector<byte> part = chunkstream::test::slice(original, offset, original.size() - offset);
		BOOST_REQUIRE(!key.apply(part, offset));
		BOOST_CHECK(chunkstream::test::slice(whole, offset, original.size() - offset) == part);
	}

	BOOST_REQUIRE(!key.apply(whole, 0));
	BOOST_CHECK(original == whole);
}

BOOST_AUTO_TEST_CASE(content_key_chunks_get_independent_keys)
{
	chunkstream::content_key const key(chunkstream::cipher_type::aes256_ctr, make_key(7));
	BOOST_CHECK(key.derive(0).key != key.derive(1).key);
	BOOST_CHECK(key.derive(0).key != key.key);
	BOOST_CHECK(key.derive(5).key == key.derive(5).key);
}

BOOST_AUTO_TEST_CASE(keyring_decrypts_base_sector)
{
	chunkstream::keyring keys;
	keys.add(make_id(1), make_key(9));

	chunkstream::layout object_layout;
	object_layout.file_size = 3;
	object_layout.fanout_data_pieces = 1;
	object_layout.cipher = chunkstream::cipher_type::aes256_ctr;
	chunkstream::key_nonce nonce;
	nonce.fill(4);
	chunkstream::set_key_data(object_layout, make_id(1), nonce);
	BOOST_CHECK(make_id(1) == chunkstream::get_key_id(object_layout));
	BOOST_CHECK(nonce == chunkstream::get_key_nonce(object_layout));

	chunkstream::object_metadata metadata;
	metadata.filename = "secret";
	std::vector<byte> const payload = {1, 2, 3};
	std::vector<byte> sector = chunkstream::serialize_base_sector(
	    object_layout, std::vector<byte>(), chunkstream::serialize_metadata(metadata), payload);
	chunkstream::content_key const file_key = chunkstream::derive_file_key(make_key(9), nonce);
	BOOST_REQUIRE(!file_key.apply(sector.data() + chunkstream::layout_size, sector.size() - chunkstream::layout_size, 0));
	BOOST_REQUIRE(chunkstream::is_encrypted_base_sector(sector));
	BOOST_CHECK(chunkstream::parse_base_sector(sector).is_error());

	Si::error_or<chunkstream::content_key> const resolved = keys.resolve_decryption_key(sector);
	BOOST_REQUIRE(!resolved.is_error());
	BOOST_CHECK(resolved.get().key == file_key.key);
	BOOST_REQUIRE(!keys.decrypt_base_sector(sector, resolved.get()));

	Si::error_or<chunkstream::parsed_base_sector> const parsed = chunkstream::parse_base_sector(sector);
	BOOST_REQUIRE(!parsed.is_error());
	BOOST_CHECK_EQUAL("secret", parsed.get().metadata.filename);
	BOOST_CHECK(payload == parsed.get().payload);
}

BOOST_AUTO_TEST_CASE(keyring_unknown_key_id)
{
	chunkstream::keyring keys;
	keys.add(make_id(1), make_key(9));
	chunkstream::layout object_layout;
	object_layout.cipher = chunkstream::cipher_type::aes256_ctr;
	chunkstream::key_nonce nonce;
	nonce.fill(0);
	chunkstream::set_key_data(object_layout, make_id(2), nonce);
	std::array<byte, chunkstream::layout_size> const header = chunkstream::encode_layout(object_layout);
	Si::error_or<chunkstream::content_key> const resolved =
	    keys.resolve_decryption_key(std::vector<byte>(header.begin(), header.end()));
	BOOST_REQUIRE(resolved.is_error());
	BOOST_CHECK(resolved.error() == chunkstream::retrieval_error::decryption_key_not_found);
}

BOOST_AUTO_TEST_CASE(keyring_fanout_key)
{
	chunkstream::keyring keys;
	chunkstream::layout plain_layout;
	Si::error_or<chunkstream::content_key> const plain = keys.derive_fanout_key(plain_layout, chunkstream::content_key());
	BOOST_REQUIRE(!plain.is_error());
	BOOST_CHECK(plain.get().is_plain());

	chunkstream::layout encrypted_layout;
	encrypted_layout.cipher = chunkstream::cipher_type::aes256_ctr;
	chunkstream::content_key const file_key(chunkstream::cipher_type::aes256_ctr, make_key(3));
	Si::error_or<chunkstream::content_key> const fanout = keys.derive_fanout_key(encrypted_layout, file_key);
	BOOST_REQUIRE(!fanout.is_error());
	BOOST_CHECK(!fanout.get().is_plain());
	BOOST_CHECK(fanout.get().key != file_key.key);

	BOOST_CHECK(keys.derive_fanout_key(encrypted_layout, chunkstream::content_key()).error() ==
	            chunkstream::retrieval_error::decryption_key_not_found);
}
