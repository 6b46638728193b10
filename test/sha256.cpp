#include <storage/digest.hpp>
#include <boost/test/unit_test.hpp>

namespace
{
	std::string const abc_digest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
}

BOOST_AUTO_TEST_CASE(sha256_of_standard_containers)
{
	std::string const text = "abc";
	std::vector<chunkstream::byte> const vector(text.begin(), text.end());
	std::array<chunkstream::byte, 3> const array = {{'a', 'b', 'c'}};
	BOOST_CHECK_EQUAL(abc_digest, chunkstream::format_digest(chunkstream::sha256(text)));
	BOOST_CHECK_EQUAL(abc_digest, chunkstream::format_digest(chunkstream::sha256(vector)));
	BOOST_CHECK_EQUAL(abc_digest, chunkstream::format_digest(chunkstream::sha256(array)));
}

BOOST_AUTO_TEST_CASE(sha256_incremental_equals_whole)
{
	chunkstream::sha256_hasher hasher;
	hasher.update(std::string("a"));
	hasher.update(std::vector<chunkstream::byte>());
	std::array<chunkstream::byte, 2> const rest = {{'b', 'c'}};
	hasher.update(rest);
	BOOST_CHECK_EQUAL(abc_digest, chunkstream::format_digest(hasher.finish()));
}

BOOST_AUTO_TEST_CASE(sha256_of_nothing)
{
	BOOST_CHECK_EQUAL("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
	                  chunkstream::format_digest(chunkstream::sha256(std::string())));
}
