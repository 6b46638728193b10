#include <piece_store/directory_piece_store.hpp>
#include <retrieval/retrieval_error.hpp>
#include <storage/sha256.hpp>
#include <boost/asio/error.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/test/unit_test.hpp>

namespace
{
	using chunkstream::byte;

	struct temporary_directory
	{
		boost::filesystem::path path;

		temporary_directory()
			: path(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path())
		{
			boost::filesystem::create_directories(path);
		}

		~temporary_directory()
		{
			boost::system::error_code ignored;
			boost::filesystem::remove_all(path, ignored);
		}

		ventura::absolute_path absolute() const
		{
			return *ventura::absolute_path::create(path);
		}
	};
}

BOOST_AUTO_TEST_CASE(directory_piece_store_write_and_read)
{
	temporary_directory const directory;
	chunkstream::directory_piece_store store(directory.absolute());
	std::vector<byte> content(20000);
	for (std::size_t i = 0; i < content.size(); ++i)
	{
		content[i] = static_cast<byte>(i % 251);
	}
	chunkstream::piece_root const root = chunkstream::sha256(content);
	chunkstream::cancellation const scope;

	BOOST_CHECK(!store.has_piece(root, scope).get());
	BOOST_REQUIRE(!store.write_piece(root, content));
	BOOST_CHECK(store.has_piece(root, scope).get());
	BOOST_CHECK(boost::filesystem::exists(directory.path / chunkstream::format_digest(root)));

	// writing the same content again is a no-op
	BOOST_REQUIRE(!store.write_piece(root, content));

	Si::error_or<std::vector<byte>> const read = store.read_piece(root, 9000, 10000, 0, scope);
	BOOST_REQUIRE(!read.is_error());
	BOOST_CHECK(std::vector<byte>(content.begin() + 9000, content.begin() + 19000) == read.get());
}

BOOST_AUTO_TEST_CASE(directory_piece_store_errors)
{
	temporary_directory const directory;
	chunkstream::directory_piece_store store(directory.absolute());
	std::vector<byte> const content(100, 7);
	chunkstream::piece_root const root = chunkstream::sha256(content);
	chunkstream::cancellation const scope;

	BOOST_CHECK(store.read_piece(root, 0, 10, 0, scope).error() == chunkstream::retrieval_error::piece_not_found);

	BOOST_REQUIRE(!store.write_piece(root, content));
	BOOST_CHECK(store.read_piece(root, 90, 20, 0, scope).error() == chunkstream::retrieval_error::short_read);

	chunkstream::cancellation const cancelled;
	cancelled.cancel();
	BOOST_CHECK(store.read_piece(root, 0, 10, 0, cancelled).error() == boost::asio::error::operation_aborted);
	BOOST_CHECK(store.has_piece(root, cancelled).error() == boost::asio::error::operation_aborted);
}
