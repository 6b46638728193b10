#include <piece_store/directory_piece_store.hpp>
#include <retrieval/object_writer.hpp>
#include <retrieval/retrieval_service.hpp>
#include <silicium/source/source.hpp>
#include <ventura/open.hpp>
#include <ventura/source/file_source.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <tuple>

namespace
{
	Si::error_or<std::vector<chunkstream::byte>> read_whole_file(boost::filesystem::path const &name)
	{
		boost::optional<ventura::absolute_path> const file = ventura::absolute_path::create(boost::filesystem::absolute(name));
		if (!file)
		{
			return boost::system::error_code(boost::system::errc::invalid_argument, boost::system::generic_category());
		}
		Si::error_or<Si::file_handle> opening = ventura::open_reading(ventura::safe_c_str(to_native_range(*file)));
		if (opening.is_error())
		{
			return opening.error();
		}
		Si::file_handle opened = opening.move_value();
		std::vector<chunkstream::byte> content;
		std::array<char, 8192> buffer;
		auto file_content = ventura::make_file_source(opened.handle, Si::make_memory_range(buffer.data(), buffer.data() + buffer.size()));
		for (;;)
		{
			auto piece = Si::get(file_content);
			if (!piece)
			{
				break;
			}
			if (piece->is_error())
			{
				return piece->error();
			}
			Si::memory_range const received = piece->get();
			if (received.empty())
			{
				break;
			}
			content.insert(content.end(), received.begin(), received.end());
		}
		return std::move(content);
	}

	struct options
	{
		std::string verb;
		std::string argument;
		boost::filesystem::path store = boost::filesystem::current_path();
		std::size_t piece_size = chunkstream::default_piece_size;
		std::size_t data_pieces = 1;
		std::size_t parity_pieces = 0;
		std::size_t threads = 8;
		chunkstream::price_per_ms price = 0;
		boost::uint64_t timeout_ms = 0;
		boost::uint64_t offset = 0;
		boost::optional<boost::uint64_t> length;
		std::string key_id;
		std::string key;
		std::string name;
	};

	bool load_key(options const &parsed, chunkstream::keyring &keys, boost::optional<chunkstream::key_id> &id)
	{
		if (parsed.key_id.empty() && parsed.key.empty())
		{
			return true;
		}
		boost::optional<chunkstream::key_id> const decoded_id =
		    chunkstream::parse_hex_bytes<std::tuple_size<chunkstream::key_id>::value>(parsed.key_id);
		if (!decoded_id)
		{
			std::cerr << "The key id must be 32 hexadecimal digits.\n";
			return false;
		}
		boost::optional<chunkstream::key_bytes> const decoded_key =
		    chunkstream::parse_hex_bytes<std::tuple_size<chunkstream::key_bytes>::value>(parsed.key);
		if (!decoded_key)
		{
			std::cerr << "The key must be 64 hexadecimal digits.\n";
			return false;
		}
		keys.add(*decoded_id, *decoded_key);
		id = decoded_id;
		return true;
	}

	int publish(options const &parsed, chunkstream::directory_piece_store &store, chunkstream::keyring &keys,
	            boost::optional<chunkstream::key_id> const &id)
	{
		Si::error_or<std::vector<chunkstream::byte>> const content = read_whole_file(parsed.argument);
		if (content.is_error())
		{
			std::cerr << "Could not read " << parsed.argument << ": " << content.error().message() << '\n';
			return 1;
		}

		chunkstream::object_metadata metadata;
		metadata.filename = parsed.name.empty() ? boost::filesystem::path(parsed.argument).filename().string() : parsed.name;

		chunkstream::publish_settings settings;
		settings.piece_size = parsed.piece_size;
		settings.data_pieces = parsed.data_pieces;
		settings.parity_pieces = parsed.parity_pieces;

		boost::optional<chunkstream::publish_encryption> encryption;
		if (id)
		{
			encryption = chunkstream::publish_encryption{&keys, *id};
		}

		Si::error_or<chunkstream::object_locator> const locator =
		    chunkstream::publish_object(store, content.get(), metadata, settings, encryption);
		if (locator.is_error())
		{
			std::cerr << "Could not publish: " << locator.error().message() << '\n';
			return 1;
		}
		std::cout << chunkstream::format_locator(locator.get()) << '\n';
		return 0;
	}

	int info(chunkstream::data_source &source)
	{
		chunkstream::layout const &object_layout = source.object_layout();
		std::cout
			<< "filename: " << source.metadata().filename << '\n'
			<< "size: " << source.total_size() << '\n'
			<< "mode: " << std::oct << source.metadata().mode << std::dec << '\n'
			<< "encrypted: " << (object_layout.cipher == chunkstream::cipher_type::plain ? "no" : "yes") << '\n'
			<< "data pieces: " << static_cast<unsigned>(object_layout.fanout_data_pieces) << '\n'
			<< "parity pieces: " << static_cast<unsigned>(object_layout.fanout_parity_pieces) << '\n'
			<< "chunks: " << source.chunk_count() << '\n';
		return 0;
	}

	int get_range(options const &parsed, chunkstream::data_source &source, chunkstream::cancellation const &call)
	{
		if (parsed.offset > source.total_size())
		{
			std::cerr << "The offset is beyond the end of the object\n";
			return 1;
		}
		boost::uint64_t const length = parsed.length ? *parsed.length : (source.total_size() - parsed.offset);
		boost::uint64_t position = parsed.offset;
		boost::uint64_t const end = parsed.offset + length;
		while (position < end)
		{
			boost::uint64_t const request = std::min<boost::uint64_t>(source.preferred_request_size(), end - position);
			Si::error_or<std::vector<chunkstream::byte>> const received = source.read(call, position, request, parsed.price).get();
			if (received.is_error())
			{
				std::cerr << "Read at " << position << " failed: " << received.error().message() << '\n';
				return 1;
			}
			std::cout.write(reinterpret_cast<char const *>(received.get().data()), static_cast<std::streamsize>(received.get().size()));
			position += received.get().size();
		}
		std::cout.flush();
		return 0;
	}
}

int main(int argc, char **argv)
{
	options parsed;
	std::string length;

	boost::program_options::options_description desc("Allowed options");
	desc.add_options()
	    ("help", "produce help message")
		("verb", boost::program_options::value(&parsed.verb), "what to do (publish, info, get)")
		("argument", boost::program_options::value(&parsed.argument), "the file to publish or the locator to read")
		("store", boost::program_options::value(&parsed.store), "the directory the pieces are kept in")
		("piece-size", boost::program_options::value(&parsed.piece_size), "the size of every piece in bytes")
		("data-pieces", boost::program_options::value(&parsed.data_pieces), "data pieces per chunk")
		("parity-pieces", boost::program_options::value(&parsed.parity_pieces), "parity pieces per chunk")
		("threads", boost::program_options::value(&parsed.threads), "number of download threads")
		("price", boost::program_options::value(&parsed.price), "maximum price per millisecond")
		("timeout-ms", boost::program_options::value(&parsed.timeout_ms), "give up after this many milliseconds")
		("offset", boost::program_options::value(&parsed.offset), "the first byte to get")
		("length", boost::program_options::value(&length), "the number of bytes to get")
		("key-id", boost::program_options::value(&parsed.key_id), "32 hex digits naming the key")
		("key", boost::program_options::value(&parsed.key), "64 hex digits of the master key")
		("name", boost::program_options::value(&parsed.name), "the file name to publish under")
	;

	boost::program_options::positional_options_description positional;
	positional.add("verb", 1);
	positional.add("argument", 1);
	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store(boost::program_options::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
		boost::program_options::notify(vm);
	}
	catch (boost::program_options::error const &ex)
	{
		std::cerr
			<< ex.what() << '\n'
			<< desc << "\n";
		return 1;
	}

	if (vm.count("help"))
	{
	    std::cerr << desc << "\n";
	    return 1;
	}

	if (vm.count("length"))
	{
		try
		{
			parsed.length = boost::lexical_cast<boost::uint64_t>(length);
		}
		catch (boost::bad_lexical_cast const &)
		{
			std::cerr << "The length must be a number\n";
			return 1;
		}
	}

	if (parsed.argument.empty())
	{
		std::cerr
			<< "Missing argument\n"
			<< desc << "\n";
		return 1;
	}

	boost::optional<ventura::absolute_path> const store_root = ventura::absolute_path::create(boost::filesystem::absolute(parsed.store));
	if (!store_root)
	{
		std::cerr << "Invalid store directory\n";
		return 1;
	}
	chunkstream::directory_piece_store store(*store_root);
	chunkstream::keyring keys;
	boost::optional<chunkstream::key_id> id;
	if (!load_key(parsed, keys, id))
	{
		return 1;
	}

	if (parsed.verb == "publish")
	{
		return publish(parsed, store, keys, id);
	}
	if ((parsed.verb != "info") && (parsed.verb != "get"))
	{
		std::cerr
			<< "Unknown verb\n"
			<< desc << "\n";
	    return 1;
	}

	Si::error_or<chunkstream::object_locator> const locator = chunkstream::parse_locator(parsed.argument);
	if (locator.is_error())
	{
		std::cerr << "The locator must be 80 hexadecimal digits\n";
		return 1;
	}

	chunkstream::log_sink log(std::cerr);
	chunkstream::retrieval_settings settings;
	settings.piece_size = parsed.piece_size;
	settings.worker_threads = std::max<std::size_t>(1, parsed.threads);
	chunkstream::retrieval_service service(store, keys, log, settings);

	chunkstream::cancellation const call;
	boost::optional<chunkstream::watchdog> timeout;
	if (parsed.timeout_ms > 0)
	{
		timeout.emplace(service.executor().get_io_service(), std::chrono::milliseconds(parsed.timeout_ms), call);
	}

	Si::error_or<std::shared_ptr<chunkstream::data_source>> const source = service.open(locator.get(), parsed.price, call);
	if (source.is_error())
	{
		std::cerr << "Could not open " << parsed.argument << ": " << source.error().message() << '\n';
		return 1;
	}
	if (parsed.verb == "info")
	{
		return info(*source.get());
	}
	return get_range(parsed, *source.get(), call);
}
