#ifndef CHUNKSTREAM_LOG_SINK_HPP
#define CHUNKSTREAM_LOG_SINK_HPP

#include <boost/system/error_code.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <ostream>
#include <sstream>

namespace chunkstream
{
	//! writes whole lines to a stream that is shared between threads
	struct log_sink
	{
		explicit log_sink(std::ostream &out)
			: out(&out)
		{
		}

		template <class... Parts>
		void line(char const *component, Parts const &... parts)
		{
			std::ostringstream formatted;
			formatted << component << ": ";
			append(formatted, parts...);
			formatted << '\n';
			boost::unique_lock<boost::mutex> lock(mutex);
			*out << formatted.str() << std::flush;
		}

		//! logs "operation: message" for an error that is about to be returned
		void error(char const *component, char const *operation, boost::system::error_code const &ec)
		{
			line(component, operation, ": ", ec.message(), " (", ec, ")");
		}

	private:
		boost::mutex mutex;
		std::ostream *out;

		static void append(std::ostream &)
		{
		}

		template <class First, class... Rest>
		static void append(std::ostream &formatted, First const &first, Rest const &... rest)
		{
			formatted << first;
			append(formatted, rest...);
		}
	};
}

#endif
