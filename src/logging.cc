#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <iostream>

#include "logging.h"

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace trivial = boost::log::trivial;

void init_logging(bool verbose)
{
	logging::add_common_attributes();
	logging::add_console_log(
	    std::clog,
	    keywords::auto_flush = true,
	    keywords::format = (expr::stream << "["
					     << expr::format_date_time<boost::posix_time::ptime>(
						    "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
					     << "] [" << trivial::severity << "] "
					     << expr::smessage));
	logging::core::get()->set_filter(trivial::severity >=
					 (verbose ? trivial::trace : trivial::info));
}
