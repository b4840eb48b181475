#include "Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <cstdlib>
#include <iostream>

namespace creak {

void initLogging()
{
    namespace logging = boost::log;
    namespace expr = boost::log::expressions;

    const char* debug = std::getenv("CREAK_DEBUG");
    const auto threshold = (debug && *debug) ? logging::trivial::debug
                                             : logging::trivial::warning;

    logging::add_console_log(std::clog,
        logging::keywords::format = (expr::stream
            << "creak: " << logging::trivial::severity << ": " << expr::smessage));
    logging::core::get()->set_filter(logging::trivial::severity >= threshold);
}

} // namespace creak
