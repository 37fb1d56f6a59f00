#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include "habitat/log.hpp"

namespace logging = boost::log;
namespace trivial = boost::log::trivial;

namespace habitat {

void init_logging(std::string_view level)
{
    auto severity = trivial::info;

    if (level == "trace") {
        severity = trivial::trace;
    } else if (level == "debug") {
        severity = trivial::debug;
    } else if (level == "info") {
        severity = trivial::info;
    } else if (level == "warning") {
        severity = trivial::warning;
    } else if (level == "error") {
        severity = trivial::error;
    } else if (level == "fatal") {
        severity = trivial::fatal;
    }

    logging::core::get()->set_filter(trivial::severity >= severity);
}

} // namespace habitat
