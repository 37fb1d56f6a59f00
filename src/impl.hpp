#ifndef HABITAT_SRC_IMPL_HPP
#define HABITAT_SRC_IMPL_HPP

#include <vector>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include "habitat/config.h"
#include "habitat/os_string.hpp"

namespace habitat::impl {

namespace logging = boost::log;
namespace trivial = boost::log::trivial;

BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(logger, logging::sources::severity_logger_mt<trivial::severity_level>)

// key validation, throws contract_violation
void check_key(os_string const& key);
void check_value(os_string const& key, os_string const& value);

} /* namespace habitat::impl */

#define HABITAT_LOG(severity) \
    BOOST_LOG_SEV(::habitat::impl::logger::get(), ::boost::log::trivial::severity)

#endif /* HABITAT_SRC_IMPL_HPP */
