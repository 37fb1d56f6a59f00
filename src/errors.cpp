#include <sstream>

#include "habitat/errors.hpp"

namespace habitat {

var_error var_error::make_not_present()
{
    return var_error(not_present, {}, "environment variable not found");
}

var_error var_error::make_not_unicode(os_string raw)
{
    std::ostringstream msg;
    msg << "environment variable was not valid unicode: " << raw;
    return var_error(not_unicode, std::move(raw), msg.str());
}

namespace {

    std::string join_paths_message(os_string const& path, std::size_t index, char offending)
    {
        std::ostringstream msg;
        msg << "path segment " << index << " contains `" << offending << "`: " << path;
        return msg.str();
    }

} // unnamed namespace

join_paths_error::join_paths_error(os_string path, std::size_t index, char offending)
    : std::runtime_error(join_paths_message(path, index, offending))
    , m_path(std::move(path))
    , m_index(index)
    , m_char(offending)
{}

} // namespace habitat
