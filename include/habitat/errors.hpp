#ifndef HABITAT_ERRORS_HPP
#define HABITAT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>

#include "os_string.hpp"

namespace habitat {

    // lookup of a variable through the unicode api failed
    class var_error : public std::runtime_error
    {
    public:
        enum kind_t { not_present, not_unicode };

        static var_error make_not_present();
        static var_error make_not_unicode(os_string raw);

        kind_t kind() const noexcept { return m_kind; }

        // the undecodable value, empty for not_present
        os_string const& raw_value() const noexcept { return m_raw; }

    private:
        var_error(kind_t k, os_string raw, std::string const& what)
            : std::runtime_error(what), m_kind(k), m_raw(std::move(raw))
        {}

        kind_t m_kind;
        os_string m_raw;
    };

    // a path can't be written as a single entry of a PATH-like list
    class join_paths_error : public std::runtime_error
    {
    public:
        join_paths_error(os_string path, std::size_t index, char offending);

        os_string const& path() const noexcept { return m_path; }
        std::size_t index() const noexcept { return m_index; }
        char offending_char() const noexcept { return m_char; }

    private:
        os_string m_path;
        std::size_t m_index;
        char m_char;
    };

    /* Programmer error: malformed variable key or value, a non-unicode
       element reached through a unicode api, or a snapshot used from
       another thread. Raised before anything is applied.
    */
    class contract_violation : public std::logic_error
    {
    public:
        using std::logic_error::logic_error;
    };

} // namespace habitat

#endif // HABITAT_ERRORS_HPP
