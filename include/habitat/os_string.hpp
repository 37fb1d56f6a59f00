#ifndef HABITAT_OS_STRING_HPP
#define HABITAT_OS_STRING_HPP

#include <string>
#include <string_view>
#include <optional>
#include <filesystem>
#include <ostream>

namespace habitat {

    /* A string as the OS hands it over.

       On POSIX this is the raw byte sequence, which is not required to be
       valid UTF-8. On Windows it holds the UTF-8 form of the wide string.
    */
    class os_string
    {
    public:
        using size_type = std::string::size_type;

        os_string() = default;
        os_string(char const* s) : m_bytes(s ? s : "") {}
        os_string(std::string s) noexcept : m_bytes(std::move(s)) {}
        os_string(std::string_view s) : m_bytes(s) {}

        static os_string from_bytes(std::string bytes) noexcept {
            return os_string(std::move(bytes));
        }

        std::string_view bytes() const noexcept { return m_bytes; }
        char const* c_str() const noexcept { return m_bytes.c_str(); }

        size_type size() const noexcept { return m_bytes.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_bytes.empty(); }

        bool contains(char ch) const noexcept {
            return m_bytes.find(ch) != std::string::npos;
        }

        // nullopt if the bytes are not valid UTF-8
        std::optional<std::string> to_str() const;

        // each invalid byte becomes U+FFFD
        std::string to_string_lossy() const;

        std::filesystem::path to_path() const;

        friend bool operator== (os_string const& a, os_string const& b) noexcept {
            return a.m_bytes == b.m_bytes;
        }
        friend bool operator!= (os_string const& a, os_string const& b) noexcept {
            return !(a == b);
        }
        friend bool operator< (os_string const& a, os_string const& b) noexcept {
            return a.m_bytes < b.m_bytes;
        }

    private:
        std::string m_bytes;
    };

    // escaped form, for diagnostics
    std::ostream& operator<< (std::ostream& os, os_string const& s);

    os_string to_os_string(std::filesystem::path const& p);

} // namespace habitat

#endif // HABITAT_OS_STRING_HPP
