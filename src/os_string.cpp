#include <iomanip>
#include <ios>
#include <iterator>

#include <boost/locale/encoding_utf.hpp>
#include <boost/locale/utf.hpp>

#include "habitat/os_string.hpp"

namespace conv = boost::locale::conv;
namespace utf = boost::locale::utf;

namespace habitat {

std::optional<std::string> os_string::to_str() const
{
    try
    {
        return conv::utf_to_utf<char>(m_bytes, conv::stop);
    }
    catch (conv::conversion_error const&)
    {
        return std::nullopt;
    }
}

std::string os_string::to_string_lossy() const
{
    using traits = utf::utf_traits<char>;
    utf::code_point constexpr replacement = 0xFFFD;

    std::string out;
    out.reserve(m_bytes.size());

    auto it = m_bytes.begin();
    auto const end = m_bytes.end();

    while (it != end)
    {
        auto const start = it;
        utf::code_point const c = traits::decode(it, end);

        if (c == utf::incomplete) {
            // a truncated sequence at the end is one replacement
            traits::encode(replacement, std::back_inserter(out));
            break;
        }
        if (c == utf::illegal) {
            traits::encode(replacement, std::back_inserter(out));
            it = start + 1;
            continue;
        }

        out.append(start, it);
    }

    return out;
}

std::filesystem::path os_string::to_path() const
{
#if defined(_WIN32)
    return std::filesystem::u8path(m_bytes);
#else
    return std::filesystem::path(m_bytes);
#endif
}

os_string to_os_string(std::filesystem::path const& p)
{
#if defined(_WIN32)
    return os_string::from_bytes(p.u8string());
#else
    return os_string::from_bytes(p.native());
#endif
}

std::ostream& operator<< (std::ostream& os, os_string const& s)
{
    os << '"';
    for (char const c : s.bytes())
    {
        auto const uc = static_cast<unsigned char>(c);
        switch (c)
        {
        case '"':  os << "\\\""; break;
        case '\\': os << "\\\\"; break;
        case '\n': os << "\\n"; break;
        case '\r': os << "\\r"; break;
        case '\t': os << "\\t"; break;
        case '\0': os << "\\0"; break;
        default:
            if (uc < 0x20 || uc >= 0x7f) {
                auto const flags = os.flags();
                os << "\\x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(uc);
                os.flags(flags);
            }
            else {
                os << c;
            }
        }
    }
    return os << '"';
}

} // namespace habitat
