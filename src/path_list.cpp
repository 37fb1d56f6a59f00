#include "habitat/path_list.hpp"
#include "impl.hpp"

namespace habitat {

void split_paths_view::cursor::parse()
{
    m_current.clear();

    std::string const& list = *m_list;
    bool quoted = false;
    std::size_t i = m_pos;

    for (; i < list.size(); i++)
    {
        char const ch = list[i];

        if (m_conv.quote && ch == *m_conv.quote) {
            quoted = !quoted;
        }
        else if (ch == m_conv.separator && !quoted) {
            break;
        }
        else {
            m_current += ch;
        }
    }

    m_next = i < list.size() ? i + 1 : std::string_view::npos;
}

namespace {

    [[noreturn]]
    void reject_entry(os_string const& entry, std::size_t index, char offending)
    {
        HABITAT_LOG(debug) << "join_paths: entry " << index << " " << entry
                           << " contains '" << offending << "'";
        throw join_paths_error(entry, index, offending);
    }

} // unnamed namespace

void detail::append_path_entry(std::string& list, os_string const& entry,
                               std::size_t index, path_convention const& conv)
{
    if (!conv.quote) {
        if (entry.contains(conv.separator))
            reject_entry(entry, index, conv.separator);

        list += entry.bytes();
        return;
    }

    auto const quote = *conv.quote;

    // a quote inside an entry can't be escaped
    if (entry.contains(quote))
        reject_entry(entry, index, quote);

    if (entry.contains(conv.separator)) {
        list += quote;
        list += entry.bytes();
        list += quote;
    }
    else {
        list += entry.bytes();
    }
}

} // namespace habitat
