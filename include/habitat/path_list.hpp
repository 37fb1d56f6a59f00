#ifndef HABITAT_PATH_LIST_HPP
#define HABITAT_PATH_LIST_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <range/v3/view/facade.hpp>
#include <range/v3/view/subrange.hpp>
#include <range/v3/range/concepts.hpp>
#include <range/v3/iterator/concepts.hpp>

#include "os_string.hpp"
#include "errors.hpp"

namespace habitat {

    // how a list of paths is encoded in a single PATH-like variable
    struct path_convention
    {
        char separator;
        std::optional<char> quote;
    };

    inline constexpr path_convention posix_path_convention = { ':', std::nullopt };
    inline constexpr path_convention windows_path_convention = { ';', '"' };


    /* Lazy view over the entries of a PATH-like list.

       Every begin() parses again from the start. An empty list has one
       empty entry. With a quote character, separators inside a quoted run
       belong to the entry and the quotes themselves are dropped; an
       unmatched quote runs to the end of the list.
    */
    class split_paths_view : public ranges::view_facade<split_paths_view, ranges::finite>
    {
        friend ranges::range_access;

        class cursor
        {
            std::shared_ptr<std::string const> m_list;
            path_convention m_conv = posix_path_convention;
            std::size_t m_pos = 0;  // first char of the current entry
            std::size_t m_next = 0; // first char of the next entry, npos after the last one
            bool m_done = false;
            std::string m_current;

            void parse();

        public:
            cursor() = default;
            cursor(std::shared_ptr<std::string const> list, path_convention conv)
                : m_list(std::move(list)), m_conv(conv)
            {
                parse();
            }

            std::filesystem::path read() const {
                return os_string(m_current).to_path();
            }

            void next() {
                if (m_next == std::string_view::npos) {
                    m_done = true;
                }
                else {
                    m_pos = m_next;
                    parse();
                }
            }

            bool equal(cursor const& that) const noexcept {
                return m_done == that.m_done && (m_done || m_pos == that.m_pos);
            }
            bool equal(ranges::default_sentinel_t) const noexcept {
                return m_done;
            }
        };

        cursor begin_cursor() const {
            return {m_list, m_conv};
        }

    public:
        split_paths_view()
            : m_list(std::make_shared<std::string const>())
            , m_conv(posix_path_convention)
        {}

        split_paths_view(os_string const& list, path_convention conv)
            : m_list(std::make_shared<std::string const>(list.bytes()))
            , m_conv(conv)
        {}

    private:
        std::shared_ptr<std::string const> m_list;
        path_convention m_conv;
    };

    inline split_paths_view split_paths(os_string const& list, path_convention const& conv) {
        return split_paths_view(list, conv);
    }


namespace detail {

    // throws join_paths_error when the entry can't be represented
    void append_path_entry(std::string& list, os_string const& entry,
                           std::size_t index, path_convention const& conv);

    template<class T>
    os_string as_path_entry(T const& item)
    {
        if constexpr (std::is_same_v<T, std::filesystem::path>) {
            return to_os_string(item);
        }
        else if constexpr (std::is_convertible_v<T const&, std::string_view>) {
            return os_string(std::string_view(item));
        }
        else {
            return os_string(item);
        }
    }

} // namespace detail

    CPP_template(class Rng)
        (requires ranges::input_range<Rng>)
    os_string join_paths(Rng&& rng, path_convention const& conv) {
        std::string list;
        std::size_t index = 0;

        for (auto&& item : rng) {
            if (index != 0)
                list += conv.separator;

            detail::append_path_entry(list, detail::as_path_entry(item), index++, conv);
        }

        return os_string::from_bytes(std::move(list));
    }

    CPP_template(class Iter)
        (requires ranges::input_iterator<Iter>)
    os_string join_paths(Iter begin, Iter end, path_convention const& conv) {
        return join_paths(ranges::subrange<Iter>(begin, end), conv);
    }

} // namespace habitat

#endif // HABITAT_PATH_LIST_HPP
