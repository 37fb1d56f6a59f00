#ifndef HABITAT_ENVIRONMENT_HPP
#define HABITAT_ENVIRONMENT_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <range/v3/iterator/basic_iterator.hpp>
#include <range/v3/iterator/reverse_iterator.hpp>
#include <range/v3/range/concepts.hpp>

#include "os_string.hpp"
#include "errors.hpp"
#include "consts.hpp"
#include "path_list.hpp"
#include "platform.hpp"
#include "ranges.hpp"

namespace habitat {

    /* Snapshots.

       Each one copies the sequence it presents when it is created and owns
       that copy; later changes to the process are not reflected. They are
       move-only and belong to the thread that created them.
    */

    class variables_os
    {
    public:
        using container_type = std::vector<env_pair>;
        using value_type = env_pair;
        using iterator = container_type::const_iterator;
        using reverse_iterator = container_type::const_reverse_iterator;
        using size_type = std::size_t;

        explicit variables_os(container_type snapshot) noexcept
            : m_items(std::move(snapshot))
        {}

        variables_os(variables_os&&) = default;
        variables_os& operator=(variables_os&&) = default;
        variables_os(variables_os const&) = delete;
        variables_os& operator=(variables_os const&) = delete;

        iterator begin() const { m_owner.check(); return m_items.cbegin(); }
        iterator end() const noexcept { return m_items.cend(); }

        reverse_iterator rbegin() const { m_owner.check(); return m_items.crbegin(); }
        reverse_iterator rend() const noexcept { return m_items.crend(); }

        size_type size() const noexcept { return m_items.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }

    private:
        detail::snapshot_owner m_owner;
        container_type m_items;
    };

    // decodes lazily; throws contract_violation on a non-unicode key or value
    class variables
    {
        using cursor = detail::decoding_cursor<variables_os::iterator, detail::decode_var_fn>;

    public:
        using value_type = std::pair<std::string, std::string>;
        using iterator = ranges::basic_iterator<cursor>;
        using reverse_iterator = ranges::reverse_iterator<iterator>;
        using size_type = std::size_t;

        explicit variables(variables_os raw) noexcept : m_raw(std::move(raw))
        {}

        iterator begin() const { return iterator(cursor(m_raw.begin())); }
        iterator end() const noexcept { return iterator(cursor(m_raw.end())); }

        reverse_iterator rbegin() const { return ranges::make_reverse_iterator(end()); }
        reverse_iterator rend() const { return ranges::make_reverse_iterator(begin()); }

        size_type size() const noexcept { return m_raw.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_raw.empty(); }

    private:
        variables_os m_raw;
    };


    class arguments_os
    {
    public:
        using container_type = std::vector<os_string>;
        using value_type = os_string;
        using iterator = container_type::const_iterator;
        using reverse_iterator = container_type::const_reverse_iterator;
        using index_type = std::size_t;
        using size_type = std::size_t;

        explicit arguments_os(container_type snapshot) noexcept
            : m_items(std::move(snapshot))
        {}

        arguments_os(arguments_os&&) = default;
        arguments_os& operator=(arguments_os&&) = default;
        arguments_os(arguments_os const&) = delete;
        arguments_os& operator=(arguments_os const&) = delete;

        value_type const& operator [] (index_type i) const {
            m_owner.check();
            return m_items[i];
        }

        value_type const& at(index_type i) const {
            if (i >= size()) {
                throw std::out_of_range("invalid arguments subscript");
            }

            return (*this)[i];
        }

        [[nodiscard]] bool empty() const noexcept { return m_items.empty(); }
        size_type size() const noexcept { return m_items.size(); }

        iterator cbegin() const { m_owner.check(); return m_items.cbegin(); }
        iterator cend() const noexcept { return m_items.cend(); }

        iterator begin() const { return cbegin(); }
        iterator end() const noexcept { return cend(); }

        reverse_iterator crbegin() const { return reverse_iterator{ cend() }; }
        reverse_iterator crend() const { return reverse_iterator{ cbegin() }; }

        reverse_iterator rbegin() const { return crbegin(); }
        reverse_iterator rend() const { return crend(); }

    private:
        detail::snapshot_owner m_owner;
        container_type m_items;
    };

    // decodes lazily; throws contract_violation on a non-unicode argument
    class arguments
    {
        using cursor = detail::decoding_cursor<arguments_os::iterator, detail::decode_arg_fn>;

    public:
        using value_type = std::string;
        using iterator = ranges::basic_iterator<cursor>;
        using reverse_iterator = ranges::reverse_iterator<iterator>;
        using index_type = std::size_t;
        using size_type = std::size_t;

        explicit arguments(arguments_os raw) noexcept : m_raw(std::move(raw))
        {}

        value_type operator [] (index_type i) const {
            return detail::decode_arg_fn{}(m_raw[i]);
        }

        value_type at(index_type i) const {
            return detail::decode_arg_fn{}(m_raw.at(i));
        }

        [[nodiscard]] bool empty() const noexcept { return m_raw.empty(); }
        size_type size() const noexcept { return m_raw.size(); }

        iterator cbegin() const { return iterator(cursor(m_raw.cbegin())); }
        iterator cend() const noexcept { return iterator(cursor(m_raw.cend())); }

        iterator begin() const { return cbegin(); }
        iterator end() const noexcept { return cend(); }

        reverse_iterator crbegin() const { return ranges::make_reverse_iterator(cend()); }
        reverse_iterator crend() const { return ranges::make_reverse_iterator(cbegin()); }

        reverse_iterator rbegin() const { return crbegin(); }
        reverse_iterator rend() const { return crend(); }

    private:
        arguments_os m_raw;
    };

    static_assert(ranges::random_access_range<arguments_os>, "arguments_os is a rand. access range.");
    static_assert(ranges::random_access_range<arguments>, "arguments is a rand. access range.");
    static_assert(ranges::bidirectional_range<variables>, "variables is a bidirectional range.");


    // working directory

    std::filesystem::path current_dir(platform const& p = native_platform());
    std::filesystem::path current_dir(std::error_code& ec, platform const& p = native_platform());

    void set_current_dir(std::filesystem::path const& path, platform const& p = native_platform());
    void set_current_dir(std::filesystem::path const& path, std::error_code& ec,
                         platform const& p = native_platform());

    // variables

    /* Keys must be non-empty and free of '=' and NUL, values free of NUL.
       A malformed key or value throws contract_violation before the
       environment is touched.
    */

    std::optional<os_string> var_os(os_string const& key, platform const& p = native_platform());

    // throws var_error: not_present, or not_unicode carrying the raw value
    std::string var(os_string const& key, platform const& p = native_platform());

    void set_var(os_string const& key, os_string const& value, platform const& p = native_platform());
    void remove_var(os_string const& key, platform const& p = native_platform());

    variables_os vars_os(platform const& p = native_platform());
    variables vars(platform const& p = native_platform());

    // PATH-like lists

    split_paths_view split_paths(os_string const& list, platform const& p = native_platform());

    CPP_template(class Rng)
        (requires ranges::input_range<Rng>)
    os_string join_paths(Rng&& rng, platform const& p = native_platform()) {
        return join_paths(static_cast<Rng&&>(rng), p.path_list_convention());
    }

    CPP_template(class Iter)
        (requires ranges::input_iterator<Iter>)
    os_string join_paths(Iter begin, Iter end, platform const& p = native_platform()) {
        return join_paths(begin, end, p.path_list_convention());
    }

    // well-known directories

    std::optional<std::filesystem::path> home_dir(platform const& p = native_platform());
    std::filesystem::path temp_dir(platform const& p = native_platform());

    std::filesystem::path current_exe(platform const& p = native_platform());
    std::filesystem::path current_exe(std::error_code& ec, platform const& p = native_platform());

    // arguments

    arguments_os args_os(platform const& p = native_platform());
    arguments args(platform const& p = native_platform());

    /* [POSIX SPECIFIC] Set the argument list the native backend reports.
       Needed only when built without HABITAT_AUTORUN and /proc is not
       available. On Windows this does nothing.
    */
    void init_args(int argc, char const* const* argv);

} // namespace habitat

#endif // HABITAT_ENVIRONMENT_HPP
