#include <sstream>
#include <string_view>

#include "habitat/environment.hpp"
#include "impl.hpp"

using std::string; using std::string_view;
namespace fs = std::filesystem;

// helpers
namespace habitat::impl {

void check_key(os_string const& key)
{
    char const* problem = nullptr;

    if (key.empty())
        problem = "is empty";
    else if (key.contains('='))
        problem = "contains '='";
    else if (key.contains('\0'))
        problem = "contains a NUL character";

    if (problem) {
        std::ostringstream msg;
        msg << "environment variable key " << key << " " << problem;
        throw contract_violation(msg.str());
    }
}

void check_value(os_string const& key, os_string const& value)
{
    if (value.contains('\0')) {
        std::ostringstream msg;
        msg << "value of environment variable " << key << " contains a NUL character";
        throw contract_violation(msg.str());
    }
}

} // namespace habitat::impl

namespace habitat::detail {

std::string expect_unicode(os_string const& s, char const* what)
{
    auto str = s.to_str();
    if (!str) {
        std::ostringstream msg;
        msg << what << " was not valid unicode: " << s;
        throw contract_violation(msg.str());
    }

    return *std::move(str);
}

void snapshot_owner::check() const
{
#if HABITAT_THREAD_CHECKS
    if (m_owner != std::this_thread::get_id()) {
        throw contract_violation("snapshot used outside of the thread that captured it");
    }
#endif
}

std::vector<env_pair> parse_environ_block(std::vector<os_string> const& lines)
{
    std::vector<env_pair> vars;
    vars.reserve(lines.size());

    for (auto const& line : lines)
    {
        string_view const entry = line.bytes();
        if (entry.empty())
            continue;

        // a leading '=' belongs to the key (windows per-drive cwd entries)
        auto const eq = entry.find('=', 1);
        if (eq == string_view::npos)
            continue;

        vars.emplace_back(os_string(entry.substr(0, eq)), os_string(entry.substr(eq + 1)));
    }

    return vars;
}

} // namespace habitat::detail

// common
namespace habitat {

fs::path current_dir(platform const& p)
{
    return p.current_dir();
}

fs::path current_dir(std::error_code& ec, platform const& p)
{
    ec.clear();
    try
    {
        return p.current_dir();
    }
    catch (std::system_error const& e)
    {
        ec = e.code();
        return {};
    }
}

void set_current_dir(fs::path const& path, platform const& p)
{
    HABITAT_LOG(trace) << "set_current_dir " << path;
    p.set_current_dir(path);
}

void set_current_dir(fs::path const& path, std::error_code& ec, platform const& p)
{
    ec.clear();
    try
    {
        set_current_dir(path, p);
    }
    catch (std::system_error const& e)
    {
        ec = e.code();
    }
}

std::optional<os_string> var_os(os_string const& key, platform const& p)
{
    impl::check_key(key);
    return p.getenv(key);
}

string var(os_string const& key, platform const& p)
{
    auto value = var_os(key, p);
    if (!value)
        throw var_error::make_not_present();

    auto str = value->to_str();
    if (!str)
        throw var_error::make_not_unicode(*std::move(value));

    return *std::move(str);
}

void set_var(os_string const& key, os_string const& value, platform const& p)
{
    impl::check_key(key);
    impl::check_value(key, value);

    HABITAT_LOG(trace) << "set_var " << key << " = " << value;
    p.setenv(key, value);
}

void remove_var(os_string const& key, platform const& p)
{
    impl::check_key(key);

    HABITAT_LOG(trace) << "remove_var " << key;
    p.unsetenv(key);
}

variables_os vars_os(platform const& p)
{
    auto snapshot = p.vars_os();
    HABITAT_LOG(debug) << "captured " << snapshot.size() << " environment variables";
    return variables_os(std::move(snapshot));
}

variables vars(platform const& p)
{
    return variables(vars_os(p));
}

split_paths_view split_paths(os_string const& list, platform const& p)
{
    return split_paths(list, p.path_list_convention());
}

std::optional<fs::path> home_dir(platform const& p)
{
    return p.home_dir();
}

fs::path temp_dir(platform const& p)
{
    return p.temp_dir();
}

fs::path current_exe(platform const& p)
{
    return p.current_exe();
}

fs::path current_exe(std::error_code& ec, platform const& p)
{
    ec.clear();
    try
    {
        return p.current_exe();
    }
    catch (std::system_error const& e)
    {
        ec = e.code();
        return {};
    }
}

arguments_os args_os(platform const& p)
{
    auto snapshot = p.args_os();
    HABITAT_LOG(debug) << "captured " << snapshot.size() << " arguments";
    return arguments_os(std::move(snapshot));
}

arguments args(platform const& p)
{
    return arguments(args_os(p));
}

} // namespace habitat
