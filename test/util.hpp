#pragma once

#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "habitat/platform.hpp"

// raw OS access, bypassing the library
std::string get_env(const char* key);
void set_env(const char* key, const char* value);
void rm_env(const char* key);


// in-memory backend
class fake_platform : public habitat::platform
{
public:
    using os_string = habitat::os_string;

    std::filesystem::path current_dir() const override;
    void set_current_dir(std::filesystem::path const& path) const override;

    std::optional<os_string> getenv(os_string const& key) const override;
    void setenv(os_string const& key, os_string const& value) const override;
    void unsetenv(os_string const& key) const override;

    std::vector<habitat::env_pair> vars_os() const override;
    std::vector<os_string> args_os() const override { return argv; }

    std::filesystem::path current_exe() const override;
    std::optional<std::filesystem::path> home_dir() const override { return home; }
    std::filesystem::path temp_dir() const override { return "/fake/tmp"; }

    habitat::path_convention path_list_convention() const noexcept override { return convention; }
    habitat::platform_constants const& constants() const noexcept override { return habitat::consts::target; }

    // state
    mutable std::map<os_string, os_string> env;
    mutable std::filesystem::path cwd = "/fake";
    std::vector<os_string> argv;
    std::optional<std::filesystem::path> home;
    habitat::path_convention convention = habitat::posix_path_convention;

    // failure injection for directory and exe queries
    std::error_code fail_with;

    // backend calls seen
    mutable int calls = 0;
};
