#if defined(WIN32)
#define _CRT_SECURE_NO_WARNINGS
#endif // WIN32

#include "util.hpp"


std::string get_env(const char* key)
{
    auto* val = getenv(key);
    return val ? val : "";
}

void set_env(const char* key, const char* value)
{
#ifdef WIN32
    _putenv_s(key, value);
#else
    setenv(key, value, true);
#endif // WIN32
}

void rm_env(const char* key)
{
#ifdef WIN32
    _putenv_s(key, "");
#else
    unsetenv(key);
#endif // WIN32
}


std::filesystem::path fake_platform::current_dir() const
{
    calls++;
    if (fail_with)
        throw std::system_error(fail_with, "getcwd");
    return cwd;
}

void fake_platform::set_current_dir(std::filesystem::path const& path) const
{
    calls++;
    if (fail_with)
        throw std::system_error(fail_with, "chdir");
    cwd = path;
}

auto fake_platform::getenv(os_string const& key) const -> std::optional<os_string>
{
    calls++;
    auto it = env.find(key);
    if (it == env.end())
        return std::nullopt;
    return it->second;
}

void fake_platform::setenv(os_string const& key, os_string const& value) const
{
    calls++;
    env[key] = value;
}

void fake_platform::unsetenv(os_string const& key) const
{
    calls++;
    env.erase(key);
}

std::vector<habitat::env_pair> fake_platform::vars_os() const
{
    calls++;
    return { env.begin(), env.end() };
}

std::filesystem::path fake_platform::current_exe() const
{
    calls++;
    if (fail_with)
        throw std::system_error(fail_with, "current_exe");
    return "/fake/bin/app";
}
