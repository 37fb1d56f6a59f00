#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <unistd.h>
#include <pwd.h>
#include <sys/types.h>

#if defined(__APPLE__)
#   include <crt_externs.h>
#   include <mach-o/dyld.h>
#elif defined(__FreeBSD__) || defined(__DragonFly__)
#   include <sys/sysctl.h>
#endif

#include "habitat/environment.hpp"
#include "impl.hpp"

// only glibc and dyld pass argc/argv to init entries; other loaders fall
// back to init_args or /proc/self/cmdline
#if defined(__ELF__) && __ELF__ && defined(__GLIBC__)
    #define HABITAT_INIT_SECTION ".init_array"
#elif defined(__MACH__) && __MACH__
    #define HABITAT_INIT_SECTION "__DATA,__mod_init_func"
#endif

#if !defined(__APPLE__)
extern "C" char** environ;
#endif

using std::string; using std::string_view;
namespace fs = std::filesystem;

namespace {

    // argv as handed to the process by the loader
    int loader_argc{ };
    char** loader_argv{ };

#if HABITAT_AUTORUN && defined(HABITAT_INIT_SECTION)
    void capture_args(int argc, char** argv, char**) {
        loader_argc = argc;
        loader_argv = argv;
    }

    [[gnu::section(HABITAT_INIT_SECTION), gnu::used]]
    void (*capture_args_entry)(int, char**, char**) = &capture_args;
#endif

    // set by init_args, takes precedence over the loader's argv
    auto& manual_args() {
        static std::vector<habitat::os_string> value;
        return value;
    }
    bool manual_args_set = false;

    [[noreturn]]
    void throw_errno(char const* what, int error = errno)
    {
        throw std::system_error(error, std::system_category(), what);
    }

    char** envp() noexcept {
#if defined(__APPLE__)
        return *_NSGetEnviron();
#else
        return environ;
#endif
    }

#if HABITAT_HAS_PROCFS
    std::vector<habitat::os_string> read_proc_cmdline()
    {
        std::vector<habitat::os_string> args;
        std::ifstream proc{"/proc/self/cmdline", std::ios::binary};

        if (proc.fail()) {
            HABITAT_LOG(warning) << "arguments unavailable: cannot open /proc/self/cmdline";
            return args;
        }

        string value;
        while (std::getline(proc, value, char(0))) {
            args.emplace_back(std::move(value));
            value.clear();
        }

        return args;
    }
#endif

} // unnamed namespace

namespace habitat {

fs::path posix_platform::current_dir() const
{
    string buf(512, '\0');

    for (;;)
    {
        if (::getcwd(buf.data(), buf.size())) {
            buf.resize(std::strlen(buf.c_str()));
            return fs::path(std::move(buf));
        }

        if (errno != ERANGE)
            throw_errno("getcwd");

        buf.resize(buf.size() * 2);
    }
}

void posix_platform::set_current_dir(fs::path const& path) const
{
    if (::chdir(path.c_str()) != 0)
        throw_errno("chdir");
}

std::optional<os_string> posix_platform::getenv(os_string const& key) const
{
    char const* value = ::getenv(key.c_str());
    if (!value)
        return std::nullopt;

    return os_string(value);
}

void posix_platform::setenv(os_string const& key, os_string const& value) const
{
    if (::setenv(key.c_str(), value.c_str(), 1) != 0)
        throw_errno("setenv");
}

void posix_platform::unsetenv(os_string const& key) const
{
    if (::unsetenv(key.c_str()) != 0)
        throw_errno("unsetenv");
}

std::vector<env_pair> posix_platform::vars_os() const
{
    std::vector<os_string> lines;

    if (char** block = envp()) {
        for (; *block; block++)
            lines.emplace_back(*block);
    }

    return detail::parse_environ_block(lines);
}

std::vector<os_string> posix_platform::args_os() const
{
    if (manual_args_set)
        return manual_args();

    if (loader_argv) {
        return std::vector<os_string>(loader_argv, loader_argv + loader_argc);
    }

#if HABITAT_HAS_PROCFS
    HABITAT_LOG(warning) << "argv was not captured, reading /proc/self/cmdline";
    return read_proc_cmdline();
#else
    HABITAT_LOG(warning) << "argv was not captured and init_args was not called";
    return {};
#endif
}

fs::path posix_platform::current_exe() const
{
#if defined(__linux__)
    string buf(256, '\0');

    for (;;)
    {
        auto const n = ::readlink("/proc/self/exe", buf.data(), buf.size());
        if (n < 0) {
            int const error = errno;
            if (error == ENOENT) {
                HABITAT_LOG(warning) << "no /proc/self/exe available. Is /proc mounted?";
            }
            throw_errno("readlink /proc/self/exe", error);
        }

        if (static_cast<std::size_t>(n) < buf.size()) {
            buf.resize(static_cast<std::size_t>(n));
            return fs::path(std::move(buf));
        }

        buf.resize(buf.size() * 2);
    }
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);

    string buf(size, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) != 0)
        throw_errno("_NSGetExecutablePath", ENOENT);

    buf.resize(std::strlen(buf.c_str()));
    return fs::path(std::move(buf));
#elif defined(__FreeBSD__) || defined(__DragonFly__)
    int mib[4] = { CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1 };
    std::size_t size = 0;

    if (::sysctl(mib, 4, nullptr, &size, nullptr, 0) != 0)
        throw_errno("sysctl");

    string buf(size, '\0');
    if (::sysctl(mib, 4, buf.data(), &size, nullptr, 0) != 0)
        throw_errno("sysctl");

    buf.resize(std::strlen(buf.c_str()));
    return fs::path(std::move(buf));
#else
    throw_errno("current_exe", ENOSYS);
#endif
}

std::optional<fs::path> posix_platform::home_dir() const
{
    if (auto home = getenv("HOME"); home && !home->empty())
        return home->to_path();

    auto bufsize = ::sysconf(_SC_GETPW_R_SIZE_MAX);
    string buf(bufsize > 0 ? static_cast<std::size_t>(bufsize) : 512, '\0');

    passwd pwd{};
    passwd* result = nullptr;

    for (;;)
    {
        int const rc = ::getpwuid_r(::getuid(), &pwd, buf.data(), buf.size(), &result);
        if (rc == ERANGE) {
            buf.resize(buf.size() * 2);
            continue;
        }

        if (rc != 0 || !result) {
            HABITAT_LOG(debug) << "HOME is unset or empty and the user database has no entry";
            return std::nullopt;
        }

        return fs::path(result->pw_dir);
    }
}

fs::path posix_platform::temp_dir() const
{
    if (auto tmp = getenv("TMPDIR"))
        return tmp->to_path();

#if defined(__ANDROID__)
    return fs::path("/data/local/tmp");
#else
    return fs::path("/tmp");
#endif
}

path_convention posix_platform::path_list_convention() const noexcept
{
    return posix_path_convention;
}

platform const& native_platform() noexcept
{
    static posix_platform const instance{};
    return instance;
}

void init_args(int argc, char const* const* argv)
{
    auto& args = manual_args();
    args.assign(argv, argv + argc);
    manual_args_set = true;
}

} // namespace habitat
