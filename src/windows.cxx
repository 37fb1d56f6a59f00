#include "win32.hpp"
#include <shellapi.h>
#include <userenv.h>

#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "habitat/environment.hpp"
#include "impl.hpp"

using std::string; using std::wstring;
using std::string_view; using std::wstring_view;
namespace fs = std::filesystem;

namespace {

    [[noreturn]]
    void throw_win_error(char const* what, DWORD error = GetLastError())
    {
        throw std::system_error(static_cast<int>(error), std::system_category(), what);
    }

    auto narrow(wchar_t const* wstr, int wstr_l, char* ptr = nullptr, int length = 0) {
        return WideCharToMultiByte(
            CP_UTF8, 0,
            wstr, wstr_l,
            ptr, length,
            nullptr, nullptr);
    }

    auto wide(const char* nstr, int nstr_l, wchar_t* ptr = nullptr, int length = 0) {
        return MultiByteToWideChar(
            CP_UTF8, 0,
            nstr, nstr_l,
            ptr, length);
    }

    string to_utf8(wstring_view wstr) {
        if (wstr.empty())
            return {};

        auto const wstr_l = static_cast<int>(wstr.size());
        auto length = narrow(wstr.data(), wstr_l);
        auto str8 = string(length, '\0');
        auto result = narrow(wstr.data(), wstr_l, str8.data(), length);

        if (result == 0)
            throw_win_error("WideCharToMultiByte");

        str8.resize(result);
        return str8;
    }

    wstring to_utf16(string_view nstr) {
        if (nstr.empty())
            return {};

        auto const nstr_l = static_cast<int>(nstr.size());
        auto length = wide(nstr.data(), nstr_l);
        auto str16 = wstring(length, L'\0');
        auto result = wide(nstr.data(), nstr_l, str16.data(), length);

        if (result == 0)
            throw_win_error("MultiByteToWideChar");

        str16.resize(result);
        return str16;
    }

    habitat::os_string to_os(wstring_view wstr) {
        return habitat::os_string::from_bytes(to_utf8(wstr));
    }

    wstring to_native(habitat::os_string const& s) {
        return to_utf16(s.bytes());
    }

    // calls f(buffer, capacity) until the answer fits; f follows the usual
    // win32 "return required size when too small" protocol
    template<class F>
    wstring fill_wide_buf(F&& f, char const* what)
    {
        wstring buf(MAX_PATH, L'\0');

        for (;;)
        {
            SetLastError(0);
            auto const capacity = static_cast<DWORD>(buf.size());
            DWORD const n = f(buf.data(), capacity);

            if (n == 0 && GetLastError() != 0)
                throw_win_error(what);

            if (n == capacity && GetLastError() == ERROR_INSUFFICIENT_BUFFER) {
                buf.resize(buf.size() * 2);
            }
            else if (n > capacity) {
                buf.resize(n);
            }
            else {
                buf.resize(n);
                return buf;
            }
        }
    }

    std::vector<habitat::os_string> initialize_args() {
        int argc;
        auto wargv = std::unique_ptr<LPWSTR[], decltype(&LocalFree)>{
            CommandLineToArgvW(GetCommandLineW(), &argc),
            &LocalFree
        };

        if (!wargv)
            throw_win_error("CommandLineToArgvW");

        std::vector<habitat::os_string> vec;
        vec.reserve(argc);

        for (int i = 0; i < argc; i++)
        {
            vec.push_back(to_os(wargv[i]));
        }

        return vec;
    }

} /* nameless namespace */

namespace habitat {

fs::path windows_platform::current_dir() const
{
    return fs::path(fill_wide_buf([](wchar_t* buf, DWORD size) {
        return GetCurrentDirectoryW(size, buf);
    }, "GetCurrentDirectoryW"));
}

void windows_platform::set_current_dir(fs::path const& path) const
{
    if (!SetCurrentDirectoryW(path.c_str()))
        throw_win_error("SetCurrentDirectoryW");
}

std::optional<os_string> windows_platform::getenv(os_string const& key) const
{
    auto const wkey = to_native(key);
    wstring buf(128, L'\0');

    for (;;)
    {
        SetLastError(0);
        DWORD const n = GetEnvironmentVariableW(wkey.c_str(), buf.data(), static_cast<DWORD>(buf.size()));

        if (n == 0) {
            DWORD const error = GetLastError();
            if (error == ERROR_ENVVAR_NOT_FOUND)
                return std::nullopt;
            if (error != 0)
                throw_win_error("GetEnvironmentVariableW", error);
        }

        if (n > buf.size()) {
            buf.resize(n);
            continue;
        }

        buf.resize(n);
        return to_os(buf);
    }
}

void windows_platform::setenv(os_string const& key, os_string const& value) const
{
    auto const wkey = to_native(key);
    auto const wvalue = to_native(value);

    if (!SetEnvironmentVariableW(wkey.c_str(), wvalue.c_str()))
        throw_win_error("SetEnvironmentVariableW");
}

void windows_platform::unsetenv(os_string const& key) const
{
    auto const wkey = to_native(key);

    if (!SetEnvironmentVariableW(wkey.c_str(), nullptr))
        throw_win_error("SetEnvironmentVariableW");
}

std::vector<env_pair> windows_platform::vars_os() const
{
    auto block = std::unique_ptr<wchar_t, decltype(&FreeEnvironmentStringsW)>{
        GetEnvironmentStringsW(),
        &FreeEnvironmentStringsW
    };

    if (!block)
        throw_win_error("GetEnvironmentStringsW");

    // "k1=v1\0k2=v2\0\0"
    std::vector<os_string> lines;
    for (wchar_t const* p = block.get(); *p; )
    {
        wstring_view line = p;
        lines.push_back(to_os(line));
        p += line.size() + 1;
    }

    return detail::parse_environ_block(lines);
}

std::vector<os_string> windows_platform::args_os() const
{
    return initialize_args();
}

fs::path windows_platform::current_exe() const
{
    return fs::path(fill_wide_buf([](wchar_t* buf, DWORD size) {
        return GetModuleFileNameW(nullptr, buf, size);
    }, "GetModuleFileNameW"));
}

std::optional<fs::path> windows_platform::home_dir() const
{
    if (auto home = getenv("HOME"); home && !home->empty())
        return home->to_path();
    if (auto profile = getenv("USERPROFILE"); profile && !profile->empty())
        return profile->to_path();

    HANDLE token = nullptr;
    if (!OpenProcessToken(GetCurrentProcess(), TOKEN_READ, &token)) {
        HABITAT_LOG(debug) << "OpenProcessToken failed: " << GetLastError();
        return std::nullopt;
    }

    auto const closer = std::unique_ptr<void, decltype(&CloseHandle)>{ token, &CloseHandle };

    try
    {
        return fs::path(fill_wide_buf([token](wchar_t* buf, DWORD size) -> DWORD {
            DWORD len = size;
            if (!GetUserProfileDirectoryW(token, buf, &len)) {
                if (GetLastError() == ERROR_INSUFFICIENT_BUFFER)
                    return len;
                return 0;
            }
            // len counts the terminating null
            return len - 1;
        }, "GetUserProfileDirectoryW"));
    }
    catch (std::system_error const& e)
    {
        HABITAT_LOG(debug) << "no profile directory: " << e.what();
        return std::nullopt;
    }
}

fs::path windows_platform::temp_dir() const
{
    return fs::path(fill_wide_buf([](wchar_t* buf, DWORD size) {
        return GetTempPathW(size, buf);
    }, "GetTempPathW"));
}

path_convention windows_platform::path_list_convention() const noexcept
{
    return windows_path_convention;
}

platform const& native_platform() noexcept
{
    static windows_platform const instance{};
    return instance;
}

void init_args(int, char const* const*)
{
    // noop
}

} // namespace habitat
