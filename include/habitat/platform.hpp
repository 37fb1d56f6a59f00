#ifndef HABITAT_PLATFORM_HPP
#define HABITAT_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include "os_string.hpp"
#include "path_list.hpp"
#include "consts.hpp"

// system layer
namespace habitat {

    using env_pair = std::pair<os_string, os_string>;

    /* Everything the library needs from the operating system.

       Implementations are stateless; the environment, the working directory
       and the argument list belong to the process. No member synchronizes:
       callers that mutate the environment from several threads must
       serialize those calls themselves.

       OS failures are thrown as std::system_error with the native error code.
       Keys and values reaching a backend are already validated.
    */
    class platform
    {
    public:
        virtual ~platform() = default;

        virtual std::filesystem::path current_dir() const = 0;
        virtual void set_current_dir(std::filesystem::path const& path) const = 0;

        // nullopt when the variable is not set
        virtual std::optional<os_string> getenv(os_string const& key) const = 0;
        virtual void setenv(os_string const& key, os_string const& value) const = 0;
        virtual void unsetenv(os_string const& key) const = 0;

        // copy of the whole environment block, in native order
        virtual std::vector<env_pair> vars_os() const = 0;
        virtual std::vector<os_string> args_os() const = 0;

        virtual std::filesystem::path current_exe() const = 0;
        virtual std::optional<std::filesystem::path> home_dir() const = 0;
        virtual std::filesystem::path temp_dir() const = 0;

        virtual path_convention path_list_convention() const noexcept = 0;
        virtual platform_constants const& constants() const noexcept = 0;
    };

#if defined(_WIN32)
    class windows_platform final : public platform
#else
    class posix_platform final : public platform
#endif
    {
    public:
        std::filesystem::path current_dir() const override;
        void set_current_dir(std::filesystem::path const& path) const override;

        std::optional<os_string> getenv(os_string const& key) const override;
        void setenv(os_string const& key, os_string const& value) const override;
        void unsetenv(os_string const& key) const override;

        std::vector<env_pair> vars_os() const override;
        std::vector<os_string> args_os() const override;

        std::filesystem::path current_exe() const override;
        std::optional<std::filesystem::path> home_dir() const override;
        std::filesystem::path temp_dir() const override;

        path_convention path_list_convention() const noexcept override;
        platform_constants const& constants() const noexcept override {
            return consts::target;
        }
    };

    // the backend of the build target
    platform const& native_platform() noexcept;

namespace detail {

    // splits "key=value" lines of a native environment block
    std::vector<env_pair> parse_environ_block(std::vector<os_string> const& lines);

} // namespace detail

} // namespace habitat

#endif // HABITAT_PLATFORM_HPP
