#include <catch2/catch.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include "habitat.hpp"
#include "util.hpp"

using namespace std::literals;
using std::string;
using std::vector;
namespace fs = std::filesystem;

using habitat::posix_path_convention;
using habitat::windows_path_convention;

namespace
{
    vector<string> to_strings(habitat::split_paths_view const& view)
    {
        return view
            | ranges::views::transform([](fs::path const& p) { return p.string(); })
            | ranges::to_vector;
    }

    vector<string> split(std::string_view list, habitat::path_convention const& conv)
    {
        return to_strings(habitat::split_paths(habitat::os_string(list), conv));
    }

    string join(vector<string> const& paths, habitat::path_convention const& conv)
    {
        return string(habitat::join_paths(paths, conv).bytes());
    }
}

TEST_CASE("split_paths, posix rules", "[paths][split]")
{
    auto const& conv = posix_path_convention;

    CHECK(split("", conv) == vector<string>{""});
    CHECK(split("::", conv) == vector<string>{"", "", ""});
    CHECK(split("/", conv) == vector<string>{"/"});
    CHECK(split("/:", conv) == vector<string>{"/", ""});
    CHECK(split(":/", conv) == vector<string>{"", "/"});
    CHECK(split("/:/usr/local", conv) == vector<string>{"/", "/usr/local"});

    // no quoting on posix
    CHECK(split(R"("/a:b")", conv) == vector<string>{R"("/a)", R"(b")"});
}

TEST_CASE("split_paths, windows rules", "[paths][split]")
{
    auto const& conv = windows_path_convention;

    CHECK(split("", conv) == vector<string>{""});
    CHECK(split(R"("")", conv) == vector<string>{""});
    CHECK(split(";;", conv) == vector<string>{"", "", ""});
    CHECK(split(R"(c:\)", conv) == vector<string>{R"(c:\)"});
    CHECK(split(R"(c:\;)", conv) == vector<string>{R"(c:\)", ""});
    CHECK(split(R"(c:\;c:\Program Files\)", conv)
          == vector<string>{R"(c:\)", R"(c:\Program Files\)"});
    CHECK(split(R"(c:\;c:\"foo"\)", conv) == vector<string>{R"(c:\)", R"(c:\foo\)"});
    CHECK(split(R"(c:\;c:\"foo;bar"\;c:\baz)", conv)
          == vector<string>{R"(c:\)", R"(c:\foo;bar\)", R"(c:\baz)"});

    SECTION("unmatched quote runs to the end")
    {
        CHECK(split(R"(c:\"foo;bar)", conv) == vector<string>{R"(c:\foo;bar)"});
        CHECK(split(R"(a;")", conv) == vector<string>{"a", ""});
    }
}

TEST_CASE("split_paths view", "[paths][split]")
{
    auto const view = habitat::split_paths("/bin:/usr/bin", posix_path_convention);

    SECTION("every pass parses from the start")
    {
        auto const first = to_strings(view);
        auto const second = to_strings(view);

        REQUIRE(first == vector<string>{"/bin", "/usr/bin"});
        REQUIRE(first == second);
    }
    SECTION("copies own the list")
    {
        habitat::split_paths_view copy;
        {
            auto tmp = habitat::split_paths(habitat::os_string("/opt:/srv"s), posix_path_convention);
            copy = tmp;
        }
        REQUIRE(to_strings(copy) == vector<string>{"/opt", "/srv"});
    }
    SECTION("iterators outlive their view")
    {
        auto it = habitat::split_paths(habitat::os_string("/opt:/srv"s), posix_path_convention).begin();

        REQUIRE(*it == fs::path("/opt"));
        ++it;
        REQUIRE(*it == fs::path("/srv"));
    }
    SECTION("default constructed view has one empty entry")
    {
        REQUIRE(to_strings(habitat::split_paths_view{}) == vector<string>{""});
    }
}

TEST_CASE("join_paths, posix rules", "[paths][join]")
{
    auto const& conv = posix_path_convention;

    CHECK(join({}, conv) == "");
    CHECK(join({"/bin", "/usr/bin", "/usr/local/bin"}, conv) == "/bin:/usr/bin:/usr/local/bin");
    CHECK(join({"", "/bin", "", "", "/usr/bin", ""}, conv) == ":/bin:::/usr/bin:");
    CHECK(join({"", "/bin", ""}, conv) == ":/bin:");

    // quotes mean nothing here
    CHECK(join({R"(/a"b)"}, conv) == R"(/a"b)");

    SECTION("separator inside an entry")
    {
        REQUIRE_THROWS_AS(join({"/te:st"}, conv), habitat::join_paths_error);

        try
        {
            join({"/bin", "/ok", "/te:st", "/a:b"}, conv);
            FAIL("join_paths accepted a separator");
        }
        catch (habitat::join_paths_error const& e)
        {
            REQUIRE(e.index() == 2);
            REQUIRE(e.path() == "/te:st");
            REQUIRE(e.offending_char() == ':');
        }
    }
}

TEST_CASE("join_paths, windows rules", "[paths][join]")
{
    auto const& conv = windows_path_convention;

    CHECK(join({}, conv) == "");
    CHECK(join({R"(c:\windows)", R"(c:\)"}, conv) == R"(c:\windows;c:\)");
    CHECK(join({"", R"(c:\windows)", "", "", R"(c:\)", ""}, conv) == R"(;c:\windows;;;c:\;)");
    CHECK(join({R"(c:\te;st)", R"(c:\)"}, conv) == R"("c:\te;st";c:\)");

    SECTION("quote inside an entry")
    {
        try
        {
            join({R"(c:\)", R"(c:\te"st)"}, conv);
            FAIL("join_paths accepted a quote");
        }
        catch (habitat::join_paths_error const& e)
        {
            REQUIRE(e.index() == 1);
            REQUIRE(e.offending_char() == '"');
        }
    }
    SECTION("first violation wins")
    {
        try
        {
            join({R"(a"b)", R"(c"d)"}, conv);
            FAIL("join_paths accepted a quote");
        }
        catch (habitat::join_paths_error const& e)
        {
            REQUIRE(e.index() == 0);
        }
    }
}

TEST_CASE("join_paths inputs", "[paths][join]")
{
    SECTION("filesystem paths")
    {
        auto const paths = std::array{ fs::path("/bin"), fs::path("/usr/bin") };
        REQUIRE(habitat::join_paths(paths, posix_path_convention) == "/bin:/usr/bin");
    }
    SECTION("os strings")
    {
        auto const paths = vector<habitat::os_string>{ "/bin", "", "/sbin" };
        REQUIRE(habitat::join_paths(paths, posix_path_convention) == "/bin::/sbin");
    }
    SECTION("string views")
    {
        auto const paths = { "path"sv, "dir"sv, "folder"sv, "location"sv };
        REQUIRE(habitat::join_paths(paths, windows_path_convention) == "path;dir;folder;location");
    }
    SECTION("iterator pair")
    {
        auto const paths = vector<string>{ "/a", "/b", "/c" };
        REQUIRE(habitat::join_paths(paths.begin() + 1, paths.end(), posix_path_convention) == "/b:/c");
    }
}

TEST_CASE("split_paths undoes join_paths", "[paths][roundtrip]")
{
    auto const inputs = vector<vector<string>>{
        {""},
        {"", ""},
        {"/bin"},
        {"", "/bin", "", "", "/usr/bin", ""},
        {"/opt/my tools/bin", "/usr/local/bin"},
    };

    SECTION("posix")
    {
        for (auto const& v : inputs)
        {
            CAPTURE(v);
            REQUIRE(split(join(v, posix_path_convention), posix_path_convention) == v);
        }
    }
    SECTION("windows")
    {
        for (auto const& v : inputs)
        {
            CAPTURE(v);
            REQUIRE(split(join(v, windows_path_convention), windows_path_convention) == v);
        }

        auto const quoted = vector<string>{ R"(c:\te;st)", ";", R"(c:\Program Files\)" };
        REQUIRE(split(join(quoted, windows_path_convention), windows_path_convention) == quoted);
    }
}

TEST_CASE("path lists follow the backend's convention", "[paths][platform]")
{
    fake_platform windows;
    windows.convention = windows_path_convention;

    auto const entries = vector<string>{ R"(c:\a;b)", R"(d:\)" };
    auto const list = habitat::join_paths(entries, windows);

    REQUIRE(list == R"("c:\a;b";d:\)");
    REQUIRE(to_strings(habitat::split_paths(list, windows)) == entries);

    fake_platform posix;
    REQUIRE_THROWS_AS(habitat::join_paths(entries, posix), habitat::join_paths_error);
    REQUIRE(to_strings(habitat::split_paths(list, posix)) == vector<string>{ R"("c)", R"(\a;b";d)", R"(\)" });

    // join_paths and split_paths never touch the environment
    REQUIRE(windows.calls == 0);
    REQUIRE(posix.calls == 0);
}

TEST_CASE("native convention", "[paths]")
{
    auto const conv = habitat::native_platform().path_list_convention();

#if defined(_WIN32)
    REQUIRE(conv.separator == ';');
    REQUIRE(conv.quote == '"');
#else
    REQUIRE(conv.separator == ':');
    REQUIRE_FALSE(conv.quote);

    REQUIRE(habitat::join_paths(vector<string>{"/bin", "/usr/bin"}) == "/bin:/usr/bin");
    REQUIRE(to_strings(habitat::split_paths("/bin:/usr/bin")) == vector<string>{"/bin", "/usr/bin"});
#endif
}
