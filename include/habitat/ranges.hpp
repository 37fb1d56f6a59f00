#ifndef HABITAT_RANGES_HPP
#define HABITAT_RANGES_HPP

#include <cstddef>
#include <string>
#include <thread>
#include <utility>

#include <range/v3/iterator/basic_iterator.hpp>

#include "os_string.hpp"
#include "platform.hpp"

namespace habitat::detail {

using std::ptrdiff_t;

// throws contract_violation naming `what` if s isn't valid UTF-8
std::string expect_unicode(os_string const& s, char const* what);

struct decode_arg_fn
{
    std::string operator() (os_string const& arg) const {
        return expect_unicode(arg, "argument");
    }
};

struct decode_var_fn
{
    std::pair<std::string, std::string> operator() (env_pair const& var) const {
        return { expect_unicode(var.first, "environment variable key"),
                 expect_unicode(var.second, "environment variable") };
    }
};

// cursor over a captured sequence, decoding each element when read
template<typename It, typename Decode>
class decoding_cursor
{
    It pos{};

public:
    auto read() const {
        return Decode{}(*pos);
    }

    void next() { ++pos; }
    void prev() { --pos; }
    void advance(ptrdiff_t n) { pos += n; }

    bool equal(decoding_cursor const& other) const {
        return pos == other.pos;
    }
    ptrdiff_t distance_to(decoding_cursor const& that) const {
        return that.pos - pos;
    }

    decoding_cursor() = default;
    explicit decoding_cursor(It it) : pos(it)
    {}
};

// remembers the thread that captured a snapshot
class snapshot_owner
{
    std::thread::id m_owner = std::this_thread::get_id();

public:
    // throws contract_violation from a foreign thread when thread checks are on
    void check() const;
};

} // namespace habitat::detail

#endif // HABITAT_RANGES_HPP
