#ifndef HABITAT_LOG_HPP
#define HABITAT_LOG_HPP

#include <string_view>

namespace habitat {

    /* Sets the Boost.Log core filter by level name: trace, debug, info,
       warning, error or fatal. Anything else selects info.
       The library itself never adds sinks.
    */
    void init_logging(std::string_view level);

} // namespace habitat

#endif // HABITAT_LOG_HPP
