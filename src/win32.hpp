#ifndef HABITAT_SRC_WIN32_HPP
#define HABITAT_SRC_WIN32_HPP

#ifndef WIN32_LEAN_AND_MEAN
#   define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#   define NOMINMAX
#endif

#include <windows.h>

#endif /* HABITAT_SRC_WIN32_HPP */
