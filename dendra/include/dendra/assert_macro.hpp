#pragma once

#ifdef DENDRA_HAVE_ASSERTIONS

#include <dendra/assert.hpp>

#define dendra_assert(condition) \
do { \
    if (!(condition)) { \
        dendra::abort_on_failed_assertion(#condition, __FILE__, __LINE__, __func__); \
    } \
} while (false)

#else

#define dendra_assert(condition) \
do { \
    if (false) { \
        (void)(condition); \
    } \
} while (false)

#endif // def DENDRA_HAVE_ASSERTIONS
