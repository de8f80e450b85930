// surge

#pragma once

// Embedders may provide their own SG_ASSERT and SG_ON_GUARD_FAILED before
// including any surge source; the defaults below map to <cassert> and a
// debugger break on MSVC.

#if !defined(SG_ASSERT)
#include <cassert>
#define SG_ASSERT(x, ...) assert(x)
#endif

#if _MSC_VER
#define SG_BREAK() __debugbreak()
#else
#define SG_BREAK() (void)0
#endif

#if !defined(SG_ON_GUARD_FAILED)
#define SG_ON_GUARD_FAILED(text) SG_BREAK()
#endif

#define SG_VERIFY(x) !!((x) || (SG_ON_GUARD_FAILED(#x), false))

// early-out of API entry points on invalid arguments
#define SG_GUARD_OR(x, r) \
    if (SG_VERIFY(x))     \
    {                     \
    }                     \
    else                  \
        return (r)

#define SG_GUARD_VOID(x) \
    if (SG_VERIFY(x))    \
    {                    \
    }                    \
    else                 \
        return
