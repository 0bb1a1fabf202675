#pragma once

// Branch prediction hints for the read loops.
#if defined(__GNUC__) || defined(__clang__)
#define SHELLMUX_LIKELY(x) (__builtin_expect(!!(x), 1))
#define SHELLMUX_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define SHELLMUX_LIKELY(x) (x)
#define SHELLMUX_UNLIKELY(x) (x)
#endif
