#pragma once

// Hint for the rare end-of-stream branch on the per-item path.
#if defined(__GNUC__) || defined(__clang__)
#define FIBER_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define FIBER_UNLIKELY(x) (x)
#endif
