#pragma once

// Hints for the per-tick checks of the run loop and the reader, where the
// common case (no cancellation, no stop request, ASCII output) dominates.
#if defined(__GNUC__) || defined(__clang__)
#define PTYRUN_LIKELY(x) (__builtin_expect(!!(x), 1))
#define PTYRUN_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define PTYRUN_LIKELY(x) (x)
#define PTYRUN_UNLIKELY(x) (x)
#endif
