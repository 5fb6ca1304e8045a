#pragma once
#include <cstdlib> // std::abort
#include <fmt/core.h>

// Verbose assert: reports the failed expression & its location before aborting.
// Used for internal invariants only - a failure here is always a logic defect.
#ifdef NDEBUG
#define vassert(expr) ((void)0)
#else
#define vassert(expr) \
    ((expr) ? (void)0 : vassertFailed(#expr, __FILE__, __LINE__))

[[noreturn]] inline void vassertFailed(const char* expr, const char* file, const int line) {
    fmt::print(stderr, "{}:{}: assertion failed: {}\n", file, line, expr);
    std::abort();
}
#endif // NDEBUG
