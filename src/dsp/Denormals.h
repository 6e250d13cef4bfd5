#pragma once

#if defined(__SSE2__) || defined(_M_X64)
#include <pmmintrin.h>
#include <xmmintrin.h>
#define DISSONANCE_HAS_SSE_FTZ 1
#endif

namespace dsp {

// Flush-to-zero and denormals-are-zero for the calling thread while in scope.
// Feedback tails in the reverb combs otherwise drift into subnormals.
// The previous modes are restored on destruction. No-op off x86.
class ScopedFlushDenormals {
public:
    ScopedFlushDenormals() {
#if defined(DISSONANCE_HAS_SSE_FTZ)
        previousFlush_ = _MM_GET_FLUSH_ZERO_MODE();
        previousDenormals_ = _MM_GET_DENORMALS_ZERO_MODE();
        _MM_SET_FLUSH_ZERO_MODE(_MM_FLUSH_ZERO_ON);
        _MM_SET_DENORMALS_ZERO_MODE(_MM_DENORMALS_ZERO_ON);
#endif
    }

    ~ScopedFlushDenormals() {
#if defined(DISSONANCE_HAS_SSE_FTZ)
        _MM_SET_FLUSH_ZERO_MODE(previousFlush_);
        _MM_SET_DENORMALS_ZERO_MODE(previousDenormals_);
#endif
    }

    ScopedFlushDenormals(const ScopedFlushDenormals&) = delete;
    ScopedFlushDenormals& operator=(const ScopedFlushDenormals&) = delete;

private:
#if defined(DISSONANCE_HAS_SSE_FTZ)
    unsigned int previousFlush_ = 0;
    unsigned int previousDenormals_ = 0;
#endif
};

}  // namespace dsp
