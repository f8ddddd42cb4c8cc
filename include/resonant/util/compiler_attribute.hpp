#pragma once

// always inline
#ifdef _MSC_VER
    #define RESONANT_ALWAYSINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
    #define RESONANT_ALWAYSINLINE inline __attribute__((__always_inline__))
#else
    #define RESONANT_ALWAYSINLINE inline
#endif
