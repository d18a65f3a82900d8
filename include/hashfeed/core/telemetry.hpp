#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
// -----------------------------------------------------------------------------
//
// L1: lifecycle, decision and message counters (connect attempts, retries,
// replay, messages and bytes in and out).
//
// Disabled, the counters compile to nothing.

#if defined(HASHFEED_ENABLE_TELEMETRY_L1)
    #define HF_TL1(expr) expr
#else
    #define HF_TL1(expr) ((void)0)
#endif
