#pragma once

// -----------------------------------------------------------------------------
// Telemetry level configuration
//
// L1: mechanical counters on the connection core (cheap, relaxed atomics)
// L2: per-message counters on the send / dispatch paths
// -----------------------------------------------------------------------------

#if defined(PULSELINK_ENABLE_TELEMETRY_L1)
    #define PL_TL1(expr) expr
#else
    #define PL_TL1(expr) ((void)0)
#endif

#if defined(PULSELINK_ENABLE_TELEMETRY_L2)
    #define PL_TL2(expr) expr
#else
    #define PL_TL2(expr) ((void)0)
#endif
