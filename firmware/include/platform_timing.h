#pragma once
#include <stdint.h>

// =====================================================
// Platform Timing Abstraction
// =====================================================
// Time source for the main loop. The sequencer itself has
// no notion of time; Application turns elapsed
// milliseconds into step() calls.
//
// Usage:
//   - Call platform_timing_init() once at startup
//   - Use platform_millis() to schedule steps
// =====================================================

// Initialize timing system (call once at startup)
void platform_timing_init();

// Get milliseconds since startup (wraps every ~49 days)
uint32_t platform_millis();

// Blocking delay in milliseconds
void platform_delay_ms(uint32_t ms);
