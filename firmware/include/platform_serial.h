#pragma once
#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

// =====================================================
// Platform Serial/USB Abstraction
// =====================================================
// Command input and event/log output over Arduino Serial
// or STM32 USB CDC.
//
// Usage:
//   - Call platform_serial_begin() once at startup
//   - Use platform_serial_* functions instead of Serial.*
// =====================================================

// Initialize serial/USB communication
// baud: baud rate (ignored for USB CDC, kept for compatibility)
void platform_serial_begin(uint32_t baud);

// Check if data is available to read
// Returns: number of bytes available (0 if none)
int platform_serial_available();

// Read a single byte from serial buffer
// Returns: byte value (0-255) or -1 if no data available
int platform_serial_read();

// Print a string (no newline)
void platform_serial_print(const char* str);

// Print a number (no newline)
void platform_serial_print(int num);
void platform_serial_print(uint32_t num);

// Print a JSON boolean literal (true / false)
void platform_serial_print_bool(bool value);

// Print a string with newline (\r\n)
void platform_serial_println(const char* str);

// Flush output buffer (wait for transmission to complete)
void platform_serial_flush();
