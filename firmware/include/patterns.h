#pragma once
#include "pattern.h"

// =====================================================
// Pattern Library
// =====================================================
// Ready-made patterns, all built at compile time.
// =====================================================

namespace patterns {

// Morse code, one step per dot unit:
// - dot:  0b10  (on, off)
// - dash: 0b110 (on, on, off)
// Every character ends with one extra off step as the
// inter-character gap.
namespace morse {

constexpr Pattern A = Pattern::make<0b10110, 5>();
constexpr Pattern B = Pattern::make<0b110101010, 9>();
constexpr Pattern C = Pattern::make<0b1101011010, 10>();
constexpr Pattern D = Pattern::make<0b1101010, 7>();
constexpr Pattern E = Pattern::make<0b10, 2>();
constexpr Pattern F = Pattern::make<0b101011010, 9>();
constexpr Pattern G = Pattern::make<0b11011010, 8>();
constexpr Pattern H = Pattern::make<0b10101010, 8>();
constexpr Pattern I = Pattern::make<0b1010, 4>();
constexpr Pattern J = Pattern::make<0b10110110110, 11>();
constexpr Pattern K = Pattern::make<0b11010110, 8>();
constexpr Pattern L = Pattern::make<0b101101010, 9>();
constexpr Pattern M = Pattern::make<0b110110, 6>();
constexpr Pattern N = Pattern::make<0b11010, 5>();
constexpr Pattern O = Pattern::make<0b110110110, 9>();
constexpr Pattern P = Pattern::make<0b1011011010, 10>();
constexpr Pattern Q = Pattern::make<0b11011010110, 11>();
constexpr Pattern R = Pattern::make<0b1011010, 7>();
constexpr Pattern S = Pattern::make<0b101010, 6>();
constexpr Pattern T = Pattern::make<0b110, 3>();
constexpr Pattern U = Pattern::make<0b1010110, 7>();
constexpr Pattern V = Pattern::make<0b101010110, 9>();
constexpr Pattern W = Pattern::make<0b10110110, 8>();
constexpr Pattern X = Pattern::make<0b1101010110, 10>();
constexpr Pattern Y = Pattern::make<0b11010110110, 11>();
constexpr Pattern Z = Pattern::make<0b1101101010, 10>();

constexpr Pattern ZERO  = Pattern::make<0b110110110110110, 15>();
constexpr Pattern ONE   = Pattern::make<0b10110110110110, 14>();
constexpr Pattern TWO   = Pattern::make<0b1010110110110, 13>();
constexpr Pattern THREE = Pattern::make<0b101010110110, 12>();
constexpr Pattern FOUR  = Pattern::make<0b10101010110, 11>();
constexpr Pattern FIVE  = Pattern::make<0b1010101010, 10>();
constexpr Pattern SIX   = Pattern::make<0b11010101010, 11>();
constexpr Pattern SEVEN = Pattern::make<0b110110101010, 12>();
constexpr Pattern EIGHT = Pattern::make<0b1101101101010, 13>();
constexpr Pattern NINE  = Pattern::make<0b11011011011010, 14>();

constexpr Pattern FULL_STOP      = Pattern::make<0b101101011010110, 15>();
constexpr Pattern COMMA          = Pattern::make<0b1101101010110110, 16>();
constexpr Pattern COLON          = Pattern::make<0b110110110101010, 15>();
constexpr Pattern QUESTION_MARK  = Pattern::make<0b10101101101010, 14>();
constexpr Pattern APOSTROPHE     = Pattern::make<0b1011011011011010, 16>();
constexpr Pattern HYPHEN         = Pattern::make<0b11010101010110, 14>();
constexpr Pattern FRACTION_BAR   = Pattern::make<0b110101011010, 12>();
constexpr Pattern BRACKETS       = Pattern::make<0b1101011011010110, 16>();
constexpr Pattern QUOTATION_MARK = Pattern::make<0b10110101011010, 14>();
constexpr Pattern AT_SIGN        = Pattern::make<0b101101101011010, 15>();
constexpr Pattern EQUALS_SIGN    = Pattern::make<0b110101010110, 12>();
constexpr Pattern ERROR          = Pattern::make<0b1010101010101010, 16>();

constexpr Pattern SOS = S.append(O).append(S);

}  // namespace morse

// Common blinks
namespace blinks {

constexpr Pattern SHORT_ON_OFF = Pattern::make<0b10, 2>();
constexpr Pattern SHORT_OFF_ON = SHORT_ON_OFF.reverse();

constexpr Pattern MEDIUM_ON_OFF = Pattern::make<0b1100, 4>();
constexpr Pattern MEDIUM_OFF_ON = MEDIUM_ON_OFF.reverse();

constexpr Pattern LONG_ON_OFF = Pattern::make<0b11110000, 8>();
constexpr Pattern LONG_OFF_ON = LONG_ON_OFF.reverse();

constexpr Pattern QUARTER_DUTY = Pattern::make<0b1000, 4>();

}  // namespace blinks

}  // namespace patterns
