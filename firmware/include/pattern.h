#pragma once
#include <stdint.h>
#include <stdbool.h>

// =====================================================
// Pattern
// =====================================================
// Up to 32 ordered on/off steps packed into a uint32_t.
//
// Steps play in the order a binary literal reads, left to
// right: bit (used - 1) of the value passed to fromRaw() is
// the first step, bit 0 the last.
//
//   Pattern::fromRaw(0b1000, 4)   // on, off, off, off
//   Pattern::fromRaw(0b0111, 4)   // off, on, on, on
//
// Internally the steps are stored reversed and right-aligned
// so step i lives in bit i and step() consumes from bit 0.
//
// Patterns are plain values. The library constants in
// patterns.h are constexpr and cannot be stepped; the
// Sequencer steps its own copy.
// =====================================================

class Pattern {
public:
    static constexpr uint8_t MAX_STEPS = 32;

    constexpr Pattern() : _raw(0), _used(0) {}

    // Build from a raw value; used > MAX_STEPS is clamped
    static constexpr Pattern fromRaw(uint32_t bits, uint8_t used) {
        return used == 0 ? Pattern()
                         : Pattern(reverseBits(bits) >> (MAX_STEPS - clampUsed(used)),
                                   clampUsed(used));
    }

    // Compile-time checked form of fromRaw()
    template <uint32_t Bits, uint8_t Used>
    static constexpr Pattern make() {
        static_assert(Used <= MAX_STEPS, "a pattern holds at most 32 steps");
        return fromRaw(Bits, Used);
    }

    // Steps of this pattern followed by the steps of other.
    // The result is truncated to MAX_STEPS.
    constexpr Pattern append(const Pattern& other) const {
        return _used >= MAX_STEPS ? *this
                                  : Pattern(_raw | (other._raw << _used),
                                            clampUsed(_used + other._used));
    }

    // Same steps, played backwards
    constexpr Pattern reverse() const {
        return fromRaw(_raw, _used);
    }

    // Consume one step and rotate the next one into place.
    // Rotation wraps within the used width, so after used()
    // calls the pattern is back where it started.
    bool step() {
        if (_used == 0) {
            return false;
        }
        bool active = (_raw & 0x1u) != 0;
        _raw >>= 1;
        if (active) {
            _raw |= 0x1u << (_used - 1);
        }
        return active;
    }

    // Peek at step i without consuming anything
    constexpr bool stepAt(uint8_t index) const {
        return index < _used && ((_raw >> index) & 0x1u) != 0;
    }

    constexpr uint32_t raw() const { return _raw; }
    constexpr uint8_t used() const { return _used; }
    constexpr bool empty() const { return _used == 0; }

    constexpr bool operator==(const Pattern& other) const {
        return _raw == other._raw && _used == other._used;
    }
    constexpr bool operator!=(const Pattern& other) const {
        return !(*this == other);
    }

private:
    constexpr Pattern(uint32_t raw, uint8_t used) : _raw(raw), _used(used) {}

    static constexpr uint8_t clampUsed(unsigned used) {
        return used > MAX_STEPS ? MAX_STEPS : static_cast<uint8_t>(used);
    }

    static constexpr uint32_t reverseBits(uint32_t value) {
        uint32_t result = 0;
        for (uint8_t i = 0; i < MAX_STEPS; i++) {
            result = (result << 1) | (value & 0x1u);
            value >>= 1;
        }
        return result;
    }

    uint32_t _raw;
    uint8_t _used;
};
