#include "morse_text.h"
#include "patterns.h"

// Letters and digits are looked up by offset
static const Pattern* const LETTERS[] = {
    &patterns::morse::A, &patterns::morse::B, &patterns::morse::C, &patterns::morse::D,
    &patterns::morse::E, &patterns::morse::F, &patterns::morse::G, &patterns::morse::H,
    &patterns::morse::I, &patterns::morse::J, &patterns::morse::K, &patterns::morse::L,
    &patterns::morse::M, &patterns::morse::N, &patterns::morse::O, &patterns::morse::P,
    &patterns::morse::Q, &patterns::morse::R, &patterns::morse::S, &patterns::morse::T,
    &patterns::morse::U, &patterns::morse::V, &patterns::morse::W, &patterns::morse::X,
    &patterns::morse::Y, &patterns::morse::Z
};

static const Pattern* const DIGITS[] = {
    &patterns::morse::ZERO, &patterns::morse::ONE, &patterns::morse::TWO,
    &patterns::morse::THREE, &patterns::morse::FOUR, &patterns::morse::FIVE,
    &patterns::morse::SIX, &patterns::morse::SEVEN, &patterns::morse::EIGHT,
    &patterns::morse::NINE
};

const Pattern* morseForChar(char c) {
    if (c >= 'a' && c <= 'z') {
        return LETTERS[c - 'a'];
    }
    if (c >= 'A' && c <= 'Z') {
        return LETTERS[c - 'A'];
    }
    if (c >= '0' && c <= '9') {
        return DIGITS[c - '0'];
    }

    switch (c) {
        case '.':  return &patterns::morse::FULL_STOP;
        case ',':  return &patterns::morse::COMMA;
        case ':':  return &patterns::morse::COLON;
        case '?':  return &patterns::morse::QUESTION_MARK;
        case '\'': return &patterns::morse::APOSTROPHE;
        case '-':  return &patterns::morse::HYPHEN;
        case '/':  return &patterns::morse::FRACTION_BAR;
        case '(':
        case ')':  return &patterns::morse::BRACKETS;
        case '"':  return &patterns::morse::QUOTATION_MARK;
        case '@':  return &patterns::morse::AT_SIGN;
        case '=':  return &patterns::morse::EQUALS_SIGN;
        default:
            return nullptr;
    }
}

size_t enqueueMorseText(Sequencer& seq, const char* text, size_t* skipped) {
    size_t consumed = 0;
    size_t unsupported = 0;

    for (const char* p = text; p && *p; ++p) {
        const Pattern* pattern = (*p == ' ') ? &MORSE_WORD_GAP : morseForChar(*p);
        if (!pattern) {
            unsupported++;
        } else if (!seq.tryEnqueue(*pattern)) {
            break;  // queue full, caller resumes here
        }
        consumed++;
    }

    if (skipped) {
        *skipped = unsupported;
    }
    return consumed;
}
