#include "usb_serial.h"
#include "fw_config.h"
#include "morse_text.h"
#include "patterns.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include <cstdlib>  // for atoi
#include <cstring>

static void toUpper(char* s) {
    for (char* p = s; *p; ++p) {
        if (*p >= 'a' && *p <= 'z')
            *p = *p - 'a' + 'A';
    }
}

// Print text inside a JSON string: quotes and backslashes are
// escaped, control characters dropped
static void printJsonText(const char* text) {
    char out[3] = {0, 0, 0};
    for (const char* p = text; *p; ++p) {
        if ((unsigned char)*p < 0x20)
            continue;
        if (*p == '"' || *p == '\\') {
            out[0] = '\\';
            out[1] = *p;
        } else {
            out[0] = *p;
            out[1] = '\0';
        }
        platform_serial_print(out);
    }
}

void UsbCommandHandler::printError(const char* msg) {
    platform_serial_print("{\"event\":\"error\",\"msg\":\"");
    platform_serial_print(msg);
    platform_serial_println("\"}");
    platform_serial_flush();
}

Sequencer* UsbCommandHandler::ledFromToken(Sequencer* const leds[], size_t ledCount, const char* tok) {
    if (!tok || *tok < '0' || *tok > '9')
        return nullptr;

    int index = atoi(tok);
    if (index < 0 || (size_t)index >= ledCount)
        return nullptr;
    return leds[index];
}

void UsbCommandHandler::begin(unsigned long baud)
{
    platform_serial_begin(baud);

    // STM32 USB CDC needs time to enumerate before the first command
    platform_delay_ms(500);

    // Drop enumeration noise so the first command is not corrupted
    uint32_t flushStart = platform_millis();
    while (platform_serial_available() > 0 && (platform_millis() - flushStart < 100)) {
        platform_serial_read();
        platform_delay_ms(1);
    }

    _len = 0;
    _discarding = false;
}

// Call inside loop()
void UsbCommandHandler::poll(Sequencer* const leds[], size_t ledCount)
{
    while (platform_serial_available() > 0)
    {
        int c = platform_serial_read();
        if (c < 0) break;  // No data available

        // Support \r\n / \n as line endings
        if (c == '\r')
            continue;

        if (c == '\n')
        {
            _buf[_len] = '\0';
            if (_len > 0 && !_discarding)
            {
                handleLine(leds, ledCount, _buf);
            }
            _len = 0;
            _discarding = false;
        }
        else if (_discarding)
        {
            // Rest of an over-long line
            continue;
        }
        else
        {
            if (_len < CMD_BUF_SIZE - 1)
            {
                _buf[_len++] = c;
            }
            else
            {
                // Too long, drop everything up to the next newline
                _len = 0;
                _discarding = true;
            }
        }
    }
}

void UsbCommandHandler::handleLine(Sequencer* const leds[], size_t ledCount, const char *line)
{
    while (*line == ' ' || *line == '\t')
        line++;
    if (*line == '\0')
        return;

    char tmp[CMD_BUF_SIZE];
    strncpy(tmp, line, CMD_BUF_SIZE - 1);
    tmp[CMD_BUF_SIZE - 1] = '\0';

    char *cmd = strtok(tmp, " \t");
    if (!cmd)
        return;
    toUpper(cmd);

    if (strcmp(cmd, "HELLO") == 0)
    {
        cmdHello();
    }
    else if (strcmp(cmd, "STATUS") == 0)
    {
        cmdStatus(leds, ledCount);
    }
    else if (strcmp(cmd, "MORSE") == 0)
    {
        Sequencer* seq = ledFromToken(leds, ledCount, strtok(nullptr, " \t"));
        char* text = strtok(nullptr, "");  // rest of the line, spaces included
        while (text && (*text == ' ' || *text == '\t'))
            text++;
        if (!seq || !text || *text == '\0') {
            printError("MORSE args");
            return;
        }
        cmdMorse(*seq, text);
    }
    else if (strcmp(cmd, "BLINK") == 0)
    {
        Sequencer* seq = ledFromToken(leds, ledCount, strtok(nullptr, " \t"));
        char* name = strtok(nullptr, " \t");
        if (!seq || !name) {
            printError("BLINK args");
            return;
        }
        toUpper(name);
        cmdBlink(*seq, name);
    }
    else if (strcmp(cmd, "STOP") == 0)
    {
        Sequencer* seq = ledFromToken(leds, ledCount, strtok(nullptr, " \t"));
        if (!seq) {
            printError("STOP args");
            return;
        }
        cmdStop(*seq);
    }
    else if (strcmp(cmd, "DEMO") == 0)
    {
        char* mode = strtok(nullptr, " \t");
        if (!mode) {
            printError("DEMO args");
            return;
        }
        toUpper(mode);
        cmdDemo(mode);
    }
    else
    {
        platform_serial_print("{\"event\":\"error\",\"msg\":\"unknown command: ");
        printJsonText(cmd);
        platform_serial_println("\"}");
        platform_serial_flush();
    }
}

void UsbCommandHandler::cmdHello()
{
    platform_serial_print("{\"event\":\"hello\"");
    platform_serial_print(",\"name\":\"");
    platform_serial_print(FW_NAME);

    platform_serial_print("\",\"fw\":\"");
    platform_serial_print(FW_VERSION_STRING);

    platform_serial_print("\",\"build\":\"");
    platform_serial_print(FW_BUILD_DATE);
    platform_serial_print(" ");
    platform_serial_print(FW_BUILD_TIME);

    platform_serial_print("\",\"hash\":\"");
    platform_serial_print(FW_BUILD_HASH);
    platform_serial_println("\"}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdStatus(Sequencer* const leds[], size_t ledCount)
{
    platform_serial_print("{\"event\":\"status\",\"demo\":");
    platform_serial_print_bool(_demoEnabled);
    platform_serial_print(",\"leds\":[");

    for (size_t i = 0; i < ledCount; ++i)
    {
        if (i > 0)
            platform_serial_print(",");

        platform_serial_print("{\"idle\":");
        platform_serial_print_bool(leds[i]->idle());
        platform_serial_print(",\"pending\":");
        platform_serial_print((uint32_t)leds[i]->pending());
        platform_serial_print(",\"capacity\":");
        platform_serial_print((uint32_t)leds[i]->capacity());
        platform_serial_print("}");
    }

    platform_serial_println("]}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdMorse(Sequencer& seq, const char* text)
{
    size_t total = strlen(text);
    size_t skipped = 0;
    size_t consumed = enqueueMorseText(seq, text, &skipped);

    platform_serial_print("{\"event\":\"ack\",\"cmd\":\"MORSE\",\"queued\":");
    platform_serial_print((uint32_t)(consumed - skipped));
    platform_serial_print(",\"skipped\":");
    platform_serial_print((uint32_t)skipped);
    platform_serial_print(",\"dropped\":");
    platform_serial_print((uint32_t)(total - consumed));
    platform_serial_println("}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdBlink(Sequencer& seq, const char* name)
{
    const Pattern* pattern = nullptr;
    if (strcmp(name, "SHORT") == 0)
        pattern = &patterns::blinks::SHORT_ON_OFF;
    else if (strcmp(name, "MEDIUM") == 0)
        pattern = &patterns::blinks::MEDIUM_ON_OFF;
    else if (strcmp(name, "LONG") == 0)
        pattern = &patterns::blinks::LONG_ON_OFF;
    else if (strcmp(name, "QUARTER") == 0)
        pattern = &patterns::blinks::QUARTER_DUTY;

    if (!pattern) {
        printError("unknown blink");
        return;
    }

    if (!seq.tryEnqueue(*pattern)) {
        printError("queue full");
        return;
    }

    platform_serial_println("{\"event\":\"ack\",\"cmd\":\"BLINK\"}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdStop(Sequencer& seq)
{
    seq.clear();
    platform_serial_println("{\"event\":\"ack\",\"cmd\":\"STOP\"}");
    platform_serial_flush();
}

void UsbCommandHandler::cmdDemo(const char* mode)
{
    if (strcmp(mode, "ON") == 0) {
        _demoEnabled = true;
    } else if (strcmp(mode, "OFF") == 0) {
        _demoEnabled = false;
    } else {
        printError("DEMO args");
        return;
    }

    platform_serial_print("{\"event\":\"ack\",\"cmd\":\"DEMO\",\"demo\":");
    platform_serial_print_bool(_demoEnabled);
    platform_serial_println("}");
    platform_serial_flush();
}
