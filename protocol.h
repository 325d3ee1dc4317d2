#pragma once
#ifndef EXPRESSDAISY_PROTOCOL_H
#define EXPRESSDAISY_PROTOCOL_H

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include "log.h"

/**
 * ExpressDaisy Text Protocol (inbound)
 *
 * The serial link carries raw MIDI out and UTF-8 text lines in. Bytes
 * arrive from the UART DMA callback into a ring queue; the main loop
 * pulls them through the line reader one line at a time.
 *
 * Line format: <text>\n   (a trailing \r is stripped)
 *
 * Peer -> device:
 *   cc|<pot>=<cc>|...   Controller mapping
 *   ♡                   Heartbeat (UTF-8 E2 99 A1)
 *
 * A line that is not valid UTF-8, or that overflows MAX_LINE, is dropped
 * whole. There is no resync inside a line.
 */

namespace Protocol
{

constexpr size_t MAX_LINE   = 256;
constexpr size_t QUEUE_SIZE = 512;  // Power of two

constexpr uint8_t LINE_END = '\n';

// Heartbeat glyph in UTF-8
constexpr const char* HEARTBEAT = "\xE2\x99\xA1";

/**
 * Check a buffer for well-formed UTF-8 (no overlongs, no surrogates)
 */
inline bool IsValidUtf8(const char* data, size_t len)
{
    size_t i = 0;
    while(i < len)
    {
        uint8_t  c = static_cast<uint8_t>(data[i]);
        size_t   extra;
        uint32_t cp;

        if(c < 0x80)
        {
            i++;
            continue;
        }
        else if((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp    = c & 0x1F;
        }
        else if((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp    = c & 0x0F;
        }
        else if((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp    = c & 0x07;
        }
        else
        {
            return false;
        }

        if(i + extra >= len)  // Truncated sequence
            return false;

        for(size_t k = 1; k <= extra; k++)
        {
            uint8_t cc = static_cast<uint8_t>(data[i + k]);
            if((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800)
           || (extra == 3 && cp < 0x10000) || cp > 0x10FFFF
           || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;

        i += extra + 1;
    }
    return true;
}

/**
 * Single-producer / single-consumer byte queue
 * Push from the UART callback, Pop from the main loop.
 */
struct RxQueue
{
    uint8_t           data[QUEUE_SIZE];
    volatile uint16_t head;
    volatile uint16_t tail;
    volatile uint32_t overflows;

    void Reset()
    {
        head      = 0;
        tail      = 0;
        overflows = 0;
    }

    bool Push(uint8_t byte)
    {
        uint16_t next = static_cast<uint16_t>((head + 1) % QUEUE_SIZE);
        if(next == tail)  // Full
        {
            overflows = overflows + 1;
            return false;
        }
        data[head] = byte;
        head       = next;
        return true;
    }

    bool Pop(uint8_t& byte)
    {
        if(tail == head)
            return false;
        byte = data[tail];
        tail = static_cast<uint16_t>((tail + 1) % QUEUE_SIZE);
        return true;
    }

    /**
     * Drop everything queued (consumer side)
     */
    void Flush() { tail = head; }

    bool Empty() const { return tail == head; }
};

/**
 * Splits the inbound byte stream into text lines
 */
struct LineReader
{
    char     line[MAX_LINE + 1];  // NUL-terminated after Feed() returns true
    size_t   length;
    bool     overflowed;
    uint32_t lines;
    uint32_t dropped;

    void Init()
    {
        Reset();
        lines   = 0;
        dropped = 0;
    }

    void Reset()
    {
        length     = 0;
        overflowed = false;
        line[0]    = '\0';
    }

    /**
     * Feed a byte to the reader
     * Returns true when a complete valid line is ready in line[]
     */
    bool Feed(uint8_t byte)
    {
        if(byte != LINE_END)
        {
            if(length >= MAX_LINE)
            {
                if(!overflowed)
                    Log::Error(Log::TAG_PROTO, "Line over %d bytes, dropping",
                               static_cast<int>(MAX_LINE));
                overflowed = true;
                length     = 0;
            }
            if(!overflowed)
                line[length++] = static_cast<char>(byte);
            return false;
        }

        // End of line
        if(overflowed)
        {
            dropped++;
            Reset();
            return false;
        }

        if(length > 0 && line[length - 1] == '\r')
            length--;

        if(!IsValidUtf8(line, length))
        {
            Log::Error(Log::TAG_PROTO, "Undecodable line (%d bytes), dropped",
                       static_cast<int>(length));
            dropped++;
            Reset();
            return false;
        }

        if(length == 0)
        {
            Reset();
            return false;
        }

        line[length] = '\0';
        lines++;
        length = 0;
        return true;
    }
};

/**
 * True if a line is a heartbeat
 */
inline bool IsHeartbeat(const char* line)
{
    return strncmp(line, HEARTBEAT, 3) == 0;
}

} // namespace Protocol

#endif // EXPRESSDAISY_PROTOCOL_H
