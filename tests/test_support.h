#pragma once
#ifndef EXPRESSDAISY_TEST_SUPPORT_H
#define EXPRESSDAISY_TEST_SUPPORT_H

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "log.h"

/**
 * Host test doubles: captured MIDI output and log lines
 *
 * The engines take plain function pointers, so the captures live in
 * function-local statics and are cleared by Reset() in each fixture.
 */

namespace TestSupport
{

typedef std::vector<uint8_t> Message;

inline std::vector<Message>& Sent()
{
    static std::vector<Message> sent;
    return sent;
}

inline std::vector<std::string>& Logged()
{
    static std::vector<std::string> logged;
    return logged;
}

inline bool& FailWrites()
{
    static bool fail = false;
    return fail;
}

inline bool CaptureWrite(const uint8_t* data, size_t size)
{
    if(FailWrites())
        return false;
    Sent().push_back(Message(data, data + size));
    return true;
}

inline void CaptureLog(Log::Level level, const char* tag, const char* message)
{
    Logged().push_back(std::string(Log::LevelName(level)) + " " + tag + ": " + message);
}

inline void Reset()
{
    Sent().clear();
    Logged().clear();
    FailWrites() = false;
    Log::SetSink(CaptureLog);
    Log::SetLevel(Log::Level::VERBOSE);
}

inline Message Msg(uint8_t a, uint8_t b)
{
    Message m;
    m.push_back(a);
    m.push_back(b);
    return m;
}

inline Message Msg(uint8_t a, uint8_t b, uint8_t c)
{
    Message m = Msg(a, b);
    m.push_back(c);
    return m;
}

/**
 * Messages whose status high nibble matches (0x90, 0xD0, ...)
 */
inline std::vector<Message> OfType(uint8_t type)
{
    std::vector<Message> out;
    for(size_t i = 0; i < Sent().size(); i++)
    {
        if((Sent()[i][0] & 0xF0) == type)
            out.push_back(Sent()[i]);
    }
    return out;
}

inline bool LogContains(const std::string& needle)
{
    for(size_t i = 0; i < Logged().size(); i++)
    {
        if(Logged()[i].find(needle) != std::string::npos)
            return true;
    }
    return false;
}

} // namespace TestSupport

#endif // EXPRESSDAISY_TEST_SUPPORT_H
