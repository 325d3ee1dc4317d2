#pragma once
#ifndef EXPRESSDAISY_LOG_H
#define EXPRESSDAISY_LOG_H

#include <stdint.h>
#include <stdarg.h>
#include <stdio.h>

/**
 * ExpressDaisy Diagnostic Log
 *
 * Levelled, tagged messages formatted into a fixed buffer and handed
 * to one registered sink. The firmware sinks to the external USB
 * logger; tests install a capturing sink.
 *
 * Messages never go out on the MIDI or text protocol.
 */

namespace Log
{

enum class Level : uint8_t
{
    VERBOSE,
    INFO,
    WARN,
    ERROR
};

// Module tags
constexpr const char* TAG_MAIN    = "MAIN";
constexpr const char* TAG_KEYS    = "KEYS";
constexpr const char* TAG_ZONES   = "ZONES";
constexpr const char* TAG_NOTES   = "NOTES";
constexpr const char* TAG_EVENTS  = "EVENTS";
constexpr const char* TAG_CONTROL = "CONTROL";
constexpr const char* TAG_POTS    = "POTS";
constexpr const char* TAG_ROUTER  = "ROUTER";
constexpr const char* TAG_SENDER  = "SENDER";
constexpr const char* TAG_PROTO   = "PROTO";
constexpr const char* TAG_CONNECT = "CONNECT";
constexpr const char* TAG_SCHED   = "SCHED";
constexpr const char* TAG_HW      = "HW";

constexpr size_t MAX_MESSAGE = 128;

typedef void (*Sink)(Level level, const char* tag, const char* message);

struct State
{
    Sink  sink;
    Level min_level;
};

inline State& GetState()
{
    static State state = {nullptr, Level::INFO};
    return state;
}

inline void SetSink(Sink sink) { GetState().sink = sink; }

inline void SetLevel(Level level) { GetState().min_level = level; }

inline const char* LevelName(Level level)
{
    switch(level)
    {
        case Level::VERBOSE: return "DBG";
        case Level::INFO: return "INF";
        case Level::WARN: return "WRN";
        case Level::ERROR: return "ERR";
    }
    return "???";
}

inline void VWrite(Level level, const char* tag, const char* fmt, va_list args)
{
    State& state = GetState();
    if(state.sink == nullptr || level < state.min_level)
        return;

    char buf[MAX_MESSAGE];
    vsnprintf(buf, sizeof(buf), fmt, args);
    state.sink(level, tag, buf);
}

inline void Write(Level level, const char* tag, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    VWrite(level, tag, fmt, args);
    va_end(args);
}

inline void Debug(const char* tag, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    VWrite(Level::VERBOSE, tag, fmt, args);
    va_end(args);
}

inline void Info(const char* tag, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    VWrite(Level::INFO, tag, fmt, args);
    va_end(args);
}

inline void Warn(const char* tag, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    VWrite(Level::WARN, tag, fmt, args);
    va_end(args);
}

inline void Error(const char* tag, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    VWrite(Level::ERROR, tag, fmt, args);
    va_end(args);
}

} // namespace Log

#endif // EXPRESSDAISY_LOG_H
