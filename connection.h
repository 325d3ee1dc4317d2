#pragma once
#ifndef EXPRESSDAISY_CONNECTION_H
#define EXPRESSDAISY_CONNECTION_H

#include <stdint.h>
#include <string.h>
#include "config.h"
#include "log.h"
#include "controls.h"
#include "protocol.h"

/**
 * ExpressDaisy Connection Handshake
 *
 * STANDALONE until a valid controller config arrives, then CONNECTED.
 * Every received line (config or heartbeat) refreshes the link; if the
 * peer is silent for longer than the timeout the device drops back to
 * standalone with the default mapping.
 */

namespace Connection
{

enum class State : uint8_t
{
    STANDALONE,
    CONNECTED
};

/**
 * What a received line turned out to be
 */
enum class Message : uint8_t
{
    IGNORED,          // Empty line
    HEARTBEAT,
    CONFIG_APPLIED,   // Caller sends the pot value burst
    CONFIG_REJECTED,
    UNKNOWN
};

class Manager
{
  public:
    void Init(const Config::Settings& settings, Controls::Processor* controls,
              uint32_t now)
    {
        controls_          = controls;
        timeout_           = settings.connection_timeout;
        state_             = State::STANDALONE;
        last_message_time_ = now;
        Log::Info(Log::TAG_CONNECT, "Standalone, listening for expression engine");
    }

    /**
     * Timeout check, call once per tick
     * @return true if the link timed out and state was reset (caller
     *         flushes buffered input)
     */
    bool UpdateState(uint32_t now)
    {
        if(state_ == State::STANDALONE)
            return false;

        uint32_t silent = now - last_message_time_;
        if(silent <= timeout_)
            return false;

        Log::Warn(Log::TAG_CONNECT, "No message for %lu ms, back to standalone",
                  static_cast<unsigned long>(silent));
        Reset(now);
        return true;
    }

    /**
     * Handle one complete text line from the peer
     */
    Message HandleMessage(const char* message, uint32_t now)
    {
        if(message == nullptr || message[0] == '\0')
            return Message::IGNORED;

        last_message_time_ = now;

        if(strncmp(message, Controls::CONFIG_PREFIX, Controls::CONFIG_PREFIX_LEN) == 0)
        {
            Log::Info(Log::TAG_CONNECT, state_ == State::STANDALONE
                                            ? "Config received"
                                            : "Config update received");

            if(controls_->HandleConfigMessage(message) != Config::Result::OK)
                return Message::CONFIG_REJECTED;

            if(state_ != State::CONNECTED)
                Log::Info(Log::TAG_CONNECT, "Connected");
            state_ = State::CONNECTED;
            return Message::CONFIG_APPLIED;
        }

        if(Protocol::IsHeartbeat(message))
        {
            Log::Debug(Log::TAG_CONNECT, "Heartbeat");
            return Message::HEARTBEAT;
        }

        Log::Warn(Log::TAG_CONNECT, "Unknown message (%d bytes)",
                  static_cast<int>(strlen(message)));
        return Message::UNKNOWN;
    }

    State GetState() const { return state_; }
    bool  IsConnected() const { return state_ == State::CONNECTED; }
    uint32_t LastMessageTime() const { return last_message_time_; }

  private:
    void Reset(uint32_t now)
    {
        state_             = State::STANDALONE;
        last_message_time_ = now;
        controls_->ResetToDefaults();
    }

    Controls::Processor* controls_;
    uint32_t             timeout_;
    uint32_t             last_message_time_;
    State                state_;
};

} // namespace Connection

#endif // EXPRESSDAISY_CONNECTION_H
