#pragma once
#ifndef EXPRESSDAISY_CONTROLLER_H
#define EXPRESSDAISY_CONTROLLER_H

#include <stdint.h>
#include <stddef.h>
#include "config.h"
#include "log.h"
#include "keys.h"
#include "zones.h"
#include "midi_events.h"
#include "notes.h"
#include "pots.h"
#include "controls.h"
#include "midi_sender.h"
#include "midi_router.h"
#include "protocol.h"
#include "connection.h"
#include "scheduler.h"

/**
 * ExpressDaisy Controller
 *
 * Owns every pipeline component and runs one cooperative tick:
 *
 *   1. advance the clock
 *   2. connection timeout check
 *   3. scan keys
 *   4. scan pots / encoder when their interval is due
 *   5. handle at most one inbound text line
 *   6. turn deltas into MIDI (octave, keys, pots)
 *
 * A tick always runs to completion. Hardware access goes through the
 * callbacks in Hardware so the same engine runs on the board and in
 * host tests.
 */

namespace Controller
{

// Fill NUM_KEYS raw sensor pairs, index = key id
typedef void (*ReadKeysCallback)(Keys::KeySensorSample* samples);

// Fill NUM_POTS raw pot readings
typedef void (*ReadPotsCallback)(uint16_t* raw);

// Encoder detents since the last call (+ up, - down)
typedef int8_t (*ReadEncoderCallback)();

// Monotonic milliseconds
typedef uint32_t (*ClockCallback)();

// Blocking delay in milliseconds
typedef void (*DelayCallback)(uint32_t ms);

struct Hardware
{
    ReadKeysCallback          read_keys;     // Required
    ReadPotsCallback          read_pots;     // Required
    ReadEncoderCallback       read_encoder;  // Optional
    ClockCallback             now;           // Required
    DelayCallback             delay;         // Optional, greeting needs it
    MidiSender::WriteCallback uart_write;    // Required
    MidiSender::WriteCallback usb_write;     // Optional
};

class Engine
{
  public:
    /**
     * Wire up all components
     * @return HARDWARE_FAULT if a required callback is missing
     */
    Config::Result Init(const Config::Settings& settings, const Hardware& hw)
    {
        settings_ = settings;
        hw_       = hw;

        if(hw_.read_keys == nullptr || hw_.read_pots == nullptr || hw_.now == nullptr)
        {
            Log::Error(Log::TAG_MAIN, "Missing hardware callback");
            return Config::Result::HARDWARE_FAULT;
        }

        if(sender_.Init(hw_.uart_write, hw_.usb_write) != Config::Result::OK)
        {
            return Config::Result::HARDWARE_FAULT;
        }

        uint32_t now = hw_.now();
        scheduler_.Init(settings_, now);
        tracker_.Init(settings_);
        zones_.Init(settings_);
        notes_.Init(settings_, &zones_);
        pots_.Init();
        controls_.Init();
        router_.Init(settings_, &zones_, &sender_);
        queue_.Reset();
        reader_.Init();
        connection_.Init(settings_, &controls_, now);

        events_.Clear();
        key_changes_.Clear();
        pot_changes_.Clear();

        Log::Info(Log::TAG_MAIN, "Controller ready");
        return Config::Result::OK;
    }

    /**
     * Startup sequence: MPE zone setup, open the note gate, optional
     * greeting chime, then take the current pot positions as baseline
     */
    void Startup()
    {
        sender_.ConfigureMpe(settings_);
        sender_.EnableNotes();

        if(settings_.play_greeting)
            PlayGreeting();

        hw_.read_pots(pot_raw_);
        float values[Config::NUM_POTS];
        pots_.ReadAll(pot_raw_, values);

        Log::Info(Log::TAG_MAIN, "Startup complete");
    }

    /**
     * One main loop iteration
     */
    void Tick()
    {
        uint32_t now = hw_.now();
        scheduler_.Advance(now);

        if(connection_.UpdateState(now))
            FlushInput();

        key_changes_.Clear();
        hw_.read_keys(samples_);
        tracker_.Scan(samples_, Config::NUM_KEYS, now, key_changes_);

        pot_changes_.Clear();
        if(scheduler_.ShouldScanPots())
        {
            hw_.read_pots(pot_raw_);
            pots_.ReadPots(pot_raw_, pot_changes_);
            scheduler_.MarkPotScan();
        }

        int8_t octave_steps = 0;
        if(scheduler_.ShouldScanEncoder())
        {
            if(hw_.read_encoder != nullptr)
                octave_steps = hw_.read_encoder();
            scheduler_.MarkEncoderScan();
        }

        ProcessInboundLine(now);

        while(octave_steps != 0)
        {
            int8_t direction = octave_steps > 0 ? 1 : -1;
            events_.Clear();
            notes_.HandleOctaveShift(direction, events_);
            router_.RouteAll(events_);
            octave_steps -= direction;
        }

        if(key_changes_.count > 0)
        {
            events_.Clear();
            notes_.ProcessKeyChanges(key_changes_, now, events_);
            router_.RouteAll(events_);
        }

        if(pot_changes_.count > 0)
        {
            events_.Clear();
            controls_.ProcessPotChanges(pot_changes_, events_);
            router_.RouteAll(events_);
        }
    }

    /**
     * Queue received serial bytes (safe from the UART callback)
     */
    void ReceiveBytes(const uint8_t* data, size_t size)
    {
        for(size_t i = 0; i < size; i++)
        {
            queue_.Push(data[i]);
        }
    }

    /**
     * Drop queued input and any partial line
     */
    void FlushInput()
    {
        queue_.Flush();
        reader_.Reset();
        Log::Debug(Log::TAG_PROTO, "Input flushed");
    }

    /**
     * Diagnostics summary to the log
     */
    void LogStats() const
    {
        const MidiRouter::Stats& r = router_.GetStats();
        const MidiSender::Stats& s = sender_.GetStats();

        Log::Info(Log::TAG_ROUTER, "pressure %lu/%lu bend %lu/%lu timbre %lu/%lu (sent/filtered)",
                  static_cast<unsigned long>(r.pressure_sent),
                  static_cast<unsigned long>(r.pressure_filtered),
                  static_cast<unsigned long>(r.bend_sent),
                  static_cast<unsigned long>(r.bend_filtered),
                  static_cast<unsigned long>(r.timbre_sent),
                  static_cast<unsigned long>(r.timbre_filtered));
        Log::Info(Log::TAG_SENDER, "sent %lu suppressed %lu uart_fail %lu usb_fail %lu",
                  static_cast<unsigned long>(s.sent),
                  static_cast<unsigned long>(s.suppressed),
                  static_cast<unsigned long>(s.uart_failures),
                  static_cast<unsigned long>(s.usb_failures));
        Log::Info(Log::TAG_MAIN, "notes %d octave %d %s, rx lines %lu dropped %lu",
                  static_cast<int>(zones_.ActiveCount()), notes_.GetOctave(),
                  connection_.IsConnected() ? "connected" : "standalone",
                  static_cast<unsigned long>(reader_.lines),
                  static_cast<unsigned long>(reader_.dropped));
    }

    const Keys::Tracker&        GetKeys() const { return tracker_; }
    Zones::Manager&             GetZones() { return zones_; }
    const Notes::Processor&     GetNotes() const { return notes_; }
    const Controls::Processor&  GetControls() const { return controls_; }
    const Connection::Manager&  GetConnection() const { return connection_; }
    const MidiRouter::Router&   GetRouter() const { return router_; }
    const MidiSender::Sender&   GetSender() const { return sender_; }
    const Scheduler::Engine&    GetScheduler() const { return scheduler_; }

  private:
    void PlayGreeting()
    {
        if(hw_.delay == nullptr)
        {
            Log::Warn(Log::TAG_MAIN, "No delay callback, skipping greeting");
            return;
        }

        for(uint8_t i = 0; i < Config::GREETING_LENGTH; i++)
        {
            events_.Clear();
            notes_.GreetingNoteOn(i, events_);
            router_.RouteAll(events_);

            hw_.delay(Config::GREETING_DURATIONS[i]);

            events_.Clear();
            notes_.GreetingNoteOff(i, events_);
            router_.RouteAll(events_);

            hw_.delay(Config::GREETING_GAP);
        }
        Log::Info(Log::TAG_MAIN, "Greeting played");
    }

    /**
     * Pull bytes until one complete line is handled or the queue is empty
     */
    void ProcessInboundLine(uint32_t now)
    {
        uint8_t byte;
        while(queue_.Pop(byte))
        {
            if(!reader_.Feed(byte))
                continue;

            if(connection_.HandleMessage(reader_.line, now)
               == Connection::Message::CONFIG_APPLIED)
            {
                SendPotValues();
            }
            return;
        }
    }

    /**
     * Current value of every assigned pot, so the peer's UI converges
     */
    void SendPotValues()
    {
        hw_.read_pots(pot_raw_);
        float values[Config::NUM_POTS];
        pots_.ReadAll(pot_raw_, values);

        events_.Clear();
        controls_.ProcessPotValues(values, events_);
        router_.RouteAll(events_);
        Log::Info(Log::TAG_CONNECT, "Sent %d pot values", static_cast<int>(events_.count));
    }

    Config::Settings settings_;
    Hardware         hw_;

    Scheduler::Engine   scheduler_;
    Keys::Tracker       tracker_;
    Zones::Manager      zones_;
    Notes::Processor    notes_;
    Pots::Tracker       pots_;
    Controls::Processor controls_;
    MidiSender::Sender  sender_;
    MidiRouter::Router  router_;
    Protocol::RxQueue   queue_;
    Protocol::LineReader reader_;
    Connection::Manager connection_;

    MidiEvents::EventList  events_;
    Keys::KeyChangeList    key_changes_;
    Pots::PotChangeList    pot_changes_;
    Keys::KeySensorSample  samples_[Config::NUM_KEYS];
    uint16_t               pot_raw_[Config::NUM_POTS];
};

} // namespace Controller

#endif // EXPRESSDAISY_CONTROLLER_H
