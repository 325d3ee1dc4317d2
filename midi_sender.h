#pragma once
#ifndef EXPRESSDAISY_MIDI_SENDER_H
#define EXPRESSDAISY_MIDI_SENDER_H

#include <stdint.h>
#include <stddef.h>
#include "config.h"
#include "log.h"

/**
 * ExpressDaisy MIDI Sender
 *
 * Writes complete MIDI messages to the UART and USB outputs in
 * parallel. Note-level messages are held back by a gate until MPE zone
 * setup has gone out, so a receiver never sees a NoteOn before the zone
 * and pitch-bend ranges exist.
 */

namespace MidiSender
{

// Output write: true if all bytes were accepted
typedef bool (*WriteCallback)(const uint8_t* data, size_t size);

enum class MessageClass : uint8_t
{
    SYSTEM,  // Zone setup, pot CCs: always sent
    NOTE     // NoteOn/Off, pressure, pitch bend, timbre: gated
};

/**
 * Output counters for the periodic diagnostics summary
 */
struct Stats
{
    uint32_t sent;
    uint32_t suppressed;
    uint32_t uart_failures;
    uint32_t usb_failures;

    void Reset()
    {
        sent          = 0;
        suppressed    = 0;
        uart_failures = 0;
        usb_failures  = 0;
    }
};

class Sender
{
  public:
    /**
     * @param uart_write Serial link output (required)
     * @param usb_write USB MIDI output (nullptr if not present)
     */
    Config::Result Init(WriteCallback uart_write, WriteCallback usb_write)
    {
        uart_write_    = uart_write;
        usb_write_     = usb_write;
        notes_enabled_ = false;
        stats_.Reset();

        if(uart_write_ == nullptr)
        {
            Log::Error(Log::TAG_SENDER, "No UART output");
            return Config::Result::HARDWARE_FAULT;
        }
        if(usb_write_ == nullptr)
        {
            Log::Warn(Log::TAG_SENDER, "No USB MIDI output, UART only");
        }
        return Config::Result::OK;
    }

    /**
     * Open the gate for note-level messages
     */
    void EnableNotes()
    {
        if(!notes_enabled_)
        {
            notes_enabled_ = true;
            Log::Info(Log::TAG_SENDER, "Note messages enabled");
        }
    }

    bool NotesEnabled() const { return notes_enabled_; }

    /**
     * Send one complete MIDI message to every output
     * A failed output is logged and counted; the other still gets it.
     * @return true if the message went out on at least one output
     */
    bool Send(const uint8_t* msg, size_t size, MessageClass cls)
    {
        if(cls == MessageClass::NOTE && !notes_enabled_)
        {
            stats_.suppressed++;
            return false;
        }

        bool ok = false;
        if(uart_write_ != nullptr)
        {
            if(uart_write_(msg, size))
                ok = true;
            else
                WriteFailed("UART", stats_.uart_failures, msg[0]);
        }
        if(usb_write_ != nullptr)
        {
            if(usb_write_(msg, size))
                ok = true;
            else
                WriteFailed("USB", stats_.usb_failures, msg[0]);
        }

        if(ok)
            stats_.sent++;
        return ok;
    }

    bool SendCC(uint8_t channel, uint8_t cc, uint8_t value, MessageClass cls)
    {
        uint8_t msg[3] = {static_cast<uint8_t>(0xB0 | (channel & 0x0F)),
                          static_cast<uint8_t>(cc & 0x7F),
                          static_cast<uint8_t>(value & 0x7F)};
        return Send(msg, sizeof(msg), cls);
    }

    /**
     * MPE zone setup (lower zone)
     *
     * Manager channel: reset all controllers, all notes off, MCM (RPN 6)
     * with the member count, pitch-bend range. Then pitch-bend range on
     * each member channel.
     */
    void ConfigureMpe(const Config::Settings& settings)
    {
        uint8_t manager = Config::ZONE_MANAGER;
        uint8_t members = settings.zone_end - settings.zone_start + 1;

        SendCC(manager, 121, 0, MessageClass::SYSTEM);
        SendCC(manager, 123, 0, MessageClass::SYSTEM);

        SendRpn(manager, 6, members);
        SendRpn(manager, 0, settings.manager_pitch_bend_range);

        for(uint8_t ch = settings.zone_start; ch <= settings.zone_end; ch++)
        {
            SendRpn(ch, 0, settings.member_pitch_bend_range);
        }

        Log::Info(Log::TAG_SENDER, "MPE zone: %d members, bend %d/%d", members,
                  settings.manager_pitch_bend_range,
                  settings.member_pitch_bend_range);
    }

    const Stats& GetStats() const { return stats_; }

  private:
    void SendRpn(uint8_t channel, uint8_t rpn_lsb, uint8_t value)
    {
        SendCC(channel, 101, 0, MessageClass::SYSTEM);        // RPN MSB
        SendCC(channel, 100, rpn_lsb, MessageClass::SYSTEM);  // RPN LSB
        SendCC(channel, 6, value, MessageClass::SYSTEM);      // Data entry
    }

    void WriteFailed(const char* output, uint32_t& counter, uint8_t status)
    {
        counter++;
        Log::Error(Log::TAG_SENDER, "%s write failed (status 0x%02X, %lu failures)",
                   output, status, static_cast<unsigned long>(counter));
    }

    WriteCallback uart_write_;
    WriteCallback usb_write_;
    bool          notes_enabled_;
    Stats         stats_;
};

} // namespace MidiSender

#endif // EXPRESSDAISY_MIDI_SENDER_H
