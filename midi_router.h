#pragma once
#ifndef EXPRESSDAISY_MIDI_ROUTER_H
#define EXPRESSDAISY_MIDI_ROUTER_H

#include <stdint.h>
#include <stddef.h>
#include <math.h>
#include "daisysp.h"
#include "config.h"
#include "log.h"
#include "zones.h"
#include "midi_events.h"
#include "midi_sender.h"

/**
 * ExpressDaisy MPE Event Router
 *
 * Serializes abstract events to MPE channel voice messages:
 * - Expression goes to the note's member channel
 * - Pot CCs go to the manager channel
 * - Updates whose wire value did not change are dropped
 *
 * NoteOn creates the NoteState in the zone manager, NoteOff with the
 * release flag frees it.
 */

namespace MidiRouter
{

/**
 * Normalized pressure to 7-bit channel pressure
 *
 * curve 0.0 is linear. Higher values steepen the ends and flatten the
 * middle (power 1 - 0.75 * curve mirrored around 0.5).
 */
inline uint8_t PressureToWire(float pressure, float curve)
{
    float p = daisysp::fclamp(pressure, 0.0f, 1.0f);
    if(curve > 0.0f)
    {
        float power  = 1.0f - daisysp::fclamp(curve, 0.0f, 1.0f) * 0.75f;
        float offset = p - 0.5f;
        float curved = powf(fabsf(offset) * 2.0f, power) * 0.5f;
        p            = offset < 0.0f ? 0.5f - curved : 0.5f + curved;
    }
    return static_cast<uint8_t>(roundf(p * 127.0f));
}

/**
 * Position (-1..1) to 14-bit pitch bend
 *
 * Positions within dead_zone of centre give exactly 8192; the rest of
 * the travel is rescaled so the ends still reach 0 and 16383.
 */
inline uint16_t PositionToPitchBend(float position, float dead_zone)
{
    float pos = daisysp::fclamp(position, -1.0f, 1.0f);
    if(dead_zone > 0.0f)
    {
        float dz = daisysp::fclamp(dead_zone, 0.0f, 0.99f);
        if(fabsf(pos) <= dz)
            return Config::PITCH_BEND_CENTER;
        float mag = (fabsf(pos) - dz) / (1.0f - dz);
        pos       = pos < 0.0f ? -mag : mag;
    }
    return static_cast<uint16_t>(roundf(((pos + 1.0f) / 2.0f) * Config::PITCH_BEND_MAX));
}

/**
 * Position (-1..1) to CC74 timbre, 64 at centre
 */
inline uint8_t PositionToTimbre(float position)
{
    float pos = daisysp::fclamp(position, -1.0f, 1.0f);
    return static_cast<uint8_t>(roundf(((pos + 1.0f) / 2.0f) * 127.0f));
}

/**
 * Normalized controller value to 7-bit CC value
 */
inline uint8_t ValueToCC(float value)
{
    return static_cast<uint8_t>(roundf(daisysp::fclamp(value, 0.0f, 1.0f) * 127.0f));
}

/**
 * Sent vs filtered counters per expression dimension
 */
struct Stats
{
    uint32_t pressure_sent;
    uint32_t pressure_filtered;
    uint32_t bend_sent;
    uint32_t bend_filtered;
    uint32_t timbre_sent;
    uint32_t timbre_filtered;
    uint32_t orphaned;  // Events for a key with no live note

    void Reset()
    {
        pressure_sent     = 0;
        pressure_filtered = 0;
        bend_sent         = 0;
        bend_filtered     = 0;
        timbre_sent       = 0;
        timbre_filtered   = 0;
        orphaned          = 0;
    }
};

class Router
{
  public:
    void Init(const Config::Settings& settings,
              Zones::Manager*         zones,
              MidiSender::Sender*     sender)
    {
        zones_          = zones;
        sender_         = sender;
        pressure_curve_ = settings.pressure_curve;
        bend_dead_zone_ = settings.bend_dead_zone;
        stats_.Reset();
    }

    /**
     * Route every event of a list, in order
     */
    void RouteAll(const MidiEvents::EventList& events)
    {
        for(size_t i = 0; i < events.count; i++)
        {
            Route(events[i]);
        }
    }

    void Route(const MidiEvents::Event& event)
    {
        using MidiEvents::Type;
        switch(event.type)
        {
            case Type::TIMBRE_INIT: TimbreInit(event.expression.key_id); break;
            case Type::TIMBRE_UPDATE: TimbreUpdate(event.expression); break;
            case Type::PRESSURE_INIT: PressureInit(event.expression); break;
            case Type::PRESSURE_UPDATE: PressureUpdate(event.expression); break;
            case Type::PITCH_BEND_INIT: PitchBendInit(event.expression); break;
            case Type::PITCH_BEND_UPDATE: PitchBendUpdate(event.expression); break;
            case Type::NOTE_ON: NoteOn(event.note_on); break;
            case Type::NOTE_OFF: NoteOff(event.note_off); break;
            case Type::CONTROL_CHANGE: ControlChange(event.control); break;
        }
    }

    const Stats& GetStats() const { return stats_; }

  private:
    void TimbreInit(int16_t key_id)
    {
        uint8_t channel = zones_->AllocateChannel(key_id);
        SendTimbre(channel, Config::TIMBRE_CENTER);

        Zones::NoteState* note = zones_->GetNoteState(key_id);
        if(note != nullptr)
            note->timbre = Config::TIMBRE_CENTER;
    }

    void TimbreUpdate(const MidiEvents::Expression& e)
    {
        Zones::NoteState* note = LiveNote(e.key_id);
        if(note == nullptr)
            return;

        uint8_t value = PositionToTimbre(e.value);
        if(value == note->timbre)
        {
            stats_.timbre_filtered++;
            return;
        }
        SendTimbre(note->channel, value);
        note->timbre = value;
    }

    void PressureInit(const MidiEvents::Expression& e)
    {
        uint8_t channel = zones_->AllocateChannel(e.key_id);
        uint8_t value   = PressureToWire(e.value, pressure_curve_);
        SendPressure(channel, value);

        Zones::NoteState* note = zones_->GetNoteState(e.key_id);
        if(note != nullptr)
            note->pressure = value;
    }

    void PressureUpdate(const MidiEvents::Expression& e)
    {
        Zones::NoteState* note = LiveNote(e.key_id);
        if(note == nullptr)
            return;

        uint8_t value = PressureToWire(e.value, pressure_curve_);
        if(value == note->pressure)
        {
            stats_.pressure_filtered++;
            return;
        }
        SendPressure(note->channel, value);
        note->pressure = value;
    }

    void PitchBendInit(const MidiEvents::Expression& e)
    {
        uint8_t  channel = zones_->AllocateChannel(e.key_id);
        uint16_t value   = PositionToPitchBend(e.value, bend_dead_zone_);
        SendPitchBend(channel, value);

        Zones::NoteState* note = zones_->GetNoteState(e.key_id);
        if(note != nullptr)
            note->pitch_bend = value;
    }

    void PitchBendUpdate(const MidiEvents::Expression& e)
    {
        Zones::NoteState* note = LiveNote(e.key_id);
        if(note == nullptr)
            return;

        uint16_t value = PositionToPitchBend(e.value, bend_dead_zone_);
        if(value == note->pitch_bend)
        {
            stats_.bend_filtered++;
            return;
        }
        SendPitchBend(note->channel, value);
        note->pitch_bend = value;
    }

    void NoteOn(const MidiEvents::NoteOn& e)
    {
        uint8_t           channel = zones_->AllocateChannel(e.key_id);
        Zones::NoteState* note    = zones_->GetNoteState(e.key_id);

        if(note != nullptr)
        {
            // Retrigger of a live note (octave shift): same channel, new pitch
            note->midi_note = e.note;
        }
        else
        {
            note = zones_->AddNote(e.key_id, e.note, channel, e.velocity);
            if(note == nullptr)
                return;

            // Init events already put these values on the wire
            note->timbre        = Config::TIMBRE_CENTER;
            note->pressure      = PressureToWire(e.pressure, pressure_curve_);
            note->pitch_bend    = PositionToPitchBend(e.position, bend_dead_zone_);
            note->last_pressure = e.pressure;
            note->last_position = e.position;
        }

        uint8_t msg[3] = {static_cast<uint8_t>(0x90 | (channel & 0x0F)),
                          static_cast<uint8_t>(e.note & 0x7F),
                          static_cast<uint8_t>(e.velocity & 0x7F)};
        sender_->Send(msg, sizeof(msg), MidiSender::MessageClass::NOTE);

        Log::Debug(Log::TAG_ROUTER, "NoteOn ch %d note %d vel %d", channel,
                   e.note, e.velocity);
    }

    void NoteOff(const MidiEvents::NoteOff& e)
    {
        Zones::NoteState* note = LiveNote(e.key_id);
        if(note == nullptr)
            return;

        uint8_t channel = note->channel;
        uint8_t msg[3]  = {static_cast<uint8_t>(0x80 | (channel & 0x0F)),
                          static_cast<uint8_t>(e.note & 0x7F),
                          static_cast<uint8_t>(e.velocity & 0x7F)};
        sender_->Send(msg, sizeof(msg), MidiSender::MessageClass::NOTE);

        if(e.release)
        {
            zones_->ReleaseNote(e.key_id);
        }

        Log::Debug(Log::TAG_ROUTER, "NoteOff ch %d note %d vel %d", channel,
                   e.note, e.velocity);
    }

    void ControlChange(const MidiEvents::ControlChange& e)
    {
        sender_->SendCC(Config::ZONE_MANAGER, e.cc, e.value,
                        MidiSender::MessageClass::SYSTEM);
        Log::Debug(Log::TAG_ROUTER, "CC %d = %d", e.cc, e.value);
    }

    Zones::NoteState* LiveNote(int16_t key_id)
    {
        Zones::NoteState* note = zones_->GetNoteState(key_id);
        if(note == nullptr)
        {
            stats_.orphaned++;
            Log::Debug(Log::TAG_ROUTER, "No live note for key %d", key_id);
        }
        return note;
    }

    void SendTimbre(uint8_t channel, uint8_t value)
    {
        sender_->SendCC(channel, Config::CC_TIMBRE, value,
                        MidiSender::MessageClass::NOTE);
        stats_.timbre_sent++;
    }

    void SendPressure(uint8_t channel, uint8_t value)
    {
        uint8_t msg[2] = {static_cast<uint8_t>(0xD0 | (channel & 0x0F)),
                          static_cast<uint8_t>(value & 0x7F)};
        sender_->Send(msg, sizeof(msg), MidiSender::MessageClass::NOTE);
        stats_.pressure_sent++;
    }

    void SendPitchBend(uint8_t channel, uint16_t value)
    {
        uint8_t msg[3] = {static_cast<uint8_t>(0xE0 | (channel & 0x0F)),
                          static_cast<uint8_t>(value & 0x7F),          // LSB
                          static_cast<uint8_t>((value >> 7) & 0x7F)};  // MSB
        sender_->Send(msg, sizeof(msg), MidiSender::MessageClass::NOTE);
        stats_.bend_sent++;
    }

    Zones::Manager*     zones_;
    MidiSender::Sender* sender_;
    float               pressure_curve_;
    float               bend_dead_zone_;
    Stats               stats_;
};

} // namespace MidiRouter

#endif // EXPRESSDAISY_MIDI_ROUTER_H
