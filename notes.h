#pragma once
#ifndef EXPRESSDAISY_NOTES_H
#define EXPRESSDAISY_NOTES_H

#include <stdint.h>
#include <stddef.h>
#include <math.h>
#include "daisysp.h"
#include "config.h"
#include "log.h"
#include "keys.h"
#include "zones.h"
#include "midi_events.h"

/**
 * ExpressDaisy MPE Note Processor
 *
 * Turns key deltas into ordered MIDI events:
 *
 *   New note: TIMBRE_INIT -> PRESSURE_INIT -> PITCH_BEND_INIT -> NOTE_ON
 *   Held:     TIMBRE_UPDATE -> PRESSURE_UPDATE -> PITCH_BEND_UPDATE
 *   Release:  PRESSURE_UPDATE(0) -> NOTE_OFF
 *
 * Channel allocation and NoteState creation happen in the router when
 * the events are sent, so the processor only reads the zone table.
 */

namespace Notes
{

/**
 * Normalized 0..1 to MIDI velocity
 */
inline uint8_t ToVelocity(float value)
{
    return static_cast<uint8_t>(roundf(daisysp::fclamp(value, 0.0f, 1.0f) * 127.0f));
}

/**
 * NoteOn velocity. Never 0, which receivers read as NoteOff.
 */
inline uint8_t ToNoteOnVelocity(float value)
{
    uint8_t velocity = ToVelocity(value);
    return velocity > 0 ? velocity : 1;
}

class Processor
{
  public:
    void Init(const Config::Settings& settings, Zones::Manager* zones)
    {
        zones_          = zones;
        base_root_note_ = settings.base_root_note;
        octave_         = 0;
        Log::Info(Log::TAG_NOTES, "Note processor: root note %d", base_root_note_);
    }

    /**
     * MIDI note for a key at the current octave
     */
    uint8_t NoteForKey(int16_t key_id) const
    {
        int note = base_root_note_ + octave_ * 12 + key_id;
        if(note < 0)
            note = 0;
        if(note > 127)
            note = 127;
        return static_cast<uint8_t>(note);
    }

    /**
     * Append events for one scan's key changes
     * @param now Monotonic time in ms (pressure history)
     */
    void ProcessKeyChanges(const Keys::KeyChangeList& changes, uint32_t now,
                           MidiEvents::EventList& out)
    {
        for(size_t i = 0; i < changes.count; i++)
        {
            ProcessKeyChange(changes.changes[i], now, out);
        }
    }

    void ProcessKeyChange(const Keys::KeyChange& change, uint32_t now,
                          MidiEvents::EventList& out)
    {
        int16_t           key  = change.key_id;
        Zones::NoteState* note = zones_->GetNoteState(key);

        if(Keys::IsSounding(change.phase))
        {
            if(note == nullptr)
            {
                if(change.has_strike)
                    StartNote(key, change, out);
                return;
            }

            note->UpdatePressureHistory(change.pressure, now);
            note->last_position = change.position;

            using MidiEvents::Event;
            using MidiEvents::Type;
            out.Push(Event::MakeExpression(Type::TIMBRE_UPDATE, key, change.position));
            out.Push(Event::MakeExpression(Type::PRESSURE_UPDATE, key, change.pressure));
            out.Push(Event::MakeExpression(Type::PITCH_BEND_UPDATE, key, change.position));
            return;
        }

        if(note != nullptr)
        {
            uint8_t release_velocity = note->CalculateReleaseVelocity();

            out.Push(MidiEvents::Event::MakeExpression(
                MidiEvents::Type::PRESSURE_UPDATE, key, 0.0f));
            out.Push(MidiEvents::Event::MakeNoteOff(key, note->midi_note,
                                                    release_velocity, true));
            Log::Debug(Log::TAG_NOTES, "Key %d note %d released, vel %d", key,
                       note->midi_note, release_velocity);
        }
    }

    /**
     * Shift the keyboard by whole octaves (clamped to +/-OCTAVE_LIMIT)
     *
     * Every live key note is retriggered at the new pitch on its own
     * channel: refreshed pressure/pitch-bend, NoteOff(old), NoteOn(new),
     * then the held expression again. Synthetic notes are left alone.
     *
     * @return true if the octave changed
     */
    bool HandleOctaveShift(int8_t direction, MidiEvents::EventList& out)
    {
        int new_octave = octave_ + direction;
        if(new_octave > Config::OCTAVE_LIMIT)
            new_octave = Config::OCTAVE_LIMIT;
        if(new_octave < -Config::OCTAVE_LIMIT)
            new_octave = -Config::OCTAVE_LIMIT;

        if(new_octave == octave_)
            return false;

        Log::Info(Log::TAG_NOTES, "Octave %d -> %d", octave_, new_octave);
        octave_ = static_cast<int8_t>(new_octave);

        Zones::NoteState* active[Zones::MAX_NOTES];
        size_t count = zones_->GetActiveNotes(active, Zones::MAX_NOTES);

        using MidiEvents::Event;
        using MidiEvents::Type;
        for(size_t i = 0; i < count; i++)
        {
            const Zones::NoteState& note = *active[i];
            if(note.key_id < 0)
                continue;

            uint8_t old_note = note.midi_note;
            uint8_t new_note = NoteForKey(note.key_id);

            out.Push(Event::MakeExpression(Type::PRESSURE_INIT, note.key_id, note.last_pressure));
            out.Push(Event::MakeExpression(Type::PITCH_BEND_INIT, note.key_id, note.last_position));
            out.Push(Event::MakeNoteOff(note.key_id, old_note, 0, false));
            out.Push(Event::MakeNoteOn(note.key_id, new_note,
                                       note.velocity > 0 ? note.velocity : 1,
                                       note.last_pressure, note.last_position));

            if(note.last_pressure > 0.0f)
            {
                out.Push(Event::MakeExpression(Type::PRESSURE_UPDATE, note.key_id, note.last_pressure));
                out.Push(Event::MakeExpression(Type::PITCH_BEND_UPDATE, note.key_id, note.last_position));
            }

            Log::Debug(Log::TAG_NOTES, "Key %d shifted %d -> %d", note.key_id,
                       old_note, new_note);
        }
        return true;
    }

    /**
     * Greeting chime note start (index 0..GREETING_LENGTH-1)
     * Uses synthetic key id -1 - index.
     */
    void GreetingNoteOn(uint8_t index, MidiEvents::EventList& out) const
    {
        if(index >= Config::GREETING_LENGTH)
            return;

        int16_t key      = GreetingKey(index);
        float   pressure = Config::GREETING_PRESSURE;

        using MidiEvents::Event;
        using MidiEvents::Type;
        out.Push(Event::MakeExpression(Type::TIMBRE_INIT, key, 0.0f));
        out.Push(Event::MakeExpression(Type::PRESSURE_INIT, key, pressure));
        out.Push(Event::MakeExpression(Type::PITCH_BEND_INIT, key, 0.0f));
        out.Push(Event::MakeNoteOn(key, Config::GREETING_NOTES[index],
                                   ToNoteOnVelocity(Config::GREETING_VELOCITIES[index]),
                                   pressure, 0.0f));
    }

    void GreetingNoteOff(uint8_t index, MidiEvents::EventList& out) const
    {
        if(index >= Config::GREETING_LENGTH)
            return;

        int16_t key = GreetingKey(index);
        out.Push(MidiEvents::Event::MakeExpression(MidiEvents::Type::PRESSURE_UPDATE, key, 0.0f));
        out.Push(MidiEvents::Event::MakeNoteOff(key, Config::GREETING_NOTES[index], 0, true));
    }

    static int16_t GreetingKey(uint8_t index) { return -1 - static_cast<int16_t>(index); }

    int8_t GetOctave() const { return octave_; }

  private:
    void StartNote(int16_t key, const Keys::KeyChange& change,
                   MidiEvents::EventList& out)
    {
        uint8_t midi_note = NoteForKey(key);
        uint8_t velocity  = ToNoteOnVelocity(change.strike_velocity);

        using MidiEvents::Event;
        using MidiEvents::Type;
        out.Push(Event::MakeExpression(Type::TIMBRE_INIT, key, change.position));
        out.Push(Event::MakeExpression(Type::PRESSURE_INIT, key, change.pressure));
        out.Push(Event::MakeExpression(Type::PITCH_BEND_INIT, key, change.position));
        out.Push(Event::MakeNoteOn(key, midi_note, velocity, change.pressure,
                                   change.position));

        Log::Debug(Log::TAG_NOTES, "Key %d note %d on, vel %d", key, midi_note,
                   velocity);
    }

    Zones::Manager* zones_;
    uint8_t         base_root_note_;
    int8_t          octave_;
};

} // namespace Notes

#endif // EXPRESSDAISY_NOTES_H
