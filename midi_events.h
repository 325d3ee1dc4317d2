#pragma once
#ifndef EXPRESSDAISY_MIDI_EVENTS_H
#define EXPRESSDAISY_MIDI_EVENTS_H

#include <stdint.h>
#include <stddef.h>
#include "log.h"

/**
 * ExpressDaisy MIDI Events
 *
 * Abstract events produced by the note and control processors and
 * consumed by the router. Expression values stay normalized here; the
 * router does the wire encoding and dedup.
 */

namespace MidiEvents
{

enum class Type : uint8_t
{
    TIMBRE_INIT,        // CC74 centre before NoteOn
    TIMBRE_UPDATE,      // CC74 from position
    PRESSURE_INIT,      // Channel pressure before NoteOn (not deduped)
    PRESSURE_UPDATE,    // Channel pressure (deduped)
    PITCH_BEND_INIT,    // Pitch bend before NoteOn (not deduped)
    PITCH_BEND_UPDATE,  // Pitch bend (deduped)
    NOTE_ON,
    NOTE_OFF,
    CONTROL_CHANGE      // Pot CC on the manager channel
};

// Payloads

struct Expression
{
    int16_t key_id;
    float   value;  // Pressure 0..1 or position -1..1
};

struct NoteOn
{
    int16_t key_id;
    uint8_t note;
    uint8_t velocity;
    float   pressure;  // Values sent by the preceding init events
    float   position;
};

struct NoteOff
{
    int16_t key_id;
    uint8_t note;
    uint8_t velocity;
    bool    release;  // false: retrigger (octave shift), channel stays allocated
};

struct ControlChange
{
    uint8_t cc;
    uint8_t value;
};

struct Event
{
    Type type;
    union
    {
        Expression    expression;
        NoteOn        note_on;
        NoteOff       note_off;
        ControlChange control;
    };

    static Event MakeExpression(Type type, int16_t key_id, float value)
    {
        Event e;
        e.type              = type;
        e.expression.key_id = key_id;
        e.expression.value  = value;
        return e;
    }

    static Event MakeNoteOn(int16_t key_id, uint8_t note, uint8_t velocity,
                            float pressure, float position)
    {
        Event e;
        e.type             = Type::NOTE_ON;
        e.note_on.key_id   = key_id;
        e.note_on.note     = note;
        e.note_on.velocity = velocity;
        e.note_on.pressure = pressure;
        e.note_on.position = position;
        return e;
    }

    static Event MakeNoteOff(int16_t key_id, uint8_t note, uint8_t velocity,
                             bool release)
    {
        Event e;
        e.type              = Type::NOTE_OFF;
        e.note_off.key_id   = key_id;
        e.note_off.note     = note;
        e.note_off.velocity = velocity;
        e.note_off.release  = release;
        return e;
    }

    static Event MakeControlChange(uint8_t cc, uint8_t value)
    {
        Event e;
        e.type          = Type::CONTROL_CHANGE;
        e.control.cc    = cc;
        e.control.value = value;
        return e;
    }
};

inline const char* TypeName(Type type)
{
    switch(type)
    {
        case Type::TIMBRE_INIT: return "timbre_init";
        case Type::TIMBRE_UPDATE: return "timbre_update";
        case Type::PRESSURE_INIT: return "pressure_init";
        case Type::PRESSURE_UPDATE: return "pressure_update";
        case Type::PITCH_BEND_INIT: return "pitch_bend_init";
        case Type::PITCH_BEND_UPDATE: return "pitch_bend_update";
        case Type::NOTE_ON: return "note_on";
        case Type::NOTE_OFF: return "note_off";
        case Type::CONTROL_CHANGE: return "control_change";
    }
    return "?";
}

// Octave shift worst case: 6 events for each of 32 live notes
constexpr size_t MAX_EVENTS = 192;

/**
 * Fixed-capacity ordered event list for one pipeline stage
 */
struct EventList
{
    Event    events[MAX_EVENTS];
    size_t   count;
    uint32_t dropped;

    void Clear()
    {
        count   = 0;
        dropped = 0;
    }

    bool Push(const Event& event)
    {
        if(count >= MAX_EVENTS)
        {
            dropped++;
            Log::Error(Log::TAG_EVENTS, "Event list full, dropped %s", TypeName(event.type));
            return false;
        }
        events[count++] = event;
        return true;
    }

    const Event& operator[](size_t i) const { return events[i]; }
};

} // namespace MidiEvents

#endif // EXPRESSDAISY_MIDI_EVENTS_H
