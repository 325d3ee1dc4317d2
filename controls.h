#pragma once
#ifndef EXPRESSDAISY_CONTROLS_H
#define EXPRESSDAISY_CONTROLS_H

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include "config.h"
#include "log.h"
#include "pots.h"
#include "midi_events.h"
#include "midi_router.h"

/**
 * ExpressDaisy Controller Mapping
 *
 * Maps each of the 14 pots to a MIDI CC number. Starts out with the
 * default assignments; a paired expression engine replaces the whole
 * table with a config message:
 *
 *   cc|<pot>=<cc>|<pot>=<cc>|...
 *
 * Each assignment may carry a display name after a colon
 * ("0=74:Timbre"), which is ignored. Pots not named in the message map
 * to CC 0, which is never sent.
 */

namespace Controls
{

constexpr const char* CONFIG_PREFIX     = "cc|";
constexpr size_t      CONFIG_PREFIX_LEN = 3;
constexpr uint8_t     CC_UNASSIGNED     = 0;

/**
 * Pot -> CC table
 */
struct Mapping
{
    uint8_t cc[Config::NUM_POTS];
    bool    assigned[Config::NUM_POTS];  // Named in the last config message
    bool    configured;                  // A config message has been applied

    void SetDefaults()
    {
        for(uint8_t i = 0; i < Config::NUM_POTS; i++)
        {
            cc[i]       = Config::DEFAULT_CC_ASSIGNMENTS[i];
            assigned[i] = true;
        }
        configured = false;
    }

    void Clear()
    {
        for(uint8_t i = 0; i < Config::NUM_POTS; i++)
        {
            cc[i]       = CC_UNASSIGNED;
            assigned[i] = false;
        }
    }
};

/**
 * Parse a decimal field [begin, end) into value (max 3 digits)
 */
inline bool ParseNumber(const char* begin, const char* end, int& value)
{
    if(begin >= end || end - begin > 3)
        return false;

    value = 0;
    for(const char* p = begin; p < end; p++)
    {
        if(*p < '0' || *p > '9')
            return false;
        value = value * 10 + (*p - '0');
    }
    return true;
}

/**
 * Parse a full config message into a fresh mapping
 *
 * Any bad assignment rejects the whole message. Empty segments are
 * skipped, but at least one assignment is required.
 */
inline Config::Result ParseConfig(const char* message, Mapping& out)
{
    if(message == nullptr || strncmp(message, CONFIG_PREFIX, CONFIG_PREFIX_LEN) != 0)
        return Config::Result::MALFORMED;

    out.Clear();

    const char* p     = message + CONFIG_PREFIX_LEN;
    int         count = 0;
    while(*p != '\0')
    {
        const char* seg_end = strchr(p, '|');
        if(seg_end == nullptr)
            seg_end = p + strlen(p);

        if(seg_end != p)
        {
            const char* eq = static_cast<const char*>(memchr(p, '=', seg_end - p));
            if(eq == nullptr)
                return Config::Result::MALFORMED;

            const char* cc_end = static_cast<const char*>(memchr(eq + 1, ':', seg_end - (eq + 1)));
            if(cc_end == nullptr)
                cc_end = seg_end;

            int pot, cc;
            if(!ParseNumber(p, eq, pot) || !ParseNumber(eq + 1, cc_end, cc))
                return Config::Result::MALFORMED;
            if(pot >= Config::NUM_POTS || cc > 127)
                return Config::Result::MALFORMED;

            out.cc[pot]       = static_cast<uint8_t>(cc);
            out.assigned[pot] = true;
            count++;
        }

        p = (*seg_end == '|') ? seg_end + 1 : seg_end;
    }

    if(count == 0)
        return Config::Result::MALFORMED;

    out.configured = true;
    return Config::Result::OK;
}

class Processor
{
  public:
    void Init()
    {
        mapping_.SetDefaults();
        Log::Info(Log::TAG_CONTROL, "Controller mapping: defaults");
    }

    /**
     * Apply a config message
     *
     * On failure nothing from the message is applied: the defaults are
     * restored if no config was ever accepted, otherwise the last good
     * mapping stays.
     */
    Config::Result HandleConfigMessage(const char* message)
    {
        Mapping parsed;
        Config::Result result = ParseConfig(message, parsed);

        if(result != Config::Result::OK)
        {
            if(!mapping_.configured)
            {
                mapping_.SetDefaults();
                Log::Error(Log::TAG_CONTROL, "Bad config message, using defaults");
            }
            else
            {
                Log::Error(Log::TAG_CONTROL, "Bad config message, keeping last mapping");
            }
            return result;
        }

        mapping_ = parsed;
        for(uint8_t i = 0; i < Config::NUM_POTS; i++)
        {
            if(mapping_.assigned[i])
                Log::Debug(Log::TAG_CONTROL, "Pot %d -> CC %d", i, mapping_.cc[i]);
        }
        Log::Info(Log::TAG_CONTROL, "Controller mapping updated");
        return Config::Result::OK;
    }

    void ResetToDefaults()
    {
        mapping_.SetDefaults();
        Log::Info(Log::TAG_CONTROL, "Controller mapping reset to defaults");
    }

    uint8_t GetControllerForPot(uint8_t pot) const
    {
        return pot < Config::NUM_POTS ? mapping_.cc[pot] : CC_UNASSIGNED;
    }

    bool IsAssigned(uint8_t pot) const
    {
        return pot < Config::NUM_POTS && mapping_.assigned[pot];
    }

    const Mapping& GetMapping() const { return mapping_; }

    /**
     * Pot changes -> CONTROL_CHANGE events
     */
    void ProcessPotChanges(const Pots::PotChangeList& changes,
                           MidiEvents::EventList&     out) const
    {
        for(size_t i = 0; i < changes.count; i++)
        {
            AddControl(changes.changes[i].index, changes.changes[i].new_value, out);
        }
    }

    /**
     * Current value of every assigned pot (config burst)
     */
    void ProcessPotValues(const float* values, MidiEvents::EventList& out) const
    {
        for(uint8_t i = 0; i < Config::NUM_POTS; i++)
        {
            if(mapping_.assigned[i])
                AddControl(i, values[i], out);
        }
    }

  private:
    void AddControl(uint8_t pot, float value, MidiEvents::EventList& out) const
    {
        uint8_t cc = GetControllerForPot(pot);
        if(cc == CC_UNASSIGNED)
            return;

        uint8_t midi_value = MidiRouter::ValueToCC(value);
        out.Push(MidiEvents::Event::MakeControlChange(cc, midi_value));
        Log::Debug(Log::TAG_CONTROL, "Pot %d: CC %d = %d", pot, cc, midi_value);
    }

    Mapping mapping_;
};

} // namespace Controls

#endif // EXPRESSDAISY_CONTROLS_H
