#pragma once
#ifndef EXPRESSDAISY_ZONES_H
#define EXPRESSDAISY_ZONES_H

#include <stdint.h>
#include <stddef.h>
#include <math.h>
#include "daisysp.h"
#include "config.h"
#include "log.h"

/**
 * ExpressDaisy MPE Zone / Channel Manager
 *
 * Owns the member channel pool and the NoteState table. Each sounding
 * note gets one member channel; when the pool runs out, notes share the
 * least loaded channel.
 *
 * Key ids are the physical key index (0-24). System generated notes
 * (greeting chime) use negative ids.
 */

namespace Zones
{

constexpr uint8_t MAX_NOTES    = 32;  // NoteState slots
constexpr uint8_t MAX_CHANNELS = 16;

/**
 * Live expression state of one logical note
 *
 * pressure/pitch_bend/timbre hold the last values sent on the wire
 * (7-bit, 14-bit, 7-bit) and are what the router dedups against.
 */
struct NoteState
{
    int16_t  key_id;
    uint8_t  midi_note;
    uint8_t  channel;
    uint8_t  velocity;
    uint8_t  pressure;    // Last sent channel pressure (0-127)
    uint16_t pitch_bend;  // Last sent pitch bend (0-16383)
    uint8_t  timbre;      // Last sent CC74 (0-127)
    bool     active;      // Allocated and not yet released
    bool     in_use;      // Slot holds a record (active or retained)

    // Most recent normalized readings, replayed on octave shift
    float last_pressure;
    float last_position;

    // Rolling pressure history for release velocity
    float    history[Config::PRESSURE_HISTORY_SIZE];
    uint32_t history_time[Config::PRESSURE_HISTORY_SIZE];
    uint8_t  history_count;

    void Init(int16_t key, uint8_t note, uint8_t ch, uint8_t vel)
    {
        key_id        = key;
        midi_note     = note;
        channel       = ch;
        velocity      = vel;
        pressure      = 0;
        pitch_bend    = Config::PITCH_BEND_CENTER;
        timbre        = Config::TIMBRE_CENTER;
        active        = true;
        in_use        = true;
        last_pressure = 0.0f;
        last_position = 0.0f;
        history_count = 0;
    }

    /**
     * Append a pressure reading, dropping the oldest when full
     */
    void UpdatePressureHistory(float value, uint32_t now)
    {
        last_pressure = value;

        if(history_count == Config::PRESSURE_HISTORY_SIZE)
        {
            for(uint8_t i = 1; i < Config::PRESSURE_HISTORY_SIZE; i++)
            {
                history[i - 1]      = history[i];
                history_time[i - 1] = history_time[i];
            }
            history_count--;
        }

        if(history_count > 0)
        {
            float change = fabsf(value - history[history_count - 1]);
            if(change > 0.2f)
            {
                Log::Debug(Log::TAG_NOTES, "Note %d pressure jump %d%%", midi_note,
                           static_cast<int>(change * 100.0f));
            }
        }

        history[history_count]      = value;
        history_time[history_count] = now;
        history_count++;
    }

    /**
     * Release velocity from the average pressure decay rate
     *
     * Rate is |sum(dp)| / sum(dt) in pressure units per second over the
     * stored history. Slow releases give 0.
     */
    uint8_t CalculateReleaseVelocity() const
    {
        if(history_count < 2)
            return 0;

        float    total_change = 0.0f;
        uint32_t total_ms     = 0;
        for(uint8_t i = 1; i < history_count; i++)
        {
            uint32_t dt = history_time[i] - history_time[i - 1];
            if(dt > 0)
            {
                total_change += history[i] - history[i - 1];
                total_ms += dt;
            }
        }

        if(total_ms == 0)
            return 0;

        float rate = fabsf(total_change / (static_cast<float>(total_ms) / 1000.0f));
        if(rate < Config::RELEASE_VELOCITY_THRESHOLD)
            return 0;

        float scaled = rate * Config::RELEASE_VELOCITY_SCALE * 127.0f;
        return static_cast<uint8_t>(daisysp::fmin(scaled, 127.0f));
    }
};

/**
 * Channel pool and NoteState table
 */
class Manager
{
  public:
    void Init(const Config::Settings& settings)
    {
        zone_start_ = settings.zone_start;
        zone_end_   = settings.zone_end;
        if(zone_end_ >= MAX_CHANNELS)
            zone_end_ = MAX_CHANNELS - 1;

        for(uint8_t i = 0; i < MAX_NOTES; i++)
        {
            notes_[i].in_use = false;
            notes_[i].active = false;
        }
        for(uint8_t ch = 0; ch < MAX_CHANNELS; ch++)
        {
            channel_count_[ch] = 0;
        }

        Log::Info(Log::TAG_ZONES, "Zone manager: member channels %d-%d",
                  zone_start_, zone_end_);
    }

    /**
     * Pick a member channel for a note
     *
     * 1. Live note for this key keeps its channel
     * 2. First free channel in pool order
     * 3. Least loaded channel, lowest number wins ties
     * 4. First pool channel
     */
    uint8_t AllocateChannel(int16_t key_id) const
    {
        const NoteState* live = FindActive(key_id);
        if(live != nullptr)
            return live->channel;

        for(uint8_t ch = zone_start_; ch <= zone_end_; ch++)
        {
            if(channel_count_[ch] == 0)
            {
                Log::Debug(Log::TAG_ZONES, "Free channel %d for key %d", ch, key_id);
                return ch;
            }
        }

        uint8_t best_channel = 0;
        uint8_t best_load    = 0xFF;
        bool    found        = false;
        for(uint8_t ch = zone_start_; ch <= zone_end_; ch++)
        {
            if(!found || channel_count_[ch] < best_load)
            {
                best_channel = ch;
                best_load    = channel_count_[ch];
                found        = true;
            }
        }

        if(found)
        {
            Log::Debug(Log::TAG_ZONES, "Shared channel %d (load %d) for key %d",
                       best_channel, best_load, key_id);
            return best_channel;
        }

        Log::Warn(Log::TAG_ZONES, "Empty channel pool, key %d on channel %d",
                  key_id, zone_start_);
        return zone_start_;
    }

    /**
     * Record a new live note on a channel
     *
     * Replaces any previous record for the same key. Returns nullptr when
     * every slot holds an active note.
     */
    NoteState* AddNote(int16_t key_id, uint8_t midi_note, uint8_t channel,
                       uint8_t velocity)
    {
        NoteState* note = FindRecord(key_id);
        if(note != nullptr && note->active)
        {
            Unassign(*note);
        }
        if(note == nullptr)
        {
            note = FreeSlot();
        }
        if(note == nullptr)
        {
            Log::Error(Log::TAG_ZONES, "Note table full, dropping key %d", key_id);
            return nullptr;
        }

        note->Init(key_id, midi_note, channel, velocity);
        if(channel < MAX_CHANNELS)
            channel_count_[channel]++;

        Log::Debug(Log::TAG_ZONES, "Add key %d note %d ch %d vel %d (load %d)",
                   key_id, midi_note, channel, velocity,
                   channel < MAX_CHANNELS ? channel_count_[channel] : 0);
        return note;
    }

    /**
     * Release a live note and free its channel slot
     * The record is kept (inactive) until the slot is reused.
     */
    void ReleaseNote(int16_t key_id)
    {
        NoteState* note = FindRecord(key_id);
        if(note == nullptr || !note->active)
            return;

        Unassign(*note);
        note->active = false;
        Log::Debug(Log::TAG_ZONES, "Release key %d from ch %d (%d channels busy)",
                   key_id, note->channel, BusyChannels());
    }

    /**
     * Live note for a key, nullptr if none
     */
    NoteState* GetNoteState(int16_t key_id)
    {
        NoteState* note = FindRecord(key_id);
        return (note != nullptr && note->active) ? note : nullptr;
    }

    /**
     * Last record for a key, active or not
     */
    const NoteState* GetNoteRecord(int16_t key_id) const
    {
        for(uint8_t i = 0; i < MAX_NOTES; i++)
        {
            if(notes_[i].in_use && notes_[i].key_id == key_id)
                return &notes_[i];
        }
        return nullptr;
    }

    /**
     * Collect pointers to every active note
     * @return Number written to out (at most max)
     */
    size_t GetActiveNotes(NoteState** out, size_t max)
    {
        size_t count = 0;
        for(uint8_t i = 0; i < MAX_NOTES && count < max; i++)
        {
            if(notes_[i].in_use && notes_[i].active)
                out[count++] = &notes_[i];
        }
        return count;
    }

    size_t ActiveCount() const
    {
        size_t count = 0;
        for(uint8_t i = 0; i < MAX_NOTES; i++)
        {
            if(notes_[i].in_use && notes_[i].active)
                count++;
        }
        return count;
    }

    uint8_t GetChannelLoad(uint8_t channel) const
    {
        return channel < MAX_CHANNELS ? channel_count_[channel] : 0;
    }

    uint8_t ZoneStart() const { return zone_start_; }
    uint8_t ZoneEnd() const { return zone_end_; }
    uint8_t ZoneSize() const { return zone_end_ - zone_start_ + 1; }

  private:
    NoteState* FindRecord(int16_t key_id)
    {
        for(uint8_t i = 0; i < MAX_NOTES; i++)
        {
            if(notes_[i].in_use && notes_[i].key_id == key_id)
                return &notes_[i];
        }
        return nullptr;
    }

    const NoteState* FindActive(int16_t key_id) const
    {
        const NoteState* note = GetNoteRecord(key_id);
        return (note != nullptr && note->active) ? note : nullptr;
    }

    /**
     * Empty slot first, otherwise the first retained (released) record
     */
    NoteState* FreeSlot()
    {
        for(uint8_t i = 0; i < MAX_NOTES; i++)
        {
            if(!notes_[i].in_use)
                return &notes_[i];
        }
        for(uint8_t i = 0; i < MAX_NOTES; i++)
        {
            if(!notes_[i].active)
                return &notes_[i];
        }
        return nullptr;
    }

    void Unassign(const NoteState& note)
    {
        if(note.channel < MAX_CHANNELS && channel_count_[note.channel] > 0)
            channel_count_[note.channel]--;
    }

    uint8_t BusyChannels() const
    {
        uint8_t busy = 0;
        for(uint8_t ch = zone_start_; ch <= zone_end_; ch++)
        {
            if(channel_count_[ch] > 0)
                busy++;
        }
        return busy;
    }

    NoteState notes_[MAX_NOTES];
    uint8_t   channel_count_[MAX_CHANNELS];
    uint8_t   zone_start_;
    uint8_t   zone_end_;
};

} // namespace Zones

#endif // EXPRESSDAISY_ZONES_H
