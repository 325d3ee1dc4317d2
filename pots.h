#pragma once
#ifndef EXPRESSDAISY_POTS_H
#define EXPRESSDAISY_POTS_H

#include <stdint.h>
#include <stddef.h>
#include <math.h>
#include "daisysp.h"
#include "config.h"
#include "log.h"

/**
 * ExpressDaisy Potentiometer Tracking
 *
 * Raw 16-bit readings from the control mux are normalized with a small
 * lower trim and rounded to 3 decimals to swallow ADC noise. An idle pot
 * must move more than POT_THRESHOLD counts to wake up; once awake it
 * reports every move above POT_CHANGE_THRESHOLD.
 */

namespace Pots
{

/**
 * Raw ADC value to 0.0-1.0
 */
inline float Normalize(uint16_t raw)
{
    uint16_t clamped = raw < Config::ADC_MIN ? Config::ADC_MIN : raw;
    float    value   = static_cast<float>(clamped - Config::ADC_MIN)
                  / static_cast<float>(Config::ADC_MAX - Config::ADC_MIN);

    if(value < Config::POT_LOWER_TRIM)
        value = 0.0f;
    else if(value > 1.0f - Config::POT_UPPER_TRIM)
        value = 1.0f;
    else
        value = (value - Config::POT_LOWER_TRIM)
                / (1.0f - Config::POT_LOWER_TRIM - Config::POT_UPPER_TRIM);

    return roundf(daisysp::fclamp(value, 0.0f, 1.0f) * 1000.0f) / 1000.0f;
}

struct PotChange
{
    uint8_t index;
    float   old_value;
    float   new_value;
};

struct PotChangeList
{
    PotChange changes[Config::NUM_POTS];
    size_t    count;

    void Clear() { count = 0; }

    void Push(uint8_t index, float old_value, float new_value)
    {
        if(count >= Config::NUM_POTS)
            return;
        changes[count].index     = index;
        changes[count].old_value = old_value;
        changes[count].new_value = new_value;
        count++;
    }
};

/**
 * Per-pot activity state
 */
struct PotState
{
    uint16_t last_raw;        // Raw value at the last report
    float    last_value;      // Normalized value at the last report
    bool     active;          // Moving: small changes are reported

    void Init()
    {
        last_raw   = 0;
        last_value = 0.0f;
        active     = false;
    }

    /**
     * Feed a new raw reading
     * Returns true if the pot should report a change
     */
    bool Update(uint16_t raw, float& old_value, float& new_value)
    {
        int diff = static_cast<int>(raw) - static_cast<int>(last_raw);
        if(diff < 0) diff = -diff;

        float normalized = Normalize(raw);

        if(active)
        {
            if(diff > Config::POT_CHANGE_THRESHOLD)
            {
                if(normalized == last_value)
                    return false;
            }
            else
            {
                if(diff < Config::POT_THRESHOLD)
                    active = false;
                return false;
            }
        }
        else
        {
            if(diff <= Config::POT_THRESHOLD)
                return false;
            active = true;
            if(normalized == last_value)
                return false;
        }

        old_value  = last_value;
        new_value  = normalized;
        last_raw   = raw;
        last_value = normalized;
        return true;
    }
};

class Tracker
{
  public:
    void Init()
    {
        for(uint8_t i = 0; i < Config::NUM_POTS; i++)
        {
            pots_[i].Init();
        }
    }

    /**
     * Compare a full scan against the last reported values
     * @param raw NUM_POTS raw readings
     * @return Number of changes appended
     */
    size_t ReadPots(const uint16_t* raw, PotChangeList& changes)
    {
        size_t before = changes.count;
        for(uint8_t i = 0; i < Config::NUM_POTS; i++)
        {
            bool  was_active = pots_[i].active;
            float old_value, new_value;
            if(pots_[i].Update(raw[i], old_value, new_value))
            {
                changes.Push(i, old_value, new_value);
            }
            if(was_active != pots_[i].active)
            {
                Log::Debug(Log::TAG_POTS, "Pot %d %s", i,
                           pots_[i].active ? "active" : "idle");
            }
        }
        return changes.count - before;
    }

    /**
     * Take every current value as reported and mark all pots active
     * @param values Receives NUM_POTS normalized values
     */
    void ReadAll(const uint16_t* raw, float* values)
    {
        for(uint8_t i = 0; i < Config::NUM_POTS; i++)
        {
            pots_[i].last_raw   = raw[i];
            pots_[i].last_value = Normalize(raw[i]);
            pots_[i].active     = true;
            values[i]           = pots_[i].last_value;
        }
        Log::Debug(Log::TAG_POTS, "Read all %d pots", Config::NUM_POTS);
    }

    float GetValue(uint8_t index) const
    {
        return index < Config::NUM_POTS ? pots_[index].last_value : 0.0f;
    }

  private:
    PotState pots_[Config::NUM_POTS];
};

} // namespace Pots

#endif // EXPRESSDAISY_POTS_H
