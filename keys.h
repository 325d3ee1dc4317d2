#pragma once
#ifndef EXPRESSDAISY_KEYS_H
#define EXPRESSDAISY_KEYS_H

#include <stdint.h>
#include <stddef.h>
#include "config.h"
#include "log.h"
#include "pressure.h"

/**
 * ExpressDaisy Key State Tracker
 *
 * One five-phase state machine per key, fed with normalized left/right
 * pressures every scan. Separate thresholds for entering and leaving a
 * note (hysteresis) keep noisy velostat readings from chattering.
 *
 *   INACTIVE       -> INITIAL_TOUCH   pressure > activation (strike captured)
 *   INITIAL_TOUCH  -> INACTIVE        pressure < deactivation (false touch)
 *   INITIAL_TOUCH  -> ACTIVE          next evaluation otherwise
 *   ACTIVE         -> RELEASE_PENDING pressure < tracking
 *   RELEASE_PENDING-> ACTIVE          pressure > tracking
 *   RELEASE_PENDING-> RELEASED        pressure < deactivation
 *   RELEASED       -> INACTIVE        pressure < deactivation
 *   RELEASED       -> ACTIVE          pressure >= deactivation (re-strike)
 *
 * Pressure here is max(left, right).
 */

namespace Keys
{

enum class Phase : uint8_t
{
    INACTIVE,
    INITIAL_TOUCH,
    ACTIVE,
    RELEASE_PENDING,
    RELEASED
};

/**
 * True while a note should be sounding for this phase
 */
inline bool IsSounding(Phase phase)
{
    return phase == Phase::INITIAL_TOUCH || phase == Phase::ACTIVE
           || phase == Phase::RELEASE_PENDING;
}

inline const char* PhaseName(Phase phase)
{
    switch(phase)
    {
        case Phase::INACTIVE: return "inactive";
        case Phase::INITIAL_TOUCH: return "initial";
        case Phase::ACTIVE: return "active";
        case Phase::RELEASE_PENDING: return "release-pending";
        case Phase::RELEASED: return "released";
    }
    return "?";
}

/**
 * Raw sensor pair for one key from one scan
 */
struct KeySensorSample
{
    uint16_t left_raw;
    uint16_t right_raw;
};

/**
 * Per-key state, lives for the whole process
 */
struct KeyState
{
    Phase    phase;
    float    left_pressure;
    float    right_pressure;
    float    position;         // -1.0 to 1.0
    float    pressure;         // 0.0 to 1.0
    float    strike_velocity;  // Captured on the activation edge
    uint32_t last_update;

    void Reset()
    {
        phase           = Phase::INACTIVE;
        left_pressure   = 0.0f;
        right_pressure  = 0.0f;
        position        = 0.0f;
        pressure        = 0.0f;
        strike_velocity = 0.0f;
        last_update     = 0;
    }
};

/**
 * Delta reported for a changed key
 * has_strike is only set on the activation edge, so consumers can tell
 * a new note from an update.
 */
struct KeyChange
{
    uint8_t key_id;
    float   position;
    float   pressure;
    bool    has_strike;
    float   strike_velocity;
    Phase   phase;
};

/**
 * Fixed-capacity list of changed keys for one scan
 */
struct KeyChangeList
{
    KeyChange changes[Config::NUM_KEYS];
    size_t    count;

    void Clear() { count = 0; }

    bool Push(const KeyChange& change)
    {
        if(count >= Config::NUM_KEYS)
            return false;
        changes[count++] = change;
        return true;
    }
};

class Tracker
{
  public:
    void Init(const Config::Settings& settings)
    {
        activation_threshold_   = settings.activation_threshold;
        tracking_threshold_     = settings.tracking_threshold;
        deactivation_threshold_ = settings.deactivation_threshold;

        for(uint8_t i = 0; i < Config::NUM_KEYS; i++)
        {
            keys_[i].Reset();
        }
        Log::Info(Log::TAG_KEYS, "Key tracker ready: %d keys", Config::NUM_KEYS);
    }

    /**
     * Advance one key's state machine with normalized pressures
     *
     * @param key Key index (0 to NUM_KEYS-1)
     * @param left_norm Normalized left pad pressure
     * @param right_norm Normalized right pad pressure
     * @param now Monotonic time in ms
     * @param out Filled when the key changed
     * @return true if the key changed (values or phase)
     */
    bool UpdateKey(uint8_t key, float left_norm, float right_norm,
                   uint32_t now, KeyChange& out)
    {
        if(key >= Config::NUM_KEYS)
        {
            Log::Error(Log::TAG_KEYS, "Key index %d out of range", key);
            return false;
        }

        KeyState& state    = keys_[key];
        float     position = Pressure::CalculatePosition(left_norm, right_norm);
        float     pressure = Pressure::CalculatePressure(left_norm, right_norm);

        Phase old_phase = state.phase;
        bool  struck    = Advance(state, pressure);

        bool values_changed = left_norm != state.left_pressure
                              || right_norm != state.right_pressure
                              || position != state.position
                              || pressure != state.pressure;

        if(!values_changed && state.phase == old_phase)
        {
            return false;
        }

        state.left_pressure  = left_norm;
        state.right_pressure = right_norm;
        state.position       = position;
        state.pressure       = pressure;
        state.last_update    = now;

        if(state.phase != old_phase)
        {
            Log::Debug(Log::TAG_KEYS, "Key %d: %s -> %s", key,
                       PhaseName(old_phase), PhaseName(state.phase));
        }

        out.key_id          = key;
        out.position        = position;
        out.pressure        = pressure;
        out.has_strike      = struck;
        out.strike_velocity = struck ? state.strike_velocity : 0.0f;
        out.phase           = state.phase;
        return true;
    }

    /**
     * Convert a raw sample pair and update the key
     */
    bool ProcessSample(uint8_t key, const KeySensorSample& sample,
                       uint32_t now, KeyChange& out)
    {
        float left_norm  = Pressure::NormalizeSample(sample.left_raw);
        float right_norm = Pressure::NormalizeSample(sample.right_raw);
        return UpdateKey(key, left_norm, right_norm, now, out);
    }

    /**
     * Process a full scan of raw samples (index = key id)
     * @return Number of changed keys appended
     */
    size_t Scan(const KeySensorSample* samples, size_t count, uint32_t now,
                KeyChangeList& changes)
    {
        size_t before = changes.count;
        if(count > Config::NUM_KEYS)
            count = Config::NUM_KEYS;

        for(size_t i = 0; i < count; i++)
        {
            KeyChange change;
            if(ProcessSample(static_cast<uint8_t>(i), samples[i], now, change))
            {
                changes.Push(change);
            }
        }
        return changes.count - before;
    }

    const KeyState& GetKeyState(uint8_t key) const
    {
        return keys_[key < Config::NUM_KEYS ? key : 0];
    }

  private:
    /**
     * Take at most one transition edge
     * @return true on an activation edge (strike velocity captured)
     */
    bool Advance(KeyState& state, float pressure)
    {
        switch(state.phase)
        {
            case Phase::INACTIVE:
                if(pressure > activation_threshold_)
                {
                    state.phase           = Phase::INITIAL_TOUCH;
                    state.strike_velocity = pressure;
                    return true;
                }
                break;

            case Phase::INITIAL_TOUCH:
                if(pressure < deactivation_threshold_)
                    state.phase = Phase::INACTIVE;
                else
                    state.phase = Phase::ACTIVE;
                break;

            case Phase::ACTIVE:
                if(pressure < tracking_threshold_)
                    state.phase = Phase::RELEASE_PENDING;
                break;

            case Phase::RELEASE_PENDING:
                if(pressure > tracking_threshold_)
                    state.phase = Phase::ACTIVE;
                else if(pressure < deactivation_threshold_)
                    state.phase = Phase::RELEASED;
                break;

            case Phase::RELEASED:
                if(pressure < deactivation_threshold_)
                {
                    state.phase = Phase::INACTIVE;
                }
                else
                {
                    // Re-strike before the key settled: new activation cycle
                    state.phase           = Phase::ACTIVE;
                    state.strike_velocity = pressure;
                    return true;
                }
                break;
        }
        return false;
    }

    KeyState keys_[Config::NUM_KEYS];
    float    activation_threshold_;
    float    tracking_threshold_;
    float    deactivation_threshold_;
};

} // namespace Keys

#endif // EXPRESSDAISY_KEYS_H
