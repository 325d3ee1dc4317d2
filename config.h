#pragma once
#ifndef EXPRESSDAISY_CONFIG_H
#define EXPRESSDAISY_CONFIG_H

#include <stdint.h>

/**
 * ExpressDaisy Static Configuration
 *
 * Calibration constants for the velostat key sensors, scan timing,
 * MPE zone layout and the default pot -> CC assignments.
 * Loaded once at startup into Settings; the core never mutates it.
 */

namespace Config
{

// Keyboard
constexpr uint8_t NUM_KEYS = 25;
constexpr uint8_t NUM_POTS = 14;

// ADC
constexpr uint16_t ADC_MAX           = 65535;
constexpr uint16_t ADC_MIN           = 1;
constexpr float    ADC_REF_VOLTAGE   = 3.3f;
constexpr float    REST_VOLTAGE      = 3.3f;    // Sensor untouched at/above this
constexpr float    ADC_RESISTANCE_SCALE = 100000.0f;  // Divider reference resistor (ohms)

// Velostat resistance bounds (ohms)
constexpr float MAX_VK_RESISTANCE = 25000.0f;  // Lightest detectable touch
constexpr float MIN_VK_RESISTANCE = 1100.0f;   // Full pressure

// Key thresholds (normalized pressure)
constexpr float ACTIVATION_THRESHOLD   = 0.0f;
constexpr float TRACKING_THRESHOLD     = 0.01f;
constexpr float DEACTIVATION_THRESHOLD = 0.000015f;

// Scan timing (ms)
constexpr uint32_t POT_SCAN_INTERVAL     = 20;
constexpr uint32_t ENCODER_SCAN_INTERVAL = 1;
constexpr uint32_t MAIN_LOOP_INTERVAL    = 1;
constexpr uint32_t MUX_SETTLE_US         = 100;

// Connection
constexpr uint32_t COMMUNICATION_TIMEOUT = 5000;  // ms without any message
constexpr uint32_t UART_BAUDRATE         = 31250;

// Pots
constexpr uint16_t POT_THRESHOLD        = 1500;  // Raw move to wake an idle pot
constexpr uint16_t POT_CHANGE_THRESHOLD = 400;   // Raw move reported while active
constexpr float    POT_LOWER_TRIM       = 0.05f;
constexpr float    POT_UPPER_TRIM       = 0.0f;

// MIDI
constexpr uint8_t  CC_TIMBRE          = 74;
constexpr uint8_t  TIMBRE_CENTER      = 64;
constexpr uint16_t PITCH_BEND_CENTER  = 8192;
constexpr uint16_t PITCH_BEND_MAX     = 16383;
constexpr uint8_t  BASE_ROOT_NOTE     = 60;  // Middle C on key 0
constexpr int8_t   OCTAVE_LIMIT       = 3;

// MPE zone (lower zone, 0-indexed channels)
constexpr uint8_t ZONE_MANAGER = 0;
constexpr uint8_t ZONE_START   = 1;
constexpr uint8_t ZONE_END     = 15;
constexpr uint8_t MPE_MANAGER_PITCH_BEND_RANGE = 2;
constexpr uint8_t MPE_MEMBER_PITCH_BEND_RANGE  = 48;

// Release velocity
constexpr uint8_t PRESSURE_HISTORY_SIZE      = 8;
constexpr float   RELEASE_VELOCITY_THRESHOLD = 0.01f;  // Pressure units per second
constexpr float   RELEASE_VELOCITY_SCALE     = 2.0f;

// Default pot -> CC assignments (standalone mode)
constexpr uint8_t DEFAULT_CC_ASSIGNMENTS[NUM_POTS] = {
    74,  // Timbre
    71,  // Filter resonance
    73,  // Attack
    75,  // Decay
    76,  // Sustain
    72,  // Release
    7,   // Volume
    1,   // Modulation
    20, 21, 22, 23, 24, 25,
};

/**
 * One band of the resistance -> pressure envelope.
 * Resistance in [r_low, r_high] maps to [out_low, out_high]
 * through a power curve (1.0 = linear).
 */
struct EnvelopeBand
{
    float r_high;
    float r_low;
    float out_low;
    float out_high;
    float curve;
};

constexpr uint8_t NUM_ENVELOPE_BANDS = 4;

// Light -> Mid -> Heavy -> Max, ordered by decreasing resistance
constexpr EnvelopeBand PRESSURE_ENVELOPE[NUM_ENVELOPE_BANDS] = {
    {25000.0f, 12000.0f, 0.00f, 0.15f, 1.6f},
    {12000.0f, 5000.0f, 0.15f, 0.60f, 1.0f},
    {5000.0f, 2000.0f, 0.60f, 0.90f, 0.8f},
    {2000.0f, 1100.0f, 0.90f, 1.00f, 0.6f},
};

/**
 * Greeting chime played after MPE zone setup
 */
constexpr uint8_t  GREETING_LENGTH      = 4;
constexpr uint8_t  GREETING_NOTES[GREETING_LENGTH]      = {60, 64, 67, 72};
constexpr float    GREETING_VELOCITIES[GREETING_LENGTH] = {0.6f, 0.7f, 0.8f, 0.9f};
constexpr uint32_t GREETING_DURATIONS[GREETING_LENGTH]  = {200, 200, 200, 400};
constexpr uint32_t GREETING_GAP        = 50;
constexpr float    GREETING_PRESSURE   = 0.75f;

/**
 * Outcome of operations that can fail
 */
enum class Result : uint8_t
{
    OK,
    MALFORMED,       // Bad input (config text, undecodable line)
    HARDWARE_FAULT,  // Peripheral missing or not initialized
};

/**
 * Runtime calibration, loaded once at startup
 */
struct Settings
{
    float activation_threshold;
    float tracking_threshold;
    float deactivation_threshold;

    uint8_t base_root_note;
    float   pressure_curve;   // 0.0 = linear, 1.0 = extreme middle expansion
    float   bend_dead_zone;   // 0.0 = none, position units around centre

    uint8_t zone_start;
    uint8_t zone_end;
    uint8_t manager_pitch_bend_range;
    uint8_t member_pitch_bend_range;

    uint32_t pot_scan_interval;
    uint32_t encoder_scan_interval;
    uint32_t connection_timeout;

    bool play_greeting;

    void InitDefaults()
    {
        activation_threshold   = ACTIVATION_THRESHOLD;
        tracking_threshold     = TRACKING_THRESHOLD;
        deactivation_threshold = DEACTIVATION_THRESHOLD;

        base_root_note = BASE_ROOT_NOTE;
        pressure_curve = 0.0f;
        bend_dead_zone = 0.0f;

        zone_start               = ZONE_START;
        zone_end                 = ZONE_END;
        manager_pitch_bend_range = MPE_MANAGER_PITCH_BEND_RANGE;
        member_pitch_bend_range  = MPE_MEMBER_PITCH_BEND_RANGE;

        pot_scan_interval     = POT_SCAN_INTERVAL;
        encoder_scan_interval = ENCODER_SCAN_INTERVAL;
        connection_timeout    = COMMUNICATION_TIMEOUT;

        play_greeting = true;
    }
};

} // namespace Config

#endif // EXPRESSDAISY_CONFIG_H
