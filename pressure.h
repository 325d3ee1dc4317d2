#pragma once
#ifndef EXPRESSDAISY_PRESSURE_H
#define EXPRESSDAISY_PRESSURE_H

#include <stdint.h>
#include <cmath>
#include "daisysp.h"
#include "config.h"

/**
 * ExpressDaisy Velostat Pressure Model
 *
 * Raw ADC sample -> divider resistance -> normalized pressure (0.0-1.0)
 * through a 4-band envelope, and a left/right pair -> position/pressure.
 *
 * Velostat is strongly non-linear: each band (light, mid, heavy, max)
 * gets its own power curve and output sub-range so the expressive
 * mid-range is not under-resolved.
 */

namespace Pressure
{

/**
 * Convert a raw ADC sample to sensor resistance (ohms)
 * Returns INFINITY once the divider reaches rest voltage (untouched).
 */
inline float AdcToResistance(uint16_t adc_value)
{
    float voltage = (static_cast<float>(adc_value) / Config::ADC_MAX)
                    * Config::ADC_REF_VOLTAGE;
    if(voltage >= Config::REST_VOLTAGE)
    {
        return INFINITY;
    }
    return Config::ADC_RESISTANCE_SCALE * voltage
           / (Config::ADC_REF_VOLTAGE - voltage);
}

/**
 * Map resistance to normalized pressure through the envelope bands
 *
 * Monotonically non-increasing in resistance; saturates to 0.0 at or
 * above MAX_VK_RESISTANCE and to 1.0 at or below MIN_VK_RESISTANCE.
 */
inline float NormalizeResistance(float resistance)
{
    if(!(resistance < Config::MAX_VK_RESISTANCE))
    {
        return 0.0f;  // Also catches INFINITY and NaN
    }
    if(resistance <= Config::MIN_VK_RESISTANCE)
    {
        return 1.0f;
    }

    for(uint8_t i = 0; i < Config::NUM_ENVELOPE_BANDS; i++)
    {
        const Config::EnvelopeBand& band = Config::PRESSURE_ENVELOPE[i];
        if(resistance >= band.r_low)
        {
            float local = (band.r_high - resistance) / (band.r_high - band.r_low);
            local       = daisysp::fclamp(local, 0.0f, 1.0f);
            float shaped = powf(local, band.curve);
            return daisysp::fclamp(band.out_low + shaped * (band.out_high - band.out_low),
                          0.0f,
                          1.0f);
        }
    }

    return 1.0f;
}

/**
 * Raw ADC sample straight to normalized pressure
 */
inline float NormalizeSample(uint16_t adc_value)
{
    return NormalizeResistance(AdcToResistance(adc_value));
}

/**
 * Relative position from left/right pressures
 * (right - left) / (right + left), 0 when both are 0.
 * Only the skew matters, not the absolute pressure.
 */
inline float CalculatePosition(float left_norm, float right_norm)
{
    float total = left_norm + right_norm;
    if(total <= 0.0f)
    {
        return 0.0f;
    }
    return daisysp::fclamp((right_norm - left_norm) / total, -1.0f, 1.0f);
}

/**
 * Combined pressure of the two pads
 */
inline float CalculatePressure(float left_norm, float right_norm)
{
    return daisysp::fmax(left_norm, right_norm);
}

} // namespace Pressure

#endif // EXPRESSDAISY_PRESSURE_H
