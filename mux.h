#pragma once
#ifndef EXPRESSDAISY_MUX_H
#define EXPRESSDAISY_MUX_H

#include <stdint.h>
#include "daisy_seed.h"
#include "config.h"

/**
 * ExpressDaisy Analog Multiplexers (firmware only)
 *
 * CD74HC4067 16:1 muxes: four GPIO select lines pick the channel, the
 * common pin goes to one Seed ADC input. After every select change the
 * mux gets MUX_SETTLE_US before the reading is taken.
 *
 * The keyboard uses two levels: L1A/L1B feed ADC inputs directly, and
 * channel 0 of each is fed from the L2 mux, whose select lines are
 * shared between both L2 halves.
 */

namespace Mux
{

constexpr uint8_t NUM_SELECT = 4;
constexpr uint8_t CHANNELS   = 16;

/**
 * Four select outputs driven together
 */
class SelectLines
{
  public:
    void Init(const daisy::Pin (&pins)[NUM_SELECT])
    {
        for(uint8_t i = 0; i < NUM_SELECT; i++)
        {
            lines_[i].Init(pins[i], daisy::GPIO::Mode::OUTPUT);
            lines_[i].Write(false);
        }
    }

    /**
     * Drive the select lines and wait for the mux to settle
     */
    void Select(uint8_t channel)
    {
        channel &= CHANNELS - 1;
        for(uint8_t i = 0; i < NUM_SELECT; i++)
        {
            lines_[i].Write((channel >> i) & 1);
        }
        daisy::System::DelayUs(Config::MUX_SETTLE_US);
    }

  private:
    daisy::GPIO lines_[NUM_SELECT];
};

/**
 * One mux read through a Seed ADC input
 */
class Multiplexer
{
  public:
    /**
     * @param adc Started ADC handle
     * @param adc_index Index of this mux's common pin in the ADC config
     * @param select Select line pins S0..S3
     */
    void Init(daisy::AdcHandle* adc, uint8_t adc_index,
              const daisy::Pin (&select)[NUM_SELECT])
    {
        adc_       = adc;
        adc_index_ = adc_index;
        select_.Init(select);
    }

    uint16_t ReadChannel(uint8_t channel)
    {
        select_.Select(channel);
        return adc_->Get(adc_index_);
    }

  private:
    daisy::AdcHandle* adc_;
    uint8_t           adc_index_;
    SelectLines       select_;
};

} // namespace Mux

#endif // EXPRESSDAISY_MUX_H
