#pragma once
#ifndef EXPRESSDAISY_SCHEDULER_H
#define EXPRESSDAISY_SCHEDULER_H

#include <stdint.h>
#include "config.h"
#include "log.h"

/**
 * ExpressDaisy Scan Scheduler
 *
 * Cooperative timing for the main loop. Keys are scanned every tick;
 * pots and the encoder only once their own interval has elapsed on the
 * monotonic millisecond clock.
 */

namespace Scheduler
{

constexpr uint32_t TIME_JUMP_THRESHOLD = 1000;  // ms between ticks

class Engine
{
  public:
    void Init(const Config::Settings& settings, uint32_t now)
    {
        pot_interval_      = settings.pot_scan_interval;
        encoder_interval_  = settings.encoder_scan_interval;
        now_               = now;
        last_pot_scan_     = now;
        last_encoder_scan_ = now;
        ticks_             = 0;
        time_jumps_        = 0;
    }

    /**
     * Start a tick at the given clock reading
     */
    void Advance(uint32_t now)
    {
        uint32_t elapsed = now - now_;
        if(ticks_ > 0 && elapsed > TIME_JUMP_THRESHOLD)
        {
            time_jumps_++;
            Log::Warn(Log::TAG_SCHED, "Time jump: %lu ms since last tick",
                      static_cast<unsigned long>(elapsed));
        }
        now_ = now;
        ticks_++;
    }

    bool ShouldScanPots() const { return now_ - last_pot_scan_ >= pot_interval_; }
    void MarkPotScan() { last_pot_scan_ = now_; }

    bool ShouldScanEncoder() const
    {
        return now_ - last_encoder_scan_ >= encoder_interval_;
    }
    void MarkEncoderScan() { last_encoder_scan_ = now_; }

    uint32_t Now() const { return now_; }
    uint32_t Ticks() const { return ticks_; }
    uint32_t TimeJumps() const { return time_jumps_; }

  private:
    uint32_t pot_interval_;
    uint32_t encoder_interval_;
    uint32_t now_;
    uint32_t last_pot_scan_;
    uint32_t last_encoder_scan_;
    uint32_t ticks_;
    uint32_t time_jumps_;
};

} // namespace Scheduler

#endif // EXPRESSDAISY_SCHEDULER_H
