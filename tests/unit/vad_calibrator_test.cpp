#include <cassert>
#include <cmath>
#include <vector>
#include "core/vad_calibrator.hpp"

static std::vector<float> constant(size_t n, float v) { return std::vector<float>(n, v); }

int main() {
    // Quiet room: 30 chunks of 0.01 RMS -> threshold floors at 0.03
    {
        core::VadCalibrator cal;
        auto quiet = constant(48000, 0.01f);
        size_t used = cal.feed(quiet.data(), quiet.size());
        assert(used == quiet.size());
        assert(cal.is_calibrated());
        assert(std::fabs(cal.ambient_rms() - 0.01f) < 1e-4f);
        assert(std::fabs(cal.threshold() - 0.03f) < 1e-4f);
        assert(cal.progress() == 1.0f);
        assert(cal.feed(quiet.data(), quiet.size()) == 0);
    }

    // Silent room: threshold never drops below the minimum
    {
        core::VadCalibrator cal;
        auto zeros = constant(48000, 0.0f);
        cal.feed(zeros.data(), zeros.size());
        assert(cal.is_calibrated());
        assert(cal.threshold() == 0.02f);
    }

    // Partial chunks are staged across calls
    {
        core::VadCalibrator cal;
        auto small = constant(700, 0.0f);
        size_t fed = 0;
        while (!cal.is_calibrated()) {
            size_t used = cal.feed(small.data(), small.size());
            fed += used;
            assert(fed <= 48000 + 700);
        }
        assert(fed == 48000);  // 69 full calls (48300 samples) would overshoot; last call stops at the boundary
    }

    // Completion mid-call returns the index of the first unconsumed sample
    {
        core::VadCalibrator cal;
        auto audio = constant(50000, 0.0f);
        size_t used = cal.feed(audio.data(), audio.size());
        assert(cal.is_calibrated());
        assert(used == 48000);
    }

    // A loud chunk discards the run; a partial loud tail does not count yet
    {
        core::VadCalibrator cal;
        auto quiet = constant(24000, 0.0f);
        cal.feed(quiet.data(), quiet.size());
        assert(std::fabs(cal.progress() - 0.5f) < 1e-6f);

        auto loud = constant(1600, 0.5f);
        cal.feed(loud.data(), loud.size());
        assert(cal.progress() == 0.0f);
        assert(!cal.is_calibrated());

        auto rest = constant(48000, 0.0f);
        cal.feed(rest.data(), rest.size());
        assert(cal.is_calibrated());
    }

    // Forced threshold is clamped to the minimum; reset returns to collecting
    {
        core::VadCalibrator cal;
        cal.force_threshold(0.001f);
        assert(cal.is_calibrated());
        assert(cal.threshold() == 0.02f);
        cal.force_threshold(0.1f);
        assert(cal.threshold() == 0.1f);

        cal.reset();
        assert(!cal.is_calibrated());
        assert(cal.progress() == 0.0f);
        assert(cal.threshold() == 0.02f);
    }

    // Custom configuration
    {
        core::VadCalibrator::Config cfg;
        cfg.chunk_samples = 100;
        cfg.target_samples = 1000;
        cfg.multiplier = 2.0f;
        cfg.min_threshold = 0.01f;
        core::VadCalibrator cal(cfg);
        auto quiet = constant(1000, 0.03f);
        cal.feed(quiet.data(), quiet.size());
        assert(cal.is_calibrated());
        assert(std::fabs(cal.threshold() - 0.06f) < 1e-4f);
    }
    return 0;
}
