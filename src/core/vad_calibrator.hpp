#pragma once

#include <cstddef>
#include <vector>

namespace core {

/**
 * @brief Measures the room's ambient noise before any audio is treated as speech
 *
 * Audio is examined in fixed chunks. Only a contiguous run of quiet chunks counts:
 * one loud chunk throws away everything collected so far. Once the run reaches the
 * target duration the speech threshold is derived from the ambient RMS and fixed
 * until reset().
 */
class VadCalibrator {
public:
    struct Config {
        size_t chunk_samples = 1600;      ///< 100 ms at 16 kHz
        float quiet_threshold = 0.04f;    ///< Fixed RMS limit for a "quiet" chunk
        size_t target_samples = 3 * 16000; ///< Quiet audio required (3 s)
        float min_threshold = 0.02f;      ///< Floor for the derived threshold
        float multiplier = 3.0f;          ///< Threshold = ambient RMS * multiplier
    };

    VadCalibrator();
    explicit VadCalibrator(const Config& config);

    /**
     * @brief Feed audio while collecting
     * @return Number of samples consumed. When calibration completes inside this
     *         call, samples from the returned index onward were not consumed and
     *         belong to the transcription buffer. Returns 0 once calibrated.
     */
    size_t feed(const float* samples, size_t count);

    bool is_calibrated() const { return calibrated_; }
    float threshold() const { return threshold_; }
    float ambient_rms() const { return ambient_rms_; }

    /// Fraction of the quiet run collected so far, 1.0 once calibrated
    float progress() const;

    /// Skip measurement and use a known threshold (clamped to min_threshold)
    void force_threshold(float threshold);

    /// Back to collecting with the default threshold
    void reset();

    const Config& config() const { return config_; }

private:
    void complete();

    Config config_;
    bool calibrated_ = false;
    float threshold_;
    float ambient_rms_ = 0.0f;
    std::vector<float> accumulated_;  // contiguous quiet run
    std::vector<float> pending_;      // partial chunk carried across calls
};

} // namespace core
