#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace audio {

enum class CaptureStatus {
    Idle,
    Capturing,
    Paused,
    Error
};

/**
 * @brief Thread-safe running aggregate of a capture session
 *
 * Written from the audio thread via process_samples(), read by the UI for level
 * meters and the scrolling waveform, and by the session owner for the raw samples.
 */
class CaptureState {
public:
    static constexpr size_t kWaveformHistory = 96;   ///< Values kept for display
    static constexpr uint32_t kWaveformDecimation = 4; ///< Callbacks averaged per waveform value

    CaptureState() = default;
    CaptureState(const CaptureState&) = delete;
    CaptureState& operator=(const CaptureState&) = delete;

    /// Update levels and waveform, append samples (mono) and recompute duration
    void process_samples(const float* samples, size_t count, int sample_rate);

    float volume_level() const;
    float peak_level() const;
    std::vector<float> waveform() const;
    CaptureStatus status() const;
    double duration() const;
    int sample_rate() const;
    std::optional<std::string> error() const;

    /// Copy of all captured samples
    std::vector<float> samples() const;
    /// Samples from index offset onward (incremental reads)
    std::vector<float> samples_from(size_t offset) const;
    size_t sample_count() const;

    /// Progress (0..1) toward the next waveform value, for smooth scrolling
    float waveform_scroll_phase() const;

    void set_status(CaptureStatus status);
    void set_error(const std::string& error);
    void reset();

private:
    mutable std::mutex mutex_;
    float volume_level_ = 0.0f;
    float peak_level_ = 0.0f;
    std::vector<float> waveform_;
    std::vector<float> samples_;
    double duration_ = 0.0;
    CaptureStatus status_ = CaptureStatus::Idle;
    std::optional<std::string> error_;
    int sample_rate_ = 16000;

    uint32_t waveform_counter_ = 0;
    float waveform_rms_sum_ = 0.0f;
    std::optional<std::chrono::steady_clock::time_point> last_waveform_time_;
    float waveform_interval_s_ = 0.08f;
};

} // namespace audio
