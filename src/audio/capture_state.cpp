#include "audio/capture_state.hpp"
#include "audio/dsp.hpp"

#include <algorithm>

namespace audio {

void CaptureState::process_samples(const float* samples, size_t count, int sample_rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    sample_rate_ = sample_rate;
    if (!samples || count == 0) return;

    const float rms = calculate_rms(samples, count);
    // Smoothed for display
    volume_level_ = volume_level_ * 0.7f + rms * 0.3f;
    // Peak with slow decay
    peak_level_ = std::max(peak_level_ * 0.95f, calculate_peak(samples, count));

    waveform_rms_sum_ += rms;
    if (++waveform_counter_ >= kWaveformDecimation) {
        const auto now = std::chrono::steady_clock::now();
        if (last_waveform_time_) {
            waveform_interval_s_ = std::chrono::duration<float>(now - *last_waveform_time_).count();
        }
        last_waveform_time_ = now;

        waveform_.push_back(waveform_rms_sum_ / static_cast<float>(kWaveformDecimation));
        if (waveform_.size() > kWaveformHistory) {
            waveform_.erase(waveform_.begin());
        }
        waveform_counter_ = 0;
        waveform_rms_sum_ = 0.0f;
    }

    samples_.insert(samples_.end(), samples, samples + count);
    duration_ = sample_rate > 0 ? static_cast<double>(samples_.size()) / sample_rate : 0.0;
}

float CaptureState::volume_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return volume_level_;
}

float CaptureState::peak_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_level_;
}

std::vector<float> CaptureState::waveform() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waveform_;
}

CaptureStatus CaptureState::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

double CaptureState::duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return duration_;
}

int CaptureState::sample_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_rate_;
}

std::optional<std::string> CaptureState::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::vector<float> CaptureState::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

std::vector<float> CaptureState::samples_from(size_t offset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offset >= samples_.size()) return {};
    return std::vector<float>(samples_.begin() + static_cast<std::ptrdiff_t>(offset), samples_.end());
}

size_t CaptureState::sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

float CaptureState::waveform_scroll_phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_waveform_time_ || waveform_interval_s_ <= 0.0f) return 0.0f;
    const float elapsed = std::chrono::duration<float>(std::chrono::steady_clock::now() - *last_waveform_time_).count();
    return std::min(elapsed / waveform_interval_s_, 1.0f);
}

void CaptureState::set_status(CaptureStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

void CaptureState::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
    status_ = CaptureStatus::Error;
}

void CaptureState::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    waveform_.clear();
    duration_ = 0.0;
    volume_level_ = 0.0f;
    peak_level_ = 0.0f;
    error_.reset();
    status_ = CaptureStatus::Idle;
    waveform_counter_ = 0;
    waveform_rms_sum_ = 0.0f;
    last_waveform_time_.reset();
}

} // namespace audio
