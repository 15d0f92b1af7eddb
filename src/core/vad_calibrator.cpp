#include "core/vad_calibrator.hpp"
#include "core/logging.hpp"
#include "audio/dsp.hpp"

#include <algorithm>
#include <cstdio>

namespace core {

VadCalibrator::VadCalibrator() : VadCalibrator(Config{}) {}

VadCalibrator::VadCalibrator(const Config& config)
    : config_(config)
    , threshold_(config.min_threshold) {
    if (config_.chunk_samples == 0) config_.chunk_samples = 1;
    accumulated_.reserve(config_.target_samples);
    pending_.reserve(config_.chunk_samples);
}

size_t VadCalibrator::feed(const float* samples, size_t count) {
    if (calibrated_) return 0;

    size_t offset = 0;
    while (offset < count) {
        const size_t want = config_.chunk_samples - pending_.size();
        const size_t take = std::min(want, count - offset);
        pending_.insert(pending_.end(), samples + offset, samples + offset + take);
        offset += take;

        if (pending_.size() < config_.chunk_samples) {
            break;  // wait for the rest of the chunk
        }

        const float chunk_rms = audio::calculate_rms(pending_);
        if (chunk_rms < config_.quiet_threshold) {
            accumulated_.insert(accumulated_.end(), pending_.begin(), pending_.end());
            pending_.clear();
            if (accumulated_.size() >= config_.target_samples) {
                complete();
                return offset;
            }
        } else {
            if (!accumulated_.empty() && log_enabled(LogLevel::Debug)) {
                char buf[96];
                std::snprintf(buf, sizeof(buf), "[calibration] reset, loud audio detected (RMS %.4f)", chunk_rms);
                log_debug(buf);
            }
            accumulated_.clear();
            pending_.clear();
        }
    }
    return count;
}

float VadCalibrator::progress() const {
    if (calibrated_) return 1.0f;
    if (config_.target_samples == 0) return 0.0f;
    const float p = static_cast<float>(accumulated_.size()) / static_cast<float>(config_.target_samples);
    return std::min(p, 1.0f);
}

void VadCalibrator::force_threshold(float threshold) {
    threshold_ = std::max(config_.min_threshold, threshold);
    calibrated_ = true;
    accumulated_.clear();
    pending_.clear();
}

void VadCalibrator::reset() {
    calibrated_ = false;
    threshold_ = config_.min_threshold;
    ambient_rms_ = 0.0f;
    accumulated_.clear();
    pending_.clear();
}

void VadCalibrator::complete() {
    ambient_rms_ = audio::calculate_rms(accumulated_);
    threshold_ = std::max(config_.min_threshold, ambient_rms_ * config_.multiplier);
    calibrated_ = true;
    accumulated_.clear();
    accumulated_.shrink_to_fit();

    char buf[96];
    std::snprintf(buf, sizeof(buf), "VAD calibrated: ambient RMS = %.4f, threshold = %.4f", ambient_rms_, threshold_);
    log_info(buf);
}

} // namespace core
