#include "audio_input_device_synthetic.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

namespace audio {

AudioInputDevice_Synthetic::AudioInputDevice_Synthetic() = default;

AudioInputDevice_Synthetic::~AudioInputDevice_Synthetic() {
    stop();
}

void AudioInputDevice_Synthetic::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    if (config.synthetic_sample_rate <= 0) {
        throw CaptureError("Synthetic device requires a positive synthetic_sample_rate");
    }
    if (config.buffer_size_ms <= 0) {
        throw CaptureError("Synthetic device requires a positive buffer_size_ms");
    }

    config_ = config;
    config_.device_id = "synthetic";
    config_.sample_rate = config.synthetic_sample_rate;
    audio_callback_ = std::move(audio_callback);
    error_callback_ = std::move(error_callback);
    initialized_ = true;

    core::log_debug("[synthetic] initialized with " + std::to_string(config_.synthetic_samples.size()) +
                    " samples @ " + std::to_string(config_.synthetic_sample_rate) + " Hz");
}

void AudioInputDevice_Synthetic::start() {
    if (!initialized_) {
        throw CaptureError("Synthetic device not initialized");
    }
    if (is_capturing_.load()) {
        return;  // Already capturing
    }

    // Previous playback ran to the end on its own
    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }

    state_->reset();
    state_->set_status(CaptureStatus::Capturing);

    should_stop_.store(false);
    finished_.store(false);
    is_capturing_.store(true);

    capture_thread_ = std::make_unique<std::thread>(
        &AudioInputDevice_Synthetic::capture_thread_func, this
    );
}

std::vector<float> AudioInputDevice_Synthetic::stop() {
    should_stop_.store(true);

    if (capture_thread_ && capture_thread_->joinable()) {
        capture_thread_->join();
    }
    capture_thread_.reset();
    is_capturing_.store(false);

    if (state_->status() == CaptureStatus::Capturing) {
        state_->set_status(CaptureStatus::Idle);
    }
    return state_->samples();
}

void AudioInputDevice_Synthetic::capture_thread_func() {
    const auto& source = config_.synthetic_samples;
    const int rate = config_.synthetic_sample_rate;
    const size_t chunk = std::max<size_t>(1, static_cast<size_t>(rate) * config_.buffer_size_ms / 1000);
    const auto chunk_duration = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(static_cast<double>(chunk) / rate));

    auto next_callback_time = std::chrono::steady_clock::now();
    size_t pos = 0;

    while (!should_stop_.load()) {
        if (pos >= source.size()) {
            if (config_.synthetic_loop && !source.empty()) {
                pos = 0;
                continue;
            }
            finished_.store(true);
            break;
        }

        const size_t n = std::min(chunk, source.size() - pos);
        const float* data = source.data() + pos;
        pos += n;

        state_->process_samples(data, n, rate);
        if (audio_callback_) {
            audio_callback_(data, n, rate);
        }

        if (config_.synthetic_realtime) {
            next_callback_time += chunk_duration;
            std::this_thread::sleep_until(next_callback_time);
        }
    }

    is_capturing_.store(false);
}

AudioDeviceInfo AudioInputDevice_Synthetic::get_device_info() const {
    AudioDeviceInfo info;
    info.id = "synthetic";
    info.name = "Synthetic Device (Buffer Playback)";
    info.driver = "Synthetic";
    info.default_sample_rate = config_.synthetic_sample_rate;
    info.max_channels = 1;
    info.is_default = false;
    return info;
}

} // namespace audio
