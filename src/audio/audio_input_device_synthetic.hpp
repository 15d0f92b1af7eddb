#pragma once

#include "audio_input_device.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace audio {

/**
 * @brief Synthetic audio device that plays back an in-memory buffer as microphone input
 *
 * Features:
 * - Delivers 20ms chunks (simulates microphone callback cadence)
 * - Real-time pacing, or as fast as possible for tests
 * - Can loop for continuous testing
 */
class AudioInputDevice_Synthetic : public IAudioInputDevice {
public:
    AudioInputDevice_Synthetic();
    ~AudioInputDevice_Synthetic() override;

    void initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    void start() override;
    std::vector<float> stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override;
    AudioInputConfig get_actual_config() const override { return config_; }

    /// True once a non-looping buffer has been fully delivered
    bool finished() const { return finished_.load(); }

private:
    void capture_thread_func();

    AudioInputConfig config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;
    bool initialized_ = false;

    // Threading
    std::unique_ptr<std::thread> capture_thread_;
    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> should_stop_{false};
    std::atomic<bool> finished_{false};
};

} // namespace audio
