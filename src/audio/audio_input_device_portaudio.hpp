#pragma once

#include "audio_input_device.hpp"
#include <portaudio.h>
#include <atomic>
#include <vector>

namespace audio {

/**
 * @brief System microphone capture through PortAudio
 *
 * Opens a float32 callback stream on the selected input device. Multi-channel
 * devices are downmixed to mono before samples reach the callback.
 * Device ids are "default" (or empty) or a PortAudio device index.
 */
class AudioInputDevice_PortAudio : public IAudioInputDevice {
public:
    AudioInputDevice_PortAudio();
    ~AudioInputDevice_PortAudio() override;

    AudioInputDevice_PortAudio(const AudioInputDevice_PortAudio&) = delete;
    AudioInputDevice_PortAudio& operator=(const AudioInputDevice_PortAudio&) = delete;

    void initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) override;

    void start() override;
    std::vector<float> stop() override;
    bool is_capturing() const override { return is_capturing_.load(); }
    AudioDeviceInfo get_device_info() const override { return device_info_; }
    AudioInputConfig get_actual_config() const override { return actual_config_; }

    // Platform-specific: Enumerate PortAudio input devices
    static std::vector<AudioDeviceInfo> enumerate_portaudio_devices();

private:
    static int stream_callback(const void* input, void* output, unsigned long frames,
                               const PaStreamCallbackTimeInfo* time_info,
                               PaStreamCallbackFlags status_flags, void* user_data);
    static void stream_finished(void* user_data);

    void on_input(const float* input, unsigned long frames);
    void close_stream();

    AudioInputConfig config_;
    AudioInputConfig actual_config_;
    AudioCallback audio_callback_;
    ErrorCallback error_callback_;
    AudioDeviceInfo device_info_;

    PaStream* stream_ = nullptr;
    bool pa_initialized_ = false;
    int channels_ = 1;
    std::vector<float> mono_;

    std::atomic<bool> is_capturing_{false};
    std::atomic<bool> stopping_{false};
};

} // namespace audio
