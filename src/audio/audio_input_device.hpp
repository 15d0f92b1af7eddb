#pragma once

#include "audio/capture_state.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace audio {

/**
 * @brief Metadata about an audio input device
 */
struct AudioDeviceInfo {
    std::string id;              // Device identifier ("default", PortAudio index, "synthetic")
    std::string name;            // Human-readable name ("USB Microphone")
    std::string driver;          // Host API name ("ALSA", "PulseAudio", "Synthetic")
    int default_sample_rate;     // Native sample rate (48000, 44100, etc.)
    int max_channels;            // Maximum supported input channels
    bool is_default;             // Is this the system default device?

    AudioDeviceInfo()
        : default_sample_rate(48000)
        , max_channels(1)
        , is_default(false) {}
};

/**
 * @brief Configuration for audio input capture
 */
struct AudioInputConfig {
    std::string device_id;       // Device to use (empty = system default)
    int sample_rate = 0;         // Requested sample rate (0 = device native)
    int buffer_size_ms = 20;     // Callback period in milliseconds (affects latency)

    // For synthetic device only
    std::vector<float> synthetic_samples;  // Mono audio played back as "microphone" input
    int synthetic_sample_rate = 16000;     // Rate of synthetic_samples
    bool synthetic_loop = false;           // Loop playback?
    bool synthetic_realtime = true;        // Pace chunks in real time (false = as fast as possible)
};

/**
 * @brief Callback for audio data
 *
 * Called from the audio thread when new samples are available. Must not block.
 *
 * @param samples Mono float32 samples in [-1, 1]
 * @param sample_count Number of samples
 * @param sample_rate Actual sample rate of the data
 */
using AudioCallback = std::function<void(
    const float* samples,
    size_t sample_count,
    int sample_rate
)>;

/**
 * @brief Error callback for device issues after start()
 *
 * @param error_message Human-readable error description
 * @param is_fatal If true, device has stopped and needs restart
 */
using ErrorCallback = std::function<void(const std::string& error_message, bool is_fatal)>;

/// Device could not be opened or started
class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Abstract base class for audio input devices
 *
 * Implementations:
 * - AudioInputDevice_PortAudio (system microphones)
 * - AudioInputDevice_Synthetic (in-memory playback)
 */
class IAudioInputDevice {
public:
    virtual ~IAudioInputDevice() = default;

    /**
     * @brief Initialize the device with configuration
     * @param config Device configuration
     * @param audio_callback Called when audio data is ready
     * @param error_callback Called on runtime errors
     * @throws CaptureError if the device cannot be opened
     */
    virtual void initialize(
        const AudioInputConfig& config,
        AudioCallback audio_callback,
        ErrorCallback error_callback
    ) = 0;

    /**
     * @brief Start capturing audio
     * @throws CaptureError if the stream cannot be started
     */
    virtual void start() = 0;

    /**
     * @brief Stop capturing audio
     * @return All samples captured since start()
     */
    virtual std::vector<float> stop() = 0;

    /**
     * @brief Check if device is currently capturing
     */
    virtual bool is_capturing() const = 0;

    /**
     * @brief Get device information
     */
    virtual AudioDeviceInfo get_device_info() const = 0;

    /**
     * @brief Get actual configuration being used (may differ from requested)
     */
    virtual AudioInputConfig get_actual_config() const = 0;

    /**
     * @brief Running aggregate (levels, waveform, samples), safe to read from any thread
     */
    std::shared_ptr<CaptureState> shared_state() const { return state_; }

protected:
    std::shared_ptr<CaptureState> state_ = std::make_shared<CaptureState>();
};

/**
 * @brief Factory for creating audio input devices
 */
class AudioInputFactory {
public:
    /**
     * @brief Enumerate all available audio input devices
     * @return List of available devices (always includes synthetic)
     */
    static std::vector<AudioDeviceInfo> enumerate_devices();

    /**
     * @brief Create an audio input device
     * @param device_id Device ID from AudioDeviceInfo, or empty for default
     *                  Special values:
     *                  - "" or "default" = system default microphone
     *                  - "synthetic" = in-memory playback device
     * @return Device instance
     */
    static std::unique_ptr<IAudioInputDevice> create_device(const std::string& device_id = "");

    /**
     * @brief Get the system default device ID
     */
    static std::string get_default_device_id();

    /**
     * @brief Check if a device ID is valid
     */
    static bool is_device_available(const std::string& device_id);
};

} // namespace audio
