#include "audio_input_device.hpp"
#include "audio_input_device_portaudio.hpp"
#include "audio_input_device_synthetic.hpp"
#include "core/logging.hpp"

namespace audio {

std::vector<AudioDeviceInfo> AudioInputFactory::enumerate_devices() {
    std::vector<AudioDeviceInfo> devices;

    try {
        auto pa_devices = AudioInputDevice_PortAudio::enumerate_portaudio_devices();
        devices.insert(devices.end(), pa_devices.begin(), pa_devices.end());
    } catch (const CaptureError& e) {
        core::log_warn(std::string("[devices] enumeration failed: ") + e.what());
    }

    // Always add synthetic device
    AudioDeviceInfo synthetic;
    synthetic.id = "synthetic";
    synthetic.name = "Synthetic Device (Buffer Playback)";
    synthetic.driver = "Synthetic";
    synthetic.default_sample_rate = 16000;
    synthetic.max_channels = 1;
    synthetic.is_default = false;
    devices.push_back(synthetic);

    return devices;
}

std::unique_ptr<IAudioInputDevice> AudioInputFactory::create_device(const std::string& device_id) {
    if (device_id == "synthetic") {
        return std::make_unique<AudioInputDevice_Synthetic>();
    }
    return std::make_unique<AudioInputDevice_PortAudio>();
}

std::string AudioInputFactory::get_default_device_id() {
    for (const auto& dev : enumerate_devices()) {
        if (dev.is_default) {
            return dev.id;
        }
    }
    return "";
}

bool AudioInputFactory::is_device_available(const std::string& device_id) {
    if (device_id.empty() || device_id == "default") {
        return !get_default_device_id().empty();
    }
    for (const auto& dev : enumerate_devices()) {
        if (dev.id == device_id) {
            return true;
        }
    }
    return false;
}

} // namespace audio
