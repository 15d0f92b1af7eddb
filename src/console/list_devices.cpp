#include <iostream>
#include "audio/audio_input_device.hpp"

int main() {
    auto devices = audio::AudioInputFactory::enumerate_devices();
    if (devices.size() <= 1) {
        std::cout << "No active input devices found." << std::endl;
    }
    std::cout << "Input devices:" << std::endl;
    for (const auto& dev : devices) {
        std::cout << dev.id << ": " << dev.name << (dev.is_default ? "  [default]" : "")
                  << "\n  Driver: " << dev.driver
                  << ", " << dev.default_sample_rate << " Hz, " << dev.max_channels << " ch\n";
    }
    return 0;
}
