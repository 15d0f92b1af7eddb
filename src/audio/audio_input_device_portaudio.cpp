#include "audio_input_device_portaudio.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>

namespace audio {

namespace {

void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw CaptureError(std::string(msg) + " (" + std::to_string(static_cast<int>(e)) + "): " +
                           Pa_GetErrorText(e));
    }
}

// Pa_Initialize/Pa_Terminate are reference counted, so every user holds its own session.
class PaSession {
public:
    PaSession() { pa_check(Pa_Initialize(), "Pa_Initialize"); }
    ~PaSession() { Pa_Terminate(); }
    PaSession(const PaSession&) = delete;
    PaSession& operator=(const PaSession&) = delete;
};

AudioDeviceInfo to_device_info(PaDeviceIndex index, const PaDeviceInfo* info) {
    AudioDeviceInfo out;
    out.id = std::to_string(index);
    out.name = info->name ? info->name : "Unknown";
    const PaHostApiInfo* host = Pa_GetHostApiInfo(info->hostApi);
    out.driver = host && host->name ? host->name : "PortAudio";
    out.default_sample_rate = static_cast<int>(info->defaultSampleRate);
    out.max_channels = info->maxInputChannels;
    out.is_default = (index == Pa_GetDefaultInputDevice());
    return out;
}

PaDeviceIndex resolve_device(const std::string& device_id) {
    if (device_id.empty() || device_id == "default") {
        PaDeviceIndex index = Pa_GetDefaultInputDevice();
        if (index == paNoDevice) {
            throw CaptureError("No default input device");
        }
        return index;
    }

    char* end = nullptr;
    long parsed = std::strtol(device_id.c_str(), &end, 10);
    if (end == device_id.c_str() || *end != '\0' || parsed < 0 || parsed >= Pa_GetDeviceCount()) {
        throw CaptureError("Unknown input device: " + device_id);
    }
    PaDeviceIndex index = static_cast<PaDeviceIndex>(parsed);
    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    if (!info || info->maxInputChannels < 1) {
        throw CaptureError("Device " + device_id + " has no input channels");
    }
    return index;
}

} // anonymous namespace

AudioInputDevice_PortAudio::AudioInputDevice_PortAudio() = default;

AudioInputDevice_PortAudio::~AudioInputDevice_PortAudio() {
    stop();
    close_stream();
    if (pa_initialized_) {
        Pa_Terminate();
    }
}

std::vector<AudioDeviceInfo> AudioInputDevice_PortAudio::enumerate_portaudio_devices() {
    PaSession session;
    std::vector<AudioDeviceInfo> devices;

    const PaDeviceIndex count = Pa_GetDeviceCount();
    if (count < 0) {
        pa_check(count, "Pa_GetDeviceCount");
    }
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels < 1) continue;
        devices.push_back(to_device_info(i, info));
    }
    return devices;
}

void AudioInputDevice_PortAudio::initialize(
    const AudioInputConfig& config,
    AudioCallback audio_callback,
    ErrorCallback error_callback
) {
    close_stream();
    if (!pa_initialized_) {
        pa_check(Pa_Initialize(), "Pa_Initialize");
        pa_initialized_ = true;
    }

    config_ = config;
    audio_callback_ = std::move(audio_callback);
    error_callback_ = std::move(error_callback);

    const PaDeviceIndex index = resolve_device(config.device_id);
    const PaDeviceInfo* info = Pa_GetDeviceInfo(index);
    device_info_ = to_device_info(index, info);

    const double rate = config.sample_rate > 0 ? config.sample_rate : info->defaultSampleRate;
    const unsigned long frames = static_cast<unsigned long>(
        std::max(1.0, rate * std::max(1, config.buffer_size_ms) / 1000.0));

    PaStreamParameters in_params{};
    in_params.device = index;
    in_params.sampleFormat = paFloat32;
    in_params.suggestedLatency = info->defaultLowInputLatency;
    in_params.hostApiSpecificStreamInfo = nullptr;

    // Prefer mono; fall back to the device's native layout and downmix.
    channels_ = 1;
    in_params.channelCount = channels_;
    if (Pa_IsFormatSupported(&in_params, nullptr, rate) != paFormatIsSupported) {
        channels_ = std::min(info->maxInputChannels, 2);
        in_params.channelCount = channels_;
    }

    pa_check(Pa_OpenStream(&stream_, &in_params, nullptr, rate, frames, paClipOff,
                           &AudioInputDevice_PortAudio::stream_callback, this),
             "Pa_OpenStream");
    pa_check(Pa_SetStreamFinishedCallback(stream_, &AudioInputDevice_PortAudio::stream_finished),
             "Pa_SetStreamFinishedCallback");

    mono_.assign(frames, 0.0f);

    actual_config_ = config;
    actual_config_.device_id = device_info_.id;
    actual_config_.sample_rate = static_cast<int>(rate);

    core::log_info("[portaudio] opened '" + device_info_.name + "' (" + device_info_.driver + ") @ " +
                   std::to_string(actual_config_.sample_rate) + " Hz, " + std::to_string(channels_) + " ch");
}

void AudioInputDevice_PortAudio::start() {
    if (!stream_) {
        throw CaptureError("PortAudio device not initialized");
    }
    if (is_capturing_.load()) {
        return;  // Already capturing
    }

    state_->reset();
    stopping_.store(false);
    try {
        pa_check(Pa_StartStream(stream_), "Pa_StartStream");
    } catch (const CaptureError& e) {
        state_->set_error(e.what());
        throw;
    }
    state_->set_status(CaptureStatus::Capturing);
    is_capturing_.store(true);
}

std::vector<float> AudioInputDevice_PortAudio::stop() {
    if (is_capturing_.load() && stream_) {
        stopping_.store(true);
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            core::log_warn(std::string("[portaudio] Pa_StopStream: ") + Pa_GetErrorText(err));
        }
        is_capturing_.store(false);
        if (state_->status() == CaptureStatus::Capturing) {
            state_->set_status(CaptureStatus::Idle);
        }
    }
    return state_->samples();
}

void AudioInputDevice_PortAudio::close_stream() {
    if (!stream_) return;
    PaError err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        core::log_warn(std::string("[portaudio] Pa_CloseStream: ") + Pa_GetErrorText(err));
    }
    stream_ = nullptr;
}

int AudioInputDevice_PortAudio::stream_callback(const void* input, void* /*output*/, unsigned long frames,
                                                const PaStreamCallbackTimeInfo* /*time_info*/,
                                                PaStreamCallbackFlags /*status_flags*/, void* user_data) {
    auto* self = static_cast<AudioInputDevice_PortAudio*>(user_data);
    if (input) {
        self->on_input(static_cast<const float*>(input), frames);
    }
    return self->stopping_.load() ? paComplete : paContinue;
}

void AudioInputDevice_PortAudio::stream_finished(void* user_data) {
    auto* self = static_cast<AudioInputDevice_PortAudio*>(user_data);
    if (self->stopping_.load()) return;

    // Stream ended on its own (device unplugged, host API failure)
    self->is_capturing_.store(false);
    const std::string msg = "Input stream for '" + self->device_info_.name + "' stopped unexpectedly";
    self->state_->set_error(msg);
    if (self->error_callback_) {
        self->error_callback_(msg, true);
    }
}

void AudioInputDevice_PortAudio::on_input(const float* input, unsigned long frames) {
    const float* mono = input;
    if (channels_ > 1) {
        if (mono_.size() < frames) mono_.resize(frames);
        for (unsigned long i = 0; i < frames; ++i) {
            float sum = 0.0f;
            for (int c = 0; c < channels_; ++c) {
                sum += input[i * channels_ + c];
            }
            mono_[i] = sum / channels_;
        }
        mono = mono_.data();
    }

    state_->process_samples(mono, frames, actual_config_.sample_rate);
    if (audio_callback_) {
        audio_callback_(mono, frames, actual_config_.sample_rate);
    }
}

} // namespace audio
