#pragma once
#include <atomic>
#include <cmath>
#include <functional>
#include <initializer_list>
#include <utility>
#include <vector>
#include "asr/inference_engine.hpp"

// Inference engine driven by a script: maps the audio it receives to segments
class MockInferenceEngine : public asr::InferenceEngine {
public:
    using Script = std::function<std::vector<asr::Segment>(const std::vector<float>&)>;

    explicit MockInferenceEngine(Script script) : script_(std::move(script)) {}

    std::vector<asr::Segment> transcribe(const std::vector<float>& samples) override {
        calls++;
        last_size = samples.size();
        if (fail_next.exchange(false)) {
            throw asr::InferenceError("mock inference failure");
        }
        return script_(samples);
    }

    std::atomic<int> calls{0};
    std::atomic<size_t> last_size{0};
    std::atomic<bool> fail_next{false};

private:
    Script script_;
};

inline std::vector<asr::Segment> segments(std::initializer_list<const char*> texts) {
    std::vector<asr::Segment> out;
    double t = 0.0;
    for (const char* s : texts) {
        out.push_back({t, t + 1.0, s});
        t += 1.0;
    }
    return out;
}

// 440 Hz sine at 16 kHz, RMS = amplitude / sqrt(2)
inline std::vector<float> tone(size_t n, float amplitude = 0.3f) {
    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 440.0 * i / 16000.0));
    }
    return out;
}

inline std::vector<float> silence(size_t n) {
    return std::vector<float>(n, 0.0f);
}
