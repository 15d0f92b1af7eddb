#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

constexpr uint32_t kWhisperSampleRate = 16000;

// Linear interpolation resampler. Equal rates (or a zero rate) return an exact copy.
// Output length is floor(in.size() * to_rate / from_rate); the last input sample is
// repeated past the end of the buffer.
std::vector<float> resample(const std::vector<float>& in, uint32_t from_rate, uint32_t to_rate);
std::vector<float> resample(const float* in, size_t in_samples, uint32_t from_rate, uint32_t to_rate);

// Linear resampler for a chunked stream. Keeps the fractional read position and the
// last input sample between chunks, so output length and interpolation do not depend
// on how the input was split. The final input sample is emitted with the next chunk.
class StreamResampler {
public:
    StreamResampler() = default;
    StreamResampler(uint32_t from_rate, uint32_t to_rate) { set_rates(from_rate, to_rate); }

    // Changing either rate restarts the stream
    void set_rates(uint32_t from_rate, uint32_t to_rate);
    void reset();

    void process(const float* in, size_t count, std::vector<float>& out);
    std::vector<float> process(const std::vector<float>& in);

    uint32_t from_rate() const { return from_rate_; }
    uint32_t to_rate() const { return to_rate_; }

private:
    uint32_t from_rate_ = 0;
    uint32_t to_rate_ = 0;
    double pos_ = 0.0;    // next output position, in input samples relative to the current chunk
    float prev_ = 0.0f;   // last sample of the previous chunk (position -1)
    bool has_prev_ = false;
};

// Root mean square of a window, 0 for an empty window
float calculate_rms(const float* samples, size_t count);
float calculate_rms(const std::vector<float>& samples);

// Largest absolute sample value
float calculate_peak(const float* samples, size_t count);

} // namespace audio
