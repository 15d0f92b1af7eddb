#include "audio/dsp.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

std::vector<float> resample(const float* in, size_t in_samples, uint32_t from_rate, uint32_t to_rate) {
    if (from_rate == to_rate || from_rate == 0 || to_rate == 0 || in_samples == 0) {
        return std::vector<float>(in, in + in_samples);
    }
    const double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    const size_t out_len = static_cast<size_t>(static_cast<double>(in_samples) / ratio);
    std::vector<float> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        const double src_pos = static_cast<double>(i) * ratio;
        const size_t i0 = static_cast<size_t>(src_pos);
        if (i0 + 1 < in_samples) {
            const float frac = static_cast<float>(src_pos - static_cast<double>(i0));
            out[i] = in[i0] * (1.0f - frac) + in[i0 + 1] * frac;
        } else {
            out[i] = in[std::min(i0, in_samples - 1)];
        }
    }
    return out;
}

std::vector<float> resample(const std::vector<float>& in, uint32_t from_rate, uint32_t to_rate) {
    return resample(in.data(), in.size(), from_rate, to_rate);
}

void StreamResampler::set_rates(uint32_t from_rate, uint32_t to_rate) {
    if (from_rate == from_rate_ && to_rate == to_rate_) return;
    from_rate_ = from_rate;
    to_rate_ = to_rate;
    reset();
}

void StreamResampler::reset() {
    pos_ = 0.0;
    prev_ = 0.0f;
    has_prev_ = false;
}

void StreamResampler::process(const float* in, size_t count, std::vector<float>& out) {
    if (!in || count == 0) return;
    if (from_rate_ == to_rate_ || from_rate_ == 0 || to_rate_ == 0) {
        out.insert(out.end(), in, in + count);
        return;
    }

    const double step = static_cast<double>(from_rate_) / static_cast<double>(to_rate_);
    for (;;) {
        if (pos_ < 0.0) {
            // Between the previous chunk's last sample and in[0]
            const float frac = static_cast<float>(pos_ + 1.0);
            const float a = has_prev_ ? prev_ : in[0];
            out.push_back(a * (1.0f - frac) + in[0] * frac);
        } else {
            const size_t i0 = static_cast<size_t>(pos_);
            if (i0 + 1 >= count) break;
            const float frac = static_cast<float>(pos_ - static_cast<double>(i0));
            out.push_back(in[i0] * (1.0f - frac) + in[i0 + 1] * frac);
        }
        pos_ += step;
    }

    pos_ -= static_cast<double>(count);
    prev_ = in[count - 1];
    has_prev_ = true;
}

std::vector<float> StreamResampler::process(const std::vector<float>& in) {
    std::vector<float> out;
    out.reserve(static_cast<size_t>(static_cast<double>(in.size()) * to_rate_ / std::max<uint32_t>(1, from_rate_)) + 2);
    process(in.data(), in.size(), out);
    return out;
}

float calculate_rms(const float* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;
    double sum2 = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum2 += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum2 / static_cast<double>(count)));
}

float calculate_rms(const std::vector<float>& samples) {
    return calculate_rms(samples.data(), samples.size());
}

float calculate_peak(const float* samples, size_t count) {
    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        peak = std::max(peak, std::fabs(samples[i]));
    }
    return peak;
}

} // namespace audio
