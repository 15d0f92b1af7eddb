#include <algorithm>
#include <cassert>
#include <cmath>
#include <vector>
#include "audio/dsp.hpp"

static bool near(float a, float b, float eps = 1e-5f) { return std::fabs(a - b) < eps; }

int main() {
    // Equal rates: exact copy
    std::vector<float> in{0.1f, -0.2f, 0.3f, -0.4f};
    auto same = audio::resample(in, 16000, 16000);
    assert(same == in);

    // Zero rate and empty input are copies too
    assert(audio::resample(in, 0, 16000) == in);
    assert(audio::resample(std::vector<float>{}, 48000, 16000).empty());

    // Length is floor(n * to / from)
    std::vector<float> ramp(4800);
    for (size_t i = 0; i < ramp.size(); ++i) ramp[i] = static_cast<float>(i);
    auto down = audio::resample(ramp, 48000, 16000);
    assert(down.size() == 1600);
    assert(near(down[1], 3.0f));
    assert(audio::resample(ramp.data(), 1000, 44100, 16000).size() == 362);

    // Upsampling interpolates between neighbours and holds the last sample
    std::vector<float> two{0.0f, 1.0f};
    auto up = audio::resample(two, 8000, 16000);
    assert(up.size() == 4);
    assert(near(up[0], 0.0f));
    assert(near(up[1], 0.5f));
    assert(near(up[2], 1.0f));
    assert(near(up[3], 1.0f));

    // Streaming: 48 kHz in 1000-sample chunks (not a multiple of 3) keeps the exact length
    std::vector<float> second(48000);
    for (size_t i = 0; i < second.size(); ++i) second[i] = static_cast<float>(i);
    audio::StreamResampler stream(48000, 16000);
    std::vector<float> streamed;
    for (size_t off = 0; off < second.size(); off += 1000) {
        stream.process(second.data() + off, 1000, streamed);
    }
    assert(streamed.size() == 16000);
    for (size_t i = 0; i < streamed.size(); ++i) {
        assert(near(streamed[i], static_cast<float>(3 * i), 1e-3f));
    }

    // Uneven chunks at 44.1 kHz interpolate across boundaries like one whole buffer
    std::vector<float> wave(44100);
    for (size_t i = 0; i < wave.size(); ++i) wave[i] = static_cast<float>(std::sin(0.01 * static_cast<double>(i)));
    auto whole = audio::resample(wave, 44100, 16000);
    audio::StreamResampler chunked(44100, 16000);
    std::vector<float> pieces;
    size_t off = 0;
    for (size_t n = 1; off < wave.size(); n = (n * 7 + 3) % 701 + 1) {
        const size_t take = std::min(n, wave.size() - off);
        chunked.process(wave.data() + off, take, pieces);
        off += take;
    }
    assert(pieces.size() + 1 >= whole.size() && pieces.size() <= whole.size());
    for (size_t i = 0; i < pieces.size(); ++i) {
        assert(near(pieces[i], whole[i], 1e-4f));
    }

    // Same rates pass through; a rate change restarts the stream
    audio::StreamResampler passthrough(16000, 16000);
    assert(passthrough.process(in) == in);
    chunked.set_rates(48000, 16000);
    assert(chunked.process(std::vector<float>{5.0f, 6.0f, 7.0f, 8.0f}) == std::vector<float>({5.0f}));  // 8.0 waits for the next chunk

    // RMS and peak
    std::vector<float> square{0.5f, -0.5f, 0.5f, -0.5f};
    assert(near(audio::calculate_rms(square), 0.5f));
    assert(audio::calculate_rms(nullptr, 0) == 0.0f);
    assert(audio::calculate_rms(std::vector<float>{}) == 0.0f);
    std::vector<float> peaky{0.1f, -0.9f, 0.2f};
    assert(near(audio::calculate_peak(peaky.data(), peaky.size()), 0.9f));
    return 0;
}
