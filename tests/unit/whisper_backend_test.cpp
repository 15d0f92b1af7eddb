#include <cassert>
#include <string>
#include <vector>
#include "asr/whisper_backend.hpp"
#include "whisper.h"

int main() {
    asr::WhisperBackend::Options opts;
    opts.language = "de";
    opts.n_threads = 3;

    const whisper_full_params p = asr::WhisperBackend::decode_params(opts);
    // Blank and non-speech tokens ([Music], (laughter)) are never decoded
    assert(p.suppress_blank);
    assert(p.suppress_nst);
    assert(p.no_context);
    assert(!p.translate);
    assert(p.n_threads == 3);
    assert(std::string(p.language) == "de");
    assert(!p.print_realtime && !p.print_progress && !p.print_special);

    opts.n_threads = 0;
    assert(asr::WhisperBackend::decode_params(opts).n_threads >= 1);

    // Unknown model: ModelLoadError, backend stays unloaded
    opts.search_dirs = {"does-not-exist"};
    asr::WhisperBackend backend(opts);
    bool threw = false;
    try {
        backend.load_model("no-such-model");
    } catch (const asr::ModelLoadError& e) {
        threw = std::string(e.what()).find("no-such-model") != std::string::npos;
    }
    assert(threw);
    assert(!backend.is_loaded());

    bool inference_failed = false;
    try {
        backend.transcribe(std::vector<float>(1600, 0.0f));
    } catch (const asr::InferenceError&) {
        inference_failed = true;
    }
    assert(inference_failed);
    return 0;
}
