#include "asr/whisper_backend.hpp"
#include "asr/model_catalog.hpp"
#include "core/logging.hpp"

#include "whisper.h"

#include <algorithm>
#include <atomic>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_whisper_verbose{false};

std::string strip_newline(const char* text) {
    std::string s = text ? text : "";
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char* text, void*) {
    const std::string line = strip_newline(text);
    if (line.empty()) return;
    switch (level) {
    case GGML_LOG_LEVEL_ERROR:
        core::log_error("[whisper] " + line);
        break;
    case GGML_LOG_LEVEL_WARN:
        core::log_warn("[whisper] " + line);
        break;
    default:
        if (g_whisper_verbose.load()) core::log_debug("[whisper] " + line);
        break;
    }
}

} // anonymous namespace

namespace asr {

void init_whisper_logging(bool verbose) {
    g_whisper_verbose.store(verbose);
    whisper_log_set(log_cb, nullptr);
}

WhisperBackend::WhisperBackend() : WhisperBackend(Options{}) {}

WhisperBackend::WhisperBackend(const Options& options) : options_(options) {}

WhisperBackend::~WhisperBackend() {
    release();
}

void WhisperBackend::release() {
    if (state_) {
        whisper_free_state(state_);
        state_ = nullptr;
    }
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

void WhisperBackend::load_model(const std::string& model_name) {
    release();

    const auto dirs = options_.search_dirs.empty() ? default_model_dirs() : options_.search_dirs;
    const std::string path = resolve_model_path(model_name, dirs);
    if (path.empty()) {
        throw ModelLoadError("Whisper model not found: " + model_name +
                             " (place e.g. ggml-" + model_name + ".bin under models/)");
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = options_.use_gpu;
    core::log_info("[whisper] init from: " + path);
    ctx_ = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx_) {
        throw ModelLoadError("Failed to load Whisper model: " + path);
    }
    // persistent state for faster repeated calls
    state_ = whisper_init_state(ctx_);
    if (!state_) {
        release();
        throw ModelLoadError("Failed to create Whisper state for: " + path);
    }
    model_path_ = path;
    core::log_info("[whisper] init OK: " + path);
    if (g_whisper_verbose.load()) {
        core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
    }
}

whisper_full_params WhisperBackend::decode_params(const Options& options) {
    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.print_realtime   = false;
    wparams.print_progress   = false;
    wparams.print_timestamps = false;
    wparams.print_special    = false;
    wparams.translate        = options.translate;
    wparams.language         = options.language.c_str();
    wparams.detect_language  = false;
    wparams.n_threads        = options.n_threads > 0
                                   ? options.n_threads
                                   : static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
    wparams.no_context       = true;  // every call sees only the samples it is given
    wparams.suppress_blank   = true;
    wparams.suppress_nst     = true;  // non-speech tokens: [Music], (laughter), ...
    wparams.greedy.best_of   = 1;

    return wparams;
}

std::vector<Segment> WhisperBackend::transcribe(const std::vector<float>& samples) {
    if (samples.empty()) return {};
    if (!ctx_ || !state_) {
        throw InferenceError("Whisper model not loaded");
    }

    const whisper_full_params wparams = decode_params(options_);

    const int ret = whisper_full_with_state(ctx_, state_, wparams, samples.data(), static_cast<int>(samples.size()));
    if (ret != 0) {
        throw InferenceError("whisper_full failed, ret=" + std::to_string(ret));
    }

    const int n = whisper_full_n_segments_from_state(state_);
    std::vector<Segment> out;
    out.reserve(static_cast<size_t>(std::max(0, n)));
    for (int i = 0; i < n; ++i) {
        const char* txt = whisper_full_get_segment_text_from_state(state_, i);
        Segment seg;
        seg.text = txt ? txt : "";
        // whisper timestamps are in centiseconds
        seg.start_s = static_cast<double>(whisper_full_get_segment_t0_from_state(state_, i)) / 100.0;
        seg.end_s = static_cast<double>(whisper_full_get_segment_t1_from_state(state_, i)) / 100.0;
        out.push_back(std::move(seg));
    }
    if (g_whisper_verbose.load()) {
        core::log_debug("[whisper] samples=" + std::to_string(samples.size()) + " segments=" + std::to_string(n));
    }
    return out;
}

void WhisperBackend::set_threads(int n) {
    options_.n_threads = n > 0 ? n : 0;
}

} // namespace asr
