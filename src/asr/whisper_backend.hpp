#pragma once
#include "asr/inference_engine.hpp"

#include <string>
#include <vector>

struct whisper_context;
struct whisper_state;
struct whisper_full_params;

namespace asr {

/**
 * @brief whisper.cpp implementation of InferenceEngine
 *
 * One context and one persistent decoding state per instance. Not thread-safe:
 * the live session calls it from its single worker thread.
 */
class WhisperBackend : public InferenceEngine {
public:
    struct Options {
        std::string language = "en";   ///< "auto" = detect
        bool translate = false;        ///< Translate to English
        int n_threads = 0;             ///< 0 = hardware concurrency
        bool use_gpu = false;
        std::vector<std::string> search_dirs; ///< Empty = asr::default_model_dirs()
    };

    WhisperBackend();
    explicit WhisperBackend(const Options& options);
    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    /// Resolve and load a model (catalog name, bare name or path). Throws ModelLoadError.
    void load_model(const std::string& model_name);
    bool is_loaded() const { return ctx_ != nullptr; }
    const std::string& model_path() const { return model_path_; }

    std::vector<Segment> transcribe(const std::vector<float>& samples) override;

    /// Greedy decode parameters for one call. Keeps a pointer into options.language.
    static whisper_full_params decode_params(const Options& options);

    void set_threads(int n);
    void set_language(const std::string& language) { options_.language = language; }

private:
    void release();

    Options options_;
    std::string model_path_;
    whisper_context* ctx_ = nullptr;
    whisper_state* state_ = nullptr;
};

// Route whisper/ggml log output through core logging. Errors and warnings always,
// info/debug only when verbose.
void init_whisper_logging(bool verbose);

} // namespace asr
