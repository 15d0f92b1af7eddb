// Copyright (c) 2025 LiveScribe Voice Recorder
// StreamingTranscriptionBuffer - live transcription engine core

#pragma once

#include "core/vad_calibrator.hpp"
#include "asr/hallucination_filter.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace asr {
class InferenceEngine;
}

namespace core {

/// Outcome of one process() cycle
enum class ProcessCycleResult {
    NoChange,   ///< Nothing visible changed
    Updated,    ///< Tentative text was replaced
    Committed   ///< Tentative text moved into committed text
};

const char* to_string(ProcessCycleResult r);

/**
 * @brief Accumulates 16 kHz audio and turns it into a progressively committed transcript
 *
 * Strategy: full-buffer re-transcription.
 * - Audio is gated by the VAD calibrator until the ambient noise floor is known
 * - Every step (500 ms of new audio) the caller runs process()
 * - On speech, the WHOLE buffer is transcribed again and replaces the tentative text,
 *   so in-progress words self-correct and nothing is lost at window edges
 * - After a run of silent cycles the tentative text is committed and the buffer cleared
 * - A hard cap on buffer length forces a commit regardless of VAD state
 *
 * Not thread-safe. One owner drives add_samples()/process(); see
 * app::TranscriptionController for the threaded session around it.
 */
class StreamingTranscriptionBuffer {
public:
    struct Config {
        size_t step_samples = 500 * 16;            ///< 500 ms between inference cycles
        size_t max_buffer_samples = 30 * 16000;    ///< Hard cap (30 s) before a forced commit
        size_t silence_commit_cycles = 3;          ///< Consecutive silent cycles before commit
        std::string separator = "\n\n";            ///< Paragraph break between committed segments
        VadCalibrator::Config calibration;
        asr::HallucinationFilter::Rules hallucination_rules = asr::HallucinationFilter::default_rules();
    };

    static constexpr int kSampleRate = 16000;

    /// @param engine Inference engine, must outlive this buffer
    explicit StreamingTranscriptionBuffer(asr::InferenceEngine& engine);
    StreamingTranscriptionBuffer(asr::InferenceEngine& engine, const Config& config);

    StreamingTranscriptionBuffer(const StreamingTranscriptionBuffer&) = delete;
    StreamingTranscriptionBuffer& operator=(const StreamingTranscriptionBuffer&) = delete;

    /// Append 16 kHz samples (feeds the calibrator until calibrated). Never runs inference.
    void add_samples(const float* samples, size_t count);
    void add_samples(const std::vector<float>& samples) { add_samples(samples.data(), samples.size()); }

    /// Calibrated and at least one step of audio arrived since the last process()
    bool ready_to_process() const;

    /**
     * @brief Run one decision cycle (may block on inference)
     * @throws asr::InferenceError when the model call fails; audio, text and
     *         calibration are left untouched so the next cycle can retry, except
     *         at the hard cap where the tentative text is committed and the
     *         buffer cleared before the error propagates
     */
    ProcessCycleResult process();

    /// committed ++ separator ++ tentative
    std::string get_transcript() const;
    const std::string& committed_text() const { return committed_text_; }
    const std::string& tentative_text() const { return tentative_text_; }

    /// Back to the freshly constructed, uncalibrated state
    void clear();

    bool is_calibrated() const { return calibrator_.is_calibrated(); }
    float calibration_progress() const { return calibrator_.progress(); }
    float vad_threshold() const { return calibrator_.threshold(); }

    /// Bypass calibration with a known threshold
    void set_vad_threshold(float threshold) { calibrator_.force_threshold(threshold); }

    bool should_force_commit() const { return buffer_.size() >= config_.max_buffer_samples; }
    double buffer_duration_s() const { return static_cast<double>(buffer_.size()) / kSampleRate; }
    size_t buffered_samples() const { return buffer_.size(); }

    const Config& config() const { return config_; }

private:
    void append_to_buffer(const float* samples, size_t count);
    std::string transcribe_buffer();
    bool commit_segment();
    void reset_segment();

    asr::InferenceEngine& engine_;
    Config config_;
    VadCalibrator calibrator_;
    asr::HallucinationFilter filter_;

    std::vector<float> buffer_;             // current segment, 16 kHz
    size_t samples_since_last_process_ = 0;
    size_t silence_count_ = 0;

    std::string committed_text_;
    std::string tentative_text_;
};

} // namespace core
