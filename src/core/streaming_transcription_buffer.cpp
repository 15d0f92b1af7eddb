// Copyright (c) 2025 LiveScribe Voice Recorder
// StreamingTranscriptionBuffer - live transcription engine core
//
// Cycle (driven by the owner every ~100 ms while ready_to_process()):
//
//   add_samples()  -> calibrator (until calibrated) -> buffer_
//   process()      -> VAD on the last step of audio
//                     silence: count; commit tentative text after N silent cycles
//                     speech:  transcribe ALL of buffer_, filter hallucinations,
//                              replace tentative text if it changed
//                     buffer_ at hard cap: commit and clear regardless of VAD

#include "core/streaming_transcription_buffer.hpp"
#include "asr/inference_engine.hpp"
#include "audio/dsp.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cstring>

namespace core {

namespace {

std::string trim(const std::string& s) {
    const size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    const size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool starts_with_space_or_punct(const std::string& s) {
    return !s.empty() && std::strchr(" \t\r\n,.!?;:", s.front()) != nullptr;
}

std::string preview(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(0, n) + "...";
}

} // anonymous namespace

const char* to_string(ProcessCycleResult r) {
    switch (r) {
    case ProcessCycleResult::NoChange:  return "NoChange";
    case ProcessCycleResult::Updated:   return "Updated";
    case ProcessCycleResult::Committed: return "Committed";
    }
    return "Unknown";
}

StreamingTranscriptionBuffer::StreamingTranscriptionBuffer(asr::InferenceEngine& engine)
    : StreamingTranscriptionBuffer(engine, Config{}) {
}

StreamingTranscriptionBuffer::StreamingTranscriptionBuffer(asr::InferenceEngine& engine, const Config& config)
    : engine_(engine)
    , config_(config)
    , calibrator_(config.calibration)
    , filter_(config.hallucination_rules) {
    if (config_.step_samples == 0) config_.step_samples = 1;
    buffer_.reserve(config_.max_buffer_samples);
}

void StreamingTranscriptionBuffer::add_samples(const float* samples, size_t count) {
    if (!samples || count == 0) return;

    if (!calibrator_.is_calibrated()) {
        // Calibration gates the buffer; whatever arrives after it completes passes through
        const size_t consumed = calibrator_.feed(samples, count);
        if (calibrator_.is_calibrated() && consumed < count) {
            append_to_buffer(samples + consumed, count - consumed);
        }
        return;
    }

    append_to_buffer(samples, count);
}

void StreamingTranscriptionBuffer::append_to_buffer(const float* samples, size_t count) {
    buffer_.insert(buffer_.end(), samples, samples + count);
    samples_since_last_process_ += count;
}

bool StreamingTranscriptionBuffer::ready_to_process() const {
    return calibrator_.is_calibrated() && samples_since_last_process_ >= config_.step_samples;
}

ProcessCycleResult StreamingTranscriptionBuffer::process() {
    if (buffer_.empty()) {
        return ProcessCycleResult::NoChange;
    }

    samples_since_last_process_ = 0;

    // VAD on the most recent step only
    const size_t vad_count = std::min(buffer_.size(), config_.step_samples);
    const float rms = audio::calculate_rms(buffer_.data() + (buffer_.size() - vad_count), vad_count);

    if (rms < calibrator_.threshold()) {
        ++silence_count_;
        if (silence_count_ >= config_.silence_commit_cycles && !tentative_text_.empty()) {
            commit_segment();
            return ProcessCycleResult::Committed;
        }
        if (should_force_commit()) {
            log_info("[commit] buffer reached hard cap during silence");
            return commit_segment() ? ProcessCycleResult::Committed : ProcessCycleResult::NoChange;
        }
        return ProcessCycleResult::NoChange;
    }

    silence_count_ = 0;

    std::string text;
    try {
        text = transcribe_buffer();
    } catch (const asr::InferenceError&) {
        // Retries must not grow the buffer past the cap
        if (should_force_commit()) {
            log_warn("[commit] inference failed at hard cap, committing last text and dropping audio");
            commit_segment();
        }
        throw;
    }

    const bool changed = !text.empty() && text != tentative_text_;
    if (changed) {
        tentative_text_ = text;
        log_debug("[live] '" + preview(tentative_text_, 80) + "'");
    }

    if (should_force_commit()) {
        log_info("[commit] buffer reached hard cap, forcing commit");
        return commit_segment() ? ProcessCycleResult::Committed : ProcessCycleResult::NoChange;
    }

    return changed ? ProcessCycleResult::Updated : ProcessCycleResult::NoChange;
}

std::string StreamingTranscriptionBuffer::transcribe_buffer() {
    const auto segments = engine_.transcribe(buffer_);

    std::string out;
    for (const auto& seg : segments) {
        if (trim(seg.text).empty() || filter_.is_hallucination(seg.text)) {
            continue;
        }
        if (!out.empty() && !starts_with_space_or_punct(seg.text)) {
            out += ' ';
        }
        out += seg.text;
    }
    return trim(out);
}

bool StreamingTranscriptionBuffer::commit_segment() {
    const bool has_text = !tentative_text_.empty();
    if (has_text) {
        log_info("[commit] '" + preview(tentative_text_, 60) + "' (" +
                 std::to_string(tentative_text_.size()) + " chars)");
        if (!committed_text_.empty()) {
            committed_text_ += config_.separator;
        }
        committed_text_ += tentative_text_;
        tentative_text_.clear();
    }
    reset_segment();
    return has_text;
}

void StreamingTranscriptionBuffer::reset_segment() {
    buffer_.clear();
    samples_since_last_process_ = 0;
    silence_count_ = 0;
}

std::string StreamingTranscriptionBuffer::get_transcript() const {
    if (committed_text_.empty()) return tentative_text_;
    if (tentative_text_.empty()) return committed_text_;
    return committed_text_ + config_.separator + tentative_text_;
}

void StreamingTranscriptionBuffer::clear() {
    log_info("[clear] clearing all transcript data");
    reset_segment();
    committed_text_.clear();
    tentative_text_.clear();
    // Recalibrate on next use
    calibrator_.reset();
}

} // namespace core
