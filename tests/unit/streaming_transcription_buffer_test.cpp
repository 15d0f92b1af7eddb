#include <cassert>
#include <string>
#include <vector>
#include "core/streaming_transcription_buffer.hpp"
#include "../common/mock_inference_engine.hpp"

using core::ProcessCycleResult;
using core::StreamingTranscriptionBuffer;

static const size_t kStep = 8000;
static const size_t kCalibration = 48000;

static void calibrate(StreamingTranscriptionBuffer& buf) {
    buf.add_samples(silence(kCalibration));
    assert(buf.is_calibrated());
}

static size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

static void test_calibration_gates_audio() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Hello"}); });
    StreamingTranscriptionBuffer buf(engine);

    buf.add_samples(silence(kCalibration - 1));
    assert(!buf.is_calibrated());
    assert(buf.calibration_progress() < 1.0f);
    assert(buf.buffered_samples() == 0);
    assert(!buf.ready_to_process());

    buf.add_samples(silence(1));
    assert(buf.is_calibrated());
    assert(buf.calibration_progress() == 1.0f);
    assert(buf.vad_threshold() == 0.02f);
    assert(buf.buffered_samples() == 0);

    // Nothing to do yet
    assert(buf.process() == ProcessCycleResult::NoChange);
    assert(engine.calls == 0);
}

static void test_audio_after_calibration_passes_through() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Hello"}); });
    StreamingTranscriptionBuffer buf(engine);

    std::vector<float> audio = silence(kCalibration);
    std::vector<float> speech = tone(kStep);
    audio.insert(audio.end(), speech.begin(), speech.end());
    buf.add_samples(audio);

    assert(buf.is_calibrated());
    assert(buf.buffered_samples() == kStep);
    assert(buf.ready_to_process());
}

static void test_loud_chunk_restarts_calibration() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({}); });
    StreamingTranscriptionBuffer buf(engine);

    buf.add_samples(silence(kCalibration / 2));
    assert(buf.calibration_progress() > 0.49f);
    buf.add_samples(tone(1600));
    assert(buf.calibration_progress() == 0.0f);
    assert(!buf.is_calibrated());
    assert(buf.buffered_samples() == 0);
}

static void test_silence_commits_after_three_cycles() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Hello", "world"}); });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);

    buf.add_samples(tone(kStep));
    assert(buf.ready_to_process());
    assert(buf.process() == ProcessCycleResult::Updated);
    assert(buf.tentative_text() == "Hello world");
    assert(!buf.ready_to_process());

    const int calls = engine.calls;
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::Committed);
    assert(engine.calls == calls);  // silence never reaches the model

    assert(buf.committed_text() == "Hello world");
    assert(buf.tentative_text().empty());
    assert(buf.buffered_samples() == 0);
    assert(buf.get_transcript() == "Hello world");
}

static void test_speech_resets_silence_count() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Hello"}); });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);

    // Same text again: nothing visible changes
    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);

    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    assert(buf.committed_text().empty());
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::Committed);
}

static void test_silence_without_text_never_commits() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Hello"}); });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);

    for (int i = 0; i < 5; ++i) {
        buf.add_samples(silence(kStep));
        assert(buf.process() == ProcessCycleResult::NoChange);
    }
    assert(buf.get_transcript().empty());
    assert(engine.calls == 0);
}

static void test_hard_cap_forces_commit() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Long", "speech"}); });
    StreamingTranscriptionBuffer::Config cfg;
    cfg.max_buffer_samples = 2 * kStep;
    StreamingTranscriptionBuffer buf(engine, cfg);
    calibrate(buf);

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    assert(!buf.should_force_commit());

    buf.add_samples(tone(kStep));
    assert(buf.should_force_commit());
    assert(buf.process() == ProcessCycleResult::Committed);
    assert(buf.committed_text() == "Long speech");
    assert(buf.tentative_text().empty());
    assert(buf.buffered_samples() == 0);
}

static void test_hard_cap_during_silence_without_text() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"unused"}); });
    StreamingTranscriptionBuffer::Config cfg;
    cfg.max_buffer_samples = 2 * kStep;
    StreamingTranscriptionBuffer buf(engine, cfg);
    calibrate(buf);

    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    assert(buf.buffered_samples() == 0);
    assert(buf.committed_text().empty());
}

// Inference failing every cycle must not let the segment grow past the cap
static void test_hard_cap_holds_when_inference_keeps_failing() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Long", "speech"}); });
    StreamingTranscriptionBuffer::Config cfg;
    cfg.max_buffer_samples = 2 * kStep;
    StreamingTranscriptionBuffer buf(engine, cfg);
    buf.set_vad_threshold(0.05f);

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);

    int failures = 0;
    for (int i = 0; i < 10; ++i) {
        buf.add_samples(tone(kStep));
        engine.fail_next = true;
        try {
            buf.process();
        } catch (const asr::InferenceError&) {
            ++failures;
        }
        assert(buf.buffered_samples() <= cfg.max_buffer_samples);
        assert(engine.last_size <= cfg.max_buffer_samples);
    }
    assert(failures == 10);
    // Text from before the failures was committed once, nothing was lost or repeated
    assert(buf.committed_text() == "Long speech");
    assert(buf.tentative_text().empty());
    assert(buf.is_calibrated());
}

static void test_hallucinated_segments_dropped() {
    MockInferenceEngine engine([](const std::vector<float>&) {
        return segments({" [Music]", " Hello there", " Thank you.", " ", "friend."});
    });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    assert(buf.tentative_text() == "Hello there friend.");
}

static void test_all_hallucination_keeps_previous_text() {
    bool noise = false;
    MockInferenceEngine engine([&noise](const std::vector<float>&) {
        return noise ? segments({" [BLANK_AUDIO]"}) : segments({"Good morning"});
    });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    noise = true;
    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::NoChange);
    assert(buf.tentative_text() == "Good morning");
}

static void test_inference_error_leaves_state_intact() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Recovered"}); });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);

    buf.add_samples(tone(kStep));
    engine.fail_next = true;
    bool threw = false;
    try {
        buf.process();
    } catch (const asr::InferenceError&) {
        threw = true;
    }
    assert(threw);
    assert(buf.is_calibrated());
    assert(buf.buffered_samples() == kStep);
    assert(buf.get_transcript().empty());

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    assert(engine.last_size == 2 * kStep);
    assert(buf.tentative_text() == "Recovered");
}

static void test_clear_is_idempotent() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Hello"}); });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);
    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);

    buf.clear();
    assert(buf.get_transcript().empty());
    assert(!buf.is_calibrated());
    assert(buf.calibration_progress() == 0.0f);
    assert(buf.buffered_samples() == 0);
    assert(!buf.ready_to_process());

    buf.clear();
    assert(buf.get_transcript().empty());
    assert(!buf.is_calibrated());
    assert(buf.buffered_samples() == 0);
}

static void test_preset_threshold_skips_calibration() {
    MockInferenceEngine engine([](const std::vector<float>&) { return segments({"Quick start"}); });
    StreamingTranscriptionBuffer buf(engine);
    buf.set_vad_threshold(0.05f);
    assert(buf.is_calibrated());
    assert(buf.vad_threshold() == 0.05f);

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
}

// Two utterances separated by a pause: the first is committed once and never repeated
static void test_two_utterances_without_duplication() {
    int utterance = 0;
    MockInferenceEngine engine([&utterance](const std::vector<float>& audio) {
        if (utterance == 0) {
            return audio.size() <= kStep ? segments({"Hello"}) : segments({"Hello", "world"});
        }
        return segments({"How are you?"});
    });
    StreamingTranscriptionBuffer buf(engine);
    calibrate(buf);

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    assert(buf.get_transcript() == "Hello");

    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    assert(buf.get_transcript() == "Hello world");

    for (int i = 0; i < 2; ++i) {
        buf.add_samples(silence(kStep));
        assert(buf.process() == ProcessCycleResult::NoChange);
    }
    buf.add_samples(silence(kStep));
    assert(buf.process() == ProcessCycleResult::Committed);

    utterance = 1;
    buf.add_samples(tone(kStep));
    assert(buf.process() == ProcessCycleResult::Updated);
    assert(engine.last_size == kStep);  // old audio is gone
    assert(buf.get_transcript() == "Hello world\n\nHow are you?");
    assert(count_of(buf.get_transcript(), "Hello") == 1);

    for (int i = 0; i < 3; ++i) {
        buf.add_samples(silence(kStep));
        buf.process();
    }
    assert(buf.committed_text() == "Hello world\n\nHow are you?");
    assert(buf.tentative_text().empty());
}

int main() {
    test_calibration_gates_audio();
    test_audio_after_calibration_passes_through();
    test_loud_chunk_restarts_calibration();
    test_silence_commits_after_three_cycles();
    test_speech_resets_silence_count();
    test_silence_without_text_never_commits();
    test_hard_cap_forces_commit();
    test_hard_cap_during_silence_without_text();
    test_hard_cap_holds_when_inference_keeps_failing();
    test_hallucinated_segments_dropped();
    test_all_hallucination_keeps_previous_text();
    test_inference_error_leaves_state_intact();
    test_clear_is_idempotent();
    test_preset_threshold_skips_calibration();
    test_two_utterances_without_duplication();
    return 0;
}
