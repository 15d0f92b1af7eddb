#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace asr {

struct Segment {
    double start_s = 0.0;  // start time in seconds
    double end_s = 0.0;    // end time in seconds
    std::string text;
};

// Model could not be loaded; the session cannot start
class ModelLoadError : public std::runtime_error {
public:
    explicit ModelLoadError(const std::string& what) : std::runtime_error(what) {}
};

// A single inference call failed; callers may retry with the same audio
class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Speech-to-text primitive used by the live engine
 *
 * Stateless per call: each transcribe() sees only the samples it is given
 * (mono float32, 16 kHz). Throws InferenceError on failure.
 */
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    virtual std::vector<Segment> transcribe(const std::vector<float>& samples) = 0;
};

} // namespace asr
