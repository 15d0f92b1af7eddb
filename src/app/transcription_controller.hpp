// Copyright (c) 2025 LiveScribe Voice Recorder
// Application API - Transcription Controller Interface
//
// Provides an event-driven API for controlling a live transcription session.
// Bridges the audio device, the streaming engine and a front-end.

#pragma once

#include "audio/audio_input_device.hpp"
#include "core/streaming_transcription_buffer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace asr {
class InferenceEngine;
}

namespace app {

// Forward declarations
class TranscriptionControllerImpl;

//==============================================================================
// Configuration Structures
//==============================================================================

/// Configuration for transcription session
struct TranscriptionConfig {
    // Model Selection
    std::string whisper_model = "tiny";           ///< Catalog short name, bare model name or path
    std::string language = "en";                  ///< Spoken language, "auto" = detect
    int n_threads = 0;                            ///< Inference threads, 0 = hardware concurrency
    bool use_gpu = false;                         ///< Offload inference to GPU if available

    // Audio Input
    audio::AudioInputConfig audio;                ///< Device id, buffer size, synthetic source

    // Engine
    core::StreamingTranscriptionBuffer::Config engine;  ///< Step, hard cap, commit rules
    std::optional<float> preset_vad_threshold;    ///< Skip calibration with a known threshold

    // Worker
    int poll_interval_ms = 100;                   ///< Worker wake-up period when no audio arrives
};

//==============================================================================
// Event Structures
//==============================================================================

/// Read-only copy of the transcript and engine state
struct TranscriptSnapshot {
    std::string committed_text;                   ///< Finalized segments joined by the separator
    std::string tentative_text;                   ///< Current segment, may still change
    std::string full_text;                        ///< committed ++ separator ++ tentative
    bool is_calibrated = false;                   ///< Ambient noise floor is known
    float calibration_progress = 0.0f;            ///< 0.0-1.0
    float vad_threshold = 0.0f;                   ///< Speech RMS threshold (0 until calibrated)
    double buffer_duration_s = 0.0;               ///< Audio held in the current segment
    uint64_t revision = 0;                        ///< Incremented on every published change
};

/// Transcription status information
struct TranscriptionStatus {
    /// Current state of transcription
    enum class State {
        IDLE,                                     ///< Not running
        STARTING,                                 ///< Loading model, opening device
        CALIBRATING,                              ///< Measuring ambient noise
        RUNNING,                                  ///< Actively transcribing
        STOPPING,                                 ///< Shutting down
        ERROR                                     ///< Error occurred, session ended
    };

    State state = State::IDLE;                    ///< Current transcription state
    std::string message;                          ///< Human-readable status line
    float calibration_progress = 0.0f;            ///< 0.0-1.0
    int64_t elapsed_ms = 0;                       ///< Time since transcription started (milliseconds)
    int cycles = 0;                               ///< process() cycles run
    int commits = 0;                              ///< Segments committed
    std::string current_device;                   ///< Name of current audio device
};

/// Error/warning event
struct TranscriptionError {
    /// Error severity level
    enum class Severity {
        WARNING,                                  ///< Non-fatal, can continue
        ERROR,                                    ///< Fatal, transcription stopped
        CRITICAL                                  ///< System-level issue
    };

    Severity severity = Severity::WARNING;        ///< Error severity
    std::string message;                          ///< Human-readable error message
    std::string details;                          ///< Technical details for debugging
    int64_t timestamp_ms = 0;                     ///< When error occurred (ms from session start)
};

const char* to_string(TranscriptionStatus::State state);

//==============================================================================
// Callback and Factory Types
//==============================================================================

using TranscriptCallback = std::function<void(const TranscriptSnapshot&)>;
using StatusCallback = std::function<void(const TranscriptionStatus&)>;
using ErrorCallback = std::function<void(const TranscriptionError&)>;

/// Creates a ready-to-use engine for a session. Throws asr::ModelLoadError.
using EngineFactory = std::function<std::unique_ptr<asr::InferenceEngine>(const TranscriptionConfig&)>;
/// Creates an (uninitialized) input device for a session
using DeviceFactory = std::function<std::unique_ptr<audio::IAudioInputDevice>(const TranscriptionConfig&)>;

//==============================================================================
// Main Controller Class
//==============================================================================

/// Main controller for live transcription
///
/// Owns one session at a time: an input device, an inference engine and a
/// worker thread that exclusively drives the StreamingTranscriptionBuffer.
/// Audio callbacks, clear requests and stop requests reach the worker as
/// messages, so the engine never needs a lock.
///
/// Thread Safety:
/// - All public methods are thread-safe
/// - Callbacks are invoked from internal threads; do not call
///   start_transcription()/stop_transcription() from inside a callback
/// - GUI applications should marshal callbacks to UI thread
///
/// Example:
/// @code
/// TranscriptionController controller(make_engine, make_device);
///
/// controller.subscribe_to_transcript([](const TranscriptSnapshot& s) {
///     std::cout << s.full_text << "\n";
/// });
///
/// TranscriptionConfig config;
/// controller.start_transcription(config);
/// // ... let it run ...
/// controller.stop_transcription();
/// @endcode
class TranscriptionController {
public:
    //==========================================================================
    // Lifecycle
    //==========================================================================

    TranscriptionController(EngineFactory engine_factory, DeviceFactory device_factory);

    /// Destructor (stops transcription if running)
    ~TranscriptionController();

    // Non-copyable, non-movable
    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;
    TranscriptionController(TranscriptionController&&) = delete;
    TranscriptionController& operator=(TranscriptionController&&) = delete;

    //==========================================================================
    // Transcription Control
    //==========================================================================

    /// Start transcription session
    /// @param config Configuration for this session
    /// @return true if started; false if already running or the model/device failed
    ///         (an ERROR status and error event describe the failure)
    bool start_transcription(const TranscriptionConfig& config);

    /// Stop transcription session. The transcript stays readable.
    /// @note Safe to call even if not running
    void stop_transcription();

    /// Discard transcript and audio, and recalibrate
    void clear_transcript();

    /// Check if transcription is currently running
    /// @return true while starting, calibrating or transcribing
    bool is_running() const;

    /// Get current transcription status
    TranscriptionStatus get_status() const;

    /// Get a copy of the current transcript
    TranscriptSnapshot get_snapshot() const;

    //==========================================================================
    // Event Subscription
    //==========================================================================

    /// Subscribe to transcript changes (update, commit, clear)
    void subscribe_to_transcript(TranscriptCallback callback);

    /// Subscribe to status update events
    void subscribe_to_status(StatusCallback callback);

    /// Subscribe to error/warning events
    void subscribe_to_errors(ErrorCallback callback);

    /// Clear all event subscriptions
    void clear_subscriptions();

    //==========================================================================
    // Configuration Access
    //==========================================================================

    /// Get configuration of the current (or last) session
    TranscriptionConfig get_config() const;

private:
    std::unique_ptr<TranscriptionControllerImpl> impl_;  ///< PIMPL implementation
};

} // namespace app
