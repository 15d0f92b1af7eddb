// Copyright (c) 2025 LiveScribe Voice Recorder
// Application API - Transcription Controller Implementation

#include "app/transcription_controller.hpp"

#include "asr/inference_engine.hpp"
#include "audio/dsp.hpp"
#include "core/logging.hpp"
#include "core/message_queue.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace app {

const char* to_string(TranscriptionStatus::State state) {
    switch (state) {
        case TranscriptionStatus::State::IDLE: return "IDLE";
        case TranscriptionStatus::State::STARTING: return "STARTING";
        case TranscriptionStatus::State::CALIBRATING: return "CALIBRATING";
        case TranscriptionStatus::State::RUNNING: return "RUNNING";
        case TranscriptionStatus::State::STOPPING: return "STOPPING";
        case TranscriptionStatus::State::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

namespace {

/// Worker mailbox message
struct Command {
    enum class Type {
        Audio,          ///< samples at sample_rate, from the device callback
        Clear,          ///< reset transcript and calibration
        CaptureFailed,  ///< device reported a problem (message, fatal)
        Stop            ///< finish and exit
    };

    Type type = Type::Stop;
    std::vector<float> samples;
    int sample_rate = 0;
    std::string message;
    bool fatal = false;
};

std::string calibration_message(float progress) {
    int pct = static_cast<int>(std::lround(progress * 100.0f));
    return "Calibrating, stay quiet... " + std::to_string(pct) + "%";
}

const char* const kListening = "Listening";

int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

//==============================================================================
// Implementation Class (PIMPL Pattern)
//==============================================================================

class TranscriptionControllerImpl {
public:
    TranscriptionControllerImpl(EngineFactory engine_factory, DeviceFactory device_factory)
        : engine_factory_(std::move(engine_factory))
        , device_factory_(std::move(device_factory)) {}

    ~TranscriptionControllerImpl() {
        stop();
    }

    // Transcription Control
    bool start(const TranscriptionConfig& config);
    void stop();
    void clear();
    bool is_running() const;
    TranscriptionStatus get_status() const;
    TranscriptSnapshot get_snapshot() const;

    // Event Subscription
    void subscribe_to_transcript(TranscriptCallback callback);
    void subscribe_to_status(StatusCallback callback);
    void subscribe_to_errors(ErrorCallback callback);
    void clear_subscriptions();

    TranscriptionConfig get_config() const;

private:
    EngineFactory engine_factory_;
    DeviceFactory device_factory_;

    // Session lifecycle (start/stop/clear are serialized)
    mutable std::mutex lifecycle_mutex_;
    TranscriptionConfig config_;
    std::unique_ptr<asr::InferenceEngine> engine_;
    std::unique_ptr<core::StreamingTranscriptionBuffer> buffer_;  // owned by worker while it runs
    std::unique_ptr<audio::IAudioInputDevice> device_;
    std::unique_ptr<core::MessageQueue<Command>> mailbox_;
    std::unique_ptr<std::thread> worker_;
    std::atomic<bool> worker_alive_{false};
    std::atomic<int64_t> session_start_ms_{0};  // steady clock
    audio::StreamResampler resampler_;          // worker only

    // Published state
    mutable std::mutex status_mutex_;
    TranscriptionStatus status_;
    mutable std::mutex snapshot_mutex_;
    TranscriptSnapshot snapshot_;

    // Callbacks
    mutable std::mutex callbacks_mutex_;
    std::vector<TranscriptCallback> transcript_callbacks_;
    std::vector<StatusCallback> status_callbacks_;
    std::vector<ErrorCallback> error_callbacks_;

    // Internal methods
    void worker_loop();
    bool handle_command(Command& cmd, bool& calibrated, int& last_pct);
    void run_cycle();
    void reset_buffer();
    void fail(TranscriptionError::Severity severity, const std::string& message, const std::string& details);

    void publish_snapshot(bool notify);
    void set_status(TranscriptionStatus::State state, const std::string& message);
    void update_status(const std::function<void(TranscriptionStatus&)>& fn);
    void emit_status(const TranscriptionStatus& status);
    void emit_transcript(const TranscriptSnapshot& snapshot);
    void emit_error(const TranscriptionError& error);

    int64_t get_elapsed_ms() const;
};

//==============================================================================
// Transcription Control Implementation
//==============================================================================

bool TranscriptionControllerImpl::start(const TranscriptionConfig& config) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (worker_alive_.load()) {
        core::log_warn("[session] transcription already running");
        return false;
    }

    // A previous session may have ended on its own (capture failure)
    if (worker_ && worker_->joinable()) {
        worker_->join();
    }
    worker_.reset();
    device_.reset();
    buffer_.reset();
    engine_.reset();

    config_ = config;
    session_start_ms_.store(steady_now_ms());
    resampler_.reset();
    {
        std::lock_guard<std::mutex> status_lock(status_mutex_);
        status_ = TranscriptionStatus{};
    }
    set_status(TranscriptionStatus::State::STARTING, "Loading model " + config.whisper_model);

    // Model first: nothing is captured if it cannot be loaded
    try {
        if (!engine_factory_) {
            throw asr::ModelLoadError("no inference engine factory configured");
        }
        engine_ = engine_factory_(config);
        if (!engine_) {
            throw asr::ModelLoadError("inference engine factory returned no engine");
        }
    } catch (const std::exception& e) {
        engine_.reset();
        fail(TranscriptionError::Severity::ERROR, "Failed to load model", e.what());
        return false;
    }

    buffer_ = std::make_unique<core::StreamingTranscriptionBuffer>(*engine_, config.engine);
    if (config.preset_vad_threshold) {
        buffer_->set_vad_threshold(*config.preset_vad_threshold);
    }
    publish_snapshot(true);

    mailbox_ = std::make_unique<core::MessageQueue<Command>>();
    core::MessageQueue<Command>* mailbox = mailbox_.get();

    try {
        if (!device_factory_) {
            throw audio::CaptureError("no audio device factory configured");
        }
        device_ = device_factory_(config);
        if (!device_) {
            throw audio::CaptureError("audio device factory returned no device");
        }
        device_->initialize(
            config.audio,
            [mailbox](const float* samples, size_t count, int sample_rate) {
                Command cmd;
                cmd.type = Command::Type::Audio;
                cmd.samples.assign(samples, samples + count);
                cmd.sample_rate = sample_rate;
                if (!mailbox->push(std::move(cmd))) {
                    core::log_debug("[session] audio after stop dropped");
                }
            },
            [mailbox](const std::string& message, bool is_fatal) {
                Command cmd;
                cmd.type = Command::Type::CaptureFailed;
                cmd.message = message;
                cmd.fatal = is_fatal;
                if (!mailbox->push(std::move(cmd))) {
                    core::log_warn("[session] capture error after stop: " + message);
                }
            });
    } catch (const std::exception& e) {
        device_.reset();
        fail(TranscriptionError::Severity::ERROR, "Failed to open audio device", e.what());
        return false;
    }

    update_status([this](TranscriptionStatus& s) { s.current_device = device_->get_device_info().name; });

    // Worker before device so no callback lands in an unattended mailbox
    worker_alive_.store(true);
    worker_ = std::make_unique<std::thread>(&TranscriptionControllerImpl::worker_loop, this);

    try {
        device_->start();
    } catch (const std::exception& e) {
        Command stop_cmd;
        stop_cmd.type = Command::Type::Stop;
        mailbox_->push(std::move(stop_cmd));
        mailbox_->stop();
        if (worker_->joinable()) {
            worker_->join();
        }
        worker_.reset();
        device_.reset();
        fail(TranscriptionError::Severity::ERROR, "Failed to start audio capture", e.what());
        return false;
    }

    core::log_info("[session] started on '" + device_->get_device_info().name + "' with model " +
                   config.whisper_model);
    return true;
}

void TranscriptionControllerImpl::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!worker_) {
        return;
    }

    const bool ended_in_error = !worker_alive_.load() && get_status().state == TranscriptionStatus::State::ERROR;
    if (!ended_in_error) {
        set_status(TranscriptionStatus::State::STOPPING, "Stopping");
    }

    // Device first: after this no more audio reaches the mailbox
    if (device_) {
        device_->stop();
    }

    Command stop_cmd;
    stop_cmd.type = Command::Type::Stop;
    if (!mailbox_->push(std::move(stop_cmd))) {
        core::log_debug("[session] worker already finished");
    }
    mailbox_->stop();

    if (worker_->joinable()) {
        worker_->join();
    }
    worker_.reset();
    device_.reset();

    publish_snapshot(false);
    if (!ended_in_error) {
        set_status(TranscriptionStatus::State::IDLE, "Stopped");
    }
    core::log_info("[session] stopped after " + std::to_string(get_elapsed_ms()) + " ms");
}

void TranscriptionControllerImpl::clear() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (worker_ && mailbox_) {
        Command cmd;
        cmd.type = Command::Type::Clear;
        // Accepted: the worker applies it, in its loop or while draining on exit
        if (mailbox_->push(std::move(cmd))) {
            return;
        }
        // Mailbox closed: the worker is exiting on its own
        if (worker_->joinable()) {
            worker_->join();
        }
    }

    // No worker: the buffer is ours
    if (buffer_) {
        reset_buffer();
    }
    publish_snapshot(true);
}

bool TranscriptionControllerImpl::is_running() const {
    return worker_alive_.load();
}

TranscriptionStatus TranscriptionControllerImpl::get_status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    TranscriptionStatus status = status_;
    if (worker_alive_.load()) {
        status.elapsed_ms = get_elapsed_ms();
    }
    return status;
}

TranscriptSnapshot TranscriptionControllerImpl::get_snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

TranscriptionConfig TranscriptionControllerImpl::get_config() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return config_;
}

//==============================================================================
// Event Subscription Implementation
//==============================================================================

void TranscriptionControllerImpl::subscribe_to_transcript(TranscriptCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    transcript_callbacks_.push_back(std::move(callback));
}

void TranscriptionControllerImpl::subscribe_to_status(StatusCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    status_callbacks_.push_back(std::move(callback));
}

void TranscriptionControllerImpl::subscribe_to_errors(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    error_callbacks_.push_back(std::move(callback));
}

void TranscriptionControllerImpl::clear_subscriptions() {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    transcript_callbacks_.clear();
    status_callbacks_.clear();
    error_callbacks_.clear();
}

//==============================================================================
// Worker
//==============================================================================

void TranscriptionControllerImpl::worker_loop() {
    core::log_debug("[session] worker started");

    bool calibrated = buffer_->is_calibrated();
    int last_pct = -1;
    if (calibrated) {
        set_status(TranscriptionStatus::State::RUNNING, kListening);
    } else {
        update_status([](TranscriptionStatus& s) {
            s.state = TranscriptionStatus::State::CALIBRATING;
            s.message = calibration_message(0.0f);
            s.calibration_progress = 0.0f;
        });
        last_pct = 0;
    }

    const auto poll = std::chrono::milliseconds(std::max(1, config_.poll_interval_ms));
    bool keep_running = true;

    while (keep_running) {
        Command cmd;
        if (mailbox_->pop_for(cmd, poll)) {
            keep_running = handle_command(cmd, calibrated, last_pct);
            if (!keep_running) break;
        } else if (mailbox_->stopped()) {
            break;
        }

        if (buffer_->ready_to_process()) {
            run_cycle();
        }
    }

    // Nothing is accepted after this; a clear that was already queued still applies
    mailbox_->stop();
    Command pending;
    while (mailbox_->pop_for(pending, std::chrono::milliseconds(0))) {
        if (pending.type == Command::Type::Clear) {
            reset_buffer();
            publish_snapshot(true);
        }
    }

    worker_alive_.store(false);
    core::log_debug("[session] worker exiting");
}

bool TranscriptionControllerImpl::handle_command(Command& cmd, bool& calibrated, int& last_pct) {
    switch (cmd.type) {
        case Command::Type::Audio: {
            if (cmd.sample_rate > 0 && static_cast<uint32_t>(cmd.sample_rate) != audio::kWhisperSampleRate) {
                resampler_.set_rates(static_cast<uint32_t>(cmd.sample_rate), audio::kWhisperSampleRate);
                buffer_->add_samples(resampler_.process(cmd.samples));
            } else {
                buffer_->add_samples(cmd.samples);
            }

            if (!calibrated) {
                if (buffer_->is_calibrated()) {
                    calibrated = true;
                    update_status([](TranscriptionStatus& s) {
                        s.state = TranscriptionStatus::State::RUNNING;
                        s.message = kListening;
                        s.calibration_progress = 1.0f;
                    });
                    publish_snapshot(false);
                } else {
                    const float progress = buffer_->calibration_progress();
                    const int pct = static_cast<int>(std::lround(progress * 100.0f));
                    if (pct != last_pct) {
                        last_pct = pct;
                        update_status([progress](TranscriptionStatus& s) {
                            s.message = calibration_message(progress);
                            s.calibration_progress = progress;
                        });
                    }
                }
            }
            return true;
        }

        case Command::Type::Clear: {
            reset_buffer();
            calibrated = buffer_->is_calibrated();
            last_pct = 0;
            if (calibrated) {
                set_status(TranscriptionStatus::State::RUNNING, kListening);
            } else {
                update_status([](TranscriptionStatus& s) {
                    s.state = TranscriptionStatus::State::CALIBRATING;
                    s.message = calibration_message(0.0f);
                    s.calibration_progress = 0.0f;
                });
            }
            publish_snapshot(true);
            return true;
        }

        case Command::Type::CaptureFailed:
            if (!cmd.fatal) {
                core::log_warn("[session] capture: " + cmd.message);
                TranscriptionError warning;
                warning.severity = TranscriptionError::Severity::WARNING;
                warning.message = "Audio capture problem";
                warning.details = cmd.message;
                warning.timestamp_ms = get_elapsed_ms();
                emit_error(warning);
                return true;
            }
            fail(TranscriptionError::Severity::ERROR, "Audio capture failed", cmd.message);
            return false;

        case Command::Type::Stop:
            return false;
    }
    return true;
}

void TranscriptionControllerImpl::run_cycle() {
    core::ProcessCycleResult result = core::ProcessCycleResult::NoChange;
    try {
        result = buffer_->process();
    } catch (const asr::InferenceError& e) {
        core::log_warn(std::string("[session] inference failed: ") + e.what());
        update_status([&e](TranscriptionStatus& s) {
            s.message = std::string("Transcription error: ") + e.what();
        });
        TranscriptionError warning;
        warning.severity = TranscriptionError::Severity::WARNING;
        warning.message = "Transcription cycle failed";
        warning.details = e.what();
        warning.timestamp_ms = get_elapsed_ms();
        emit_error(warning);
        return;
    }

    update_status([result](TranscriptionStatus& s) {
        s.cycles++;
        if (result == core::ProcessCycleResult::Committed) s.commits++;
        if (s.state == TranscriptionStatus::State::RUNNING) s.message = kListening;
    });

    publish_snapshot(result != core::ProcessCycleResult::NoChange);
}

void TranscriptionControllerImpl::fail(TranscriptionError::Severity severity, const std::string& message,
                                       const std::string& details) {
    core::log_error("[session] " + message + ": " + details);

    update_status([&](TranscriptionStatus& s) {
        s.state = TranscriptionStatus::State::ERROR;
        s.message = message + ": " + details;
    });

    TranscriptionError error;
    error.severity = severity;
    error.message = message;
    error.details = details;
    error.timestamp_ms = get_elapsed_ms();
    emit_error(error);
}

//==============================================================================
// Internal Methods Implementation
//==============================================================================

void TranscriptionControllerImpl::publish_snapshot(bool notify) {
    TranscriptSnapshot copy;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        if (buffer_) {
            snapshot_.committed_text = buffer_->committed_text();
            snapshot_.tentative_text = buffer_->tentative_text();
            snapshot_.full_text = buffer_->get_transcript();
            snapshot_.is_calibrated = buffer_->is_calibrated();
            snapshot_.calibration_progress = buffer_->calibration_progress();
            snapshot_.vad_threshold = buffer_->vad_threshold();
            snapshot_.buffer_duration_s = buffer_->buffer_duration_s();
        }
        snapshot_.revision++;
        copy = snapshot_;
    }
    if (notify) {
        emit_transcript(copy);
    }
}

void TranscriptionControllerImpl::set_status(TranscriptionStatus::State state, const std::string& message) {
    update_status([&](TranscriptionStatus& s) {
        s.state = state;
        s.message = message;
    });
}

void TranscriptionControllerImpl::update_status(const std::function<void(TranscriptionStatus&)>& fn) {
    TranscriptionStatus copy;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        fn(status_);
        status_.elapsed_ms = get_elapsed_ms();
        copy = status_;
    }
    emit_status(copy);
}

void TranscriptionControllerImpl::emit_status(const TranscriptionStatus& status) {
    std::vector<StatusCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = status_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(status);
        } catch (const std::exception& e) {
            core::log_error(std::string("Status callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::emit_transcript(const TranscriptSnapshot& snapshot) {
    std::vector<TranscriptCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = transcript_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(snapshot);
        } catch (const std::exception& e) {
            core::log_error(std::string("Transcript callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::emit_error(const TranscriptionError& error) {
    std::vector<ErrorCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks = error_callbacks_;
    }
    for (const auto& callback : callbacks) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            core::log_error(std::string("Error callback exception: ") + e.what());
        }
    }
}

void TranscriptionControllerImpl::reset_buffer() {
    buffer_->clear();
    if (config_.preset_vad_threshold) {
        buffer_->set_vad_threshold(*config_.preset_vad_threshold);
    }
}

int64_t TranscriptionControllerImpl::get_elapsed_ms() const {
    return steady_now_ms() - session_start_ms_.load();
}

//==============================================================================
// TranscriptionController Public Interface (Forwarding to PIMPL)
//==============================================================================

TranscriptionController::TranscriptionController(EngineFactory engine_factory, DeviceFactory device_factory)
    : impl_(std::make_unique<TranscriptionControllerImpl>(std::move(engine_factory), std::move(device_factory))) {
}

TranscriptionController::~TranscriptionController() = default;

bool TranscriptionController::start_transcription(const TranscriptionConfig& config) {
    return impl_->start(config);
}

void TranscriptionController::stop_transcription() {
    impl_->stop();
}

void TranscriptionController::clear_transcript() {
    impl_->clear();
}

bool TranscriptionController::is_running() const {
    return impl_->is_running();
}

TranscriptionStatus TranscriptionController::get_status() const {
    return impl_->get_status();
}

TranscriptSnapshot TranscriptionController::get_snapshot() const {
    return impl_->get_snapshot();
}

void TranscriptionController::subscribe_to_transcript(TranscriptCallback callback) {
    impl_->subscribe_to_transcript(std::move(callback));
}

void TranscriptionController::subscribe_to_status(StatusCallback callback) {
    impl_->subscribe_to_status(std::move(callback));
}

void TranscriptionController::subscribe_to_errors(ErrorCallback callback) {
    impl_->subscribe_to_errors(std::move(callback));
}

void TranscriptionController::clear_subscriptions() {
    impl_->clear_subscriptions();
}

TranscriptionConfig TranscriptionController::get_config() const {
    return impl_->get_config();
}

} // namespace app
