// Live microphone transcription in the terminal
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "app/transcription_controller.hpp"
#include "asr/model_catalog.hpp"
#include "asr/whisper_backend.hpp"
#include "audio/audio_input_device.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_sigint(int) { g_interrupted.store(true); }

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [-v|-vv|-vvv] [-q] [--model NAME] [--device ID] [--language CODE]"
                 " [--threads N] [--gpu] [--seconds N]\n"
                 "  -q             errors only\n"
                 "  -v / -vv       info / debug logging\n"
                 "  -vvv           debug logging plus whisper internals\n"
                 "  --model NAME   catalog name (tiny, base.en, ...) or model file path\n"
                 "  --device ID    input device id from livescribe_list_devices (default: system default)\n"
                 "  --language     spoken language code, 'auto' to detect\n"
                 "  --threads N    inference threads (0 = all cores)\n"
                 "  --gpu          use GPU if whisper was built with one\n"
                 "  --seconds N    stop after N seconds (0 = until Ctrl+C)\n";
}

bool parse_int(const std::string& s, int& out) {
    char* end = nullptr;
    long v = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || v < 0) return false;
    out = static_cast<int>(v);
    return true;
}

// Prints committed paragraphs once and keeps the tentative text on one rewritable line
class TranscriptPrinter {
public:
    void on_snapshot(const app::TranscriptSnapshot& s) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (s.committed_text.size() < printed_committed_) {
            // cleared
            printed_committed_ = 0;
        }
        if (s.committed_text.size() > printed_committed_) {
            clear_live_line();
            std::string fresh = s.committed_text.substr(printed_committed_);
            while (!fresh.empty() && fresh.front() == '\n') fresh.erase(0, 1);
            std::cout << fresh << "\n" << std::flush;
            printed_committed_ = s.committed_text.size();
        }
        if (s.tentative_text != live_) {
            clear_live_line();
            live_ = s.tentative_text;
            if (!live_.empty()) {
                std::cout << "> " << live_ << std::flush;
                live_width_ = live_.size() + 2;
            }
        }
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (live_width_ > 0) std::cout << "\n";
        live_width_ = 0;
    }

private:
    void clear_live_line() {
        if (live_width_ == 0) return;
        std::cout << "\r" << std::string(live_width_, ' ') << "\r";
        live_width_ = 0;
    }

    std::mutex mutex_;
    size_t printed_committed_ = 0;
    std::string live_;
    size_t live_width_ = 0;
};

} // anonymous namespace

int main(int argc, char** argv) {
    const core::Config& env = core::get_config();

    app::TranscriptionConfig config;
    config.whisper_model = env.whisper_model;
    config.language = env.language;
    config.n_threads = env.n_threads;
    config.use_gpu = env.use_gpu;

    core::LogLevel level = core::LogLevel::Warn;
    bool whisper_verbose = env.whisper_verbose;
    int limit_sec = 0;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-q" || a == "--quiet") { level = core::LogLevel::Error; continue; }
        if (a == "-v" || a == "--verbose") { level = core::LogLevel::Info; continue; }
        if (a == "-vv") { level = core::LogLevel::Debug; continue; }
        if (a == "-vvv") { level = core::LogLevel::Debug; whisper_verbose = true; continue; }
        if (a == "--gpu") { config.use_gpu = true; continue; }
        if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
        if (i + 1 < argc) {
            std::string v = argv[i + 1];
            if (a == "--model") { config.whisper_model = v; ++i; continue; }
            if (a == "--device") { config.audio.device_id = v; ++i; continue; }
            if (a == "--language") { config.language = v; ++i; continue; }
            if (a == "--threads" && parse_int(v, config.n_threads)) { ++i; continue; }
            if (a == "--seconds" && parse_int(v, limit_sec)) { ++i; continue; }
        }
        std::cerr << "Unknown or incomplete argument: " << a << "\n";
        print_usage(argv[0]);
        return 2;
    }

    core::set_log_level(level);
    asr::init_whisper_logging(whisper_verbose);

    auto make_engine = [&env](const app::TranscriptionConfig& cfg) -> std::unique_ptr<asr::InferenceEngine> {
        asr::WhisperBackend::Options opts;
        opts.language = cfg.language;
        opts.n_threads = cfg.n_threads;
        opts.use_gpu = cfg.use_gpu;
        opts.search_dirs = asr::default_model_dirs(env.model_dir);
        auto backend = std::make_unique<asr::WhisperBackend>(opts);
        backend->load_model(cfg.whisper_model);
        return backend;
    };
    auto make_device = [](const app::TranscriptionConfig& cfg) {
        return audio::AudioInputFactory::create_device(cfg.audio.device_id);
    };

    app::TranscriptionController controller(make_engine, make_device);

    TranscriptPrinter printer;
    controller.subscribe_to_transcript([&printer](const app::TranscriptSnapshot& s) { printer.on_snapshot(s); });

    std::mutex status_mutex;
    std::string last_message;
    controller.subscribe_to_status([&](const app::TranscriptionStatus& st) {
        std::lock_guard<std::mutex> lock(status_mutex);
        if (st.message == last_message) return;
        last_message = st.message;
        std::cerr << "[status] " << st.message << "\n";
    });
    controller.subscribe_to_errors([](const app::TranscriptionError& e) {
        if (e.severity == app::TranscriptionError::Severity::WARNING) {
            core::log_warn(e.message + ": " + e.details);
        }
    });

    std::signal(SIGINT, on_sigint);

    if (!controller.start_transcription(config)) {
        const std::string reason = controller.get_status().message;
        std::cerr << "Could not start transcription: " << reason << "\n";
        if (reason.find("model") != std::string::npos) {
            std::cerr << "Place a whisper model under models/ (e.g. models/ggml-tiny.bin) or pass --model PATH\n";
        }
        return 1;
    }

    std::cerr << "Transcribing... press Ctrl+C to stop" << std::endl;

    const auto started = std::chrono::steady_clock::now();
    while (!g_interrupted.load() && controller.is_running()) {
        if (limit_sec > 0 && std::chrono::steady_clock::now() - started >= std::chrono::seconds(limit_sec)) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    const bool failed = controller.get_status().state == app::TranscriptionStatus::State::ERROR;
    controller.stop_transcription();
    printer.finish();

    auto snapshot = controller.get_snapshot();
    if (!snapshot.full_text.empty()) {
        std::cout << "\n=== Transcript ===\n" << snapshot.full_text << "\n";
    }
    return failed ? 1 : 0;
}
