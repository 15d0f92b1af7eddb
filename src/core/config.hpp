#pragma once
#include <string>

namespace core {
struct Config {
    std::string whisper_model = "tiny"; // short catalog name or a path
    std::string model_dir;              // extra directory searched first
    std::string language = "en";        // "auto" = detect
    int n_threads = 0;                  // 0 = hardware concurrency
    bool use_gpu = false;
    bool whisper_verbose = false;       // forward whisper/ggml info logs
};

// Defaults overridden by LIVESCRIBE_* environment variables. Read once.
const Config& get_config();

// Same as get_config() but re-reads the environment on every call.
Config load_config_from_env();
}
