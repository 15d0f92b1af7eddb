#include "core/config.hpp"
#include <cstdlib>
#include <string>

namespace core {

namespace {
bool env_string(const char* name, std::string& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    out = v;
    return true;
}

bool parse_bool(const std::string& s) {
    return s == "1" || s == "true" || s == "TRUE" || s == "yes" || s == "on";
}
} // anonymous namespace

Config load_config_from_env() {
    Config cfg;
    std::string v;
    env_string("LIVESCRIBE_MODEL", cfg.whisper_model);
    env_string("LIVESCRIBE_MODEL_DIR", cfg.model_dir);
    env_string("LIVESCRIBE_LANGUAGE", cfg.language);
    if (env_string("LIVESCRIBE_THREADS", v)) {
        int n = std::atoi(v.c_str());
        cfg.n_threads = n > 0 ? n : 0;
    }
    if (env_string("LIVESCRIBE_USE_GPU", v)) cfg.use_gpu = parse_bool(v);
    // Same switch the whisper backend has always honoured
    cfg.whisper_verbose = std::getenv("WHISPER_DEBUG") != nullptr;
    return cfg;
}

const Config& get_config() {
    static const Config cfg = load_config_from_env();
    return cfg;
}
}
