#include "asr/model_catalog.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace asr {

namespace {
bool file_exists(const std::string& p) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::u8path(p), ec);
}
} // anonymous namespace

const std::vector<ModelInfo>& all_models() {
    static const std::vector<ModelInfo> models = {
        {WhisperModel::Tiny,         "tiny",           "ggml-tiny.bin",           "Tiny (75 MB)"},
        {WhisperModel::TinyEn,       "tiny.en",        "ggml-tiny.en.bin",        "Tiny English (75 MB)"},
        {WhisperModel::Base,         "base",           "ggml-base.bin",           "Base (142 MB)"},
        {WhisperModel::BaseEn,       "base.en",        "ggml-base.en.bin",        "Base English (142 MB)"},
        {WhisperModel::Small,        "small",          "ggml-small.bin",          "Small (466 MB)"},
        {WhisperModel::SmallEn,      "small.en",       "ggml-small.en.bin",       "Small English (466 MB)"},
        {WhisperModel::Medium,       "medium",         "ggml-medium.bin",         "Medium (1.5 GB)"},
        {WhisperModel::MediumEn,     "medium.en",      "ggml-medium.en.bin",      "Medium English (1.5 GB)"},
        {WhisperModel::LargeV1,      "large-v1",       "ggml-large-v1.bin",       "Large v1 (2.9 GB)"},
        {WhisperModel::LargeV2,      "large-v2",       "ggml-large-v2.bin",       "Large v2 (2.9 GB)"},
        {WhisperModel::LargeV3,      "large-v3",       "ggml-large-v3.bin",       "Large v3 (2.9 GB)"},
        {WhisperModel::LargeV3Turbo, "large-v3-turbo", "ggml-large-v3-turbo.bin", "Large v3 Turbo (1.6 GB)"},
    };
    return models;
}

const ModelInfo& model_info(WhisperModel model) {
    for (const auto& m : all_models()) {
        if (m.model == model) return m;
    }
    return all_models().front();
}

std::optional<WhisperModel> model_from_short_name(const std::string& name) {
    for (const auto& m : all_models()) {
        if (name == m.short_name) return m.model;
    }
    return std::nullopt;
}

std::vector<std::string> default_model_dirs(const std::string& extra_dir) {
    std::vector<std::string> dirs;
    if (!extra_dir.empty()) dirs.push_back(extra_dir);
    dirs.push_back("models");
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        dirs.push_back(std::string(xdg) + "/livescribe/models");
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        dirs.push_back(std::string(home) + "/.cache/livescribe/models");
    }
    return dirs;
}

std::string resolve_model_path(const std::string& name_or_path, const std::vector<std::string>& search_dirs) {
    if (name_or_path.empty()) return {};
    if (file_exists(name_or_path)) return name_or_path;

    // Try catalog file name first, then common GGUF and legacy GGML BIN patterns
    std::vector<std::string> candidates;
    if (auto m = model_from_short_name(name_or_path)) {
        candidates.push_back(model_info(*m).file_name);
    }
    candidates.push_back(name_or_path + ".bin");
    candidates.push_back(name_or_path + ".gguf");
    candidates.push_back("ggml-" + name_or_path + ".bin");
    candidates.push_back("ggml-" + name_or_path + "-q5_1.bin");
    candidates.push_back("ggml-" + name_or_path + ".gguf");

    for (const auto& dir : search_dirs) {
        for (const auto& file : candidates) {
            const std::string p = dir + "/" + file;
            if (file_exists(p)) return p;
        }
    }
    return {};
}

} // namespace asr
