#pragma once
#include <optional>
#include <string>
#include <vector>

namespace asr {

enum class WhisperModel {
    Tiny,
    TinyEn,
    Base,
    BaseEn,
    Small,
    SmallEn,
    Medium,
    MediumEn,
    LargeV1,
    LargeV2,
    LargeV3,
    LargeV3Turbo
};

struct ModelInfo {
    WhisperModel model;
    const char* short_name;    // settings / CLI name, e.g. "base.en"
    const char* file_name;     // ggml file, e.g. "ggml-base.en.bin"
    const char* display_name;  // e.g. "Base English (142 MB)"
};

const std::vector<ModelInfo>& all_models();
const ModelInfo& model_info(WhisperModel model);
std::optional<WhisperModel> model_from_short_name(const std::string& name);
inline WhisperModel default_model() { return WhisperModel::Tiny; }

// Directories searched for model files, in order: extra_dir (if set), models/,
// $XDG_CACHE_HOME/livescribe/models (or ~/.cache/livescribe/models)
std::vector<std::string> default_model_dirs(const std::string& extra_dir = "");

// Resolve a catalog short name, bare model name or explicit path to an existing
// file. Returns empty string when nothing matches.
std::string resolve_model_path(const std::string& name_or_path, const std::vector<std::string>& search_dirs);

} // namespace asr
