#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "asr/model_catalog.hpp"

namespace fs = std::filesystem;

int main() {
    assert(asr::all_models().size() == 12);
    assert(asr::default_model() == asr::WhisperModel::Tiny);
    assert(std::string(asr::model_info(asr::WhisperModel::BaseEn).file_name) == "ggml-base.en.bin");
    assert(asr::model_from_short_name("large-v3-turbo") == asr::WhisperModel::LargeV3Turbo);
    assert(!asr::model_from_short_name("huge"));

    for (const auto& m : asr::all_models()) {
        assert(asr::model_from_short_name(m.short_name) == m.model);
    }

    // Search order: extra dir first, then models/
    auto dirs = asr::default_model_dirs("/opt/models");
    assert(dirs.size() >= 2);
    assert(dirs[0] == "/opt/models");
    assert(dirs[1] == "models");

    // Resolution against a scratch directory
    const fs::path dir = fs::temp_directory_path() / "livescribe_model_catalog_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    { std::ofstream(dir / "ggml-tiny.bin") << "x"; }
    { std::ofstream(dir / "custom.gguf") << "x"; }
    { std::ofstream(dir / "ggml-foo-q5_1.bin") << "x"; }

    const std::vector<std::string> search{"/nonexistent/livescribe", dir.string()};
    assert(asr::resolve_model_path("tiny", search) == (dir / "ggml-tiny.bin").string());
    assert(asr::resolve_model_path("custom", search) == (dir / "custom.gguf").string());
    assert(asr::resolve_model_path("foo", search) == (dir / "ggml-foo-q5_1.bin").string());
    assert(asr::resolve_model_path("base.en", search).empty());
    assert(asr::resolve_model_path("", search).empty());

    // Explicit path wins
    const std::string explicit_path = (dir / "custom.gguf").string();
    assert(asr::resolve_model_path(explicit_path, {}) == explicit_path);

    fs::remove_all(dir);
    return 0;
}
