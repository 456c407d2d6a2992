#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ws_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.model_path.empty());
        REQUIRE(cfg.engine.use_gpu);
        REQUIRE(cfg.engine.gpu_device == 0);
        REQUIRE_FALSE(cfg.engine.flash_attn);
        REQUIRE(cfg.decode.strategy == SamplingStrategy::Greedy);
        REQUIRE(cfg.decode.n_threads == 4);
        REQUIRE(cfg.decode.language == "en");
        REQUIRE_FALSE(cfg.decode.translate);
        REQUIRE(cfg.decode.no_context);
        REQUIRE((cfg.decode.continue_callback == nullptr));
        REQUIRE(cfg.output.format == "text");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "model": "/models/ggml-base.en.bin",
            "engine": { "use_gpu": false, "gpu_device": 1, "flash_attn": true },
            "decode": {
                "strategy": "beam_search",
                "threads": 8,
                "language": "de",
                "translate": true,
                "no_context": false,
                "single_segment": true,
                "no_timestamps": true,
                "token_timestamps": true,
                "max_len": 40,
                "split_on_word": true,
                "offset_ms": 1500,
                "duration_ms": 30000,
                "temperature": 0.2,
                "suppress_blank": false,
                "initial_prompt": "Glossary: ggml",
                "best_of": 3,
                "beam_size": 8
            },
            "output": { "format": "json" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model_path == "/models/ggml-base.en.bin");
        REQUIRE_FALSE(cfg.engine.use_gpu);
        REQUIRE(cfg.engine.gpu_device == 1);
        REQUIRE(cfg.engine.flash_attn);
        REQUIRE(cfg.decode.strategy == SamplingStrategy::BeamSearch);
        REQUIRE(cfg.decode.n_threads == 8);
        REQUIRE(cfg.decode.language == "de");
        REQUIRE(cfg.decode.translate);
        REQUIRE_FALSE(cfg.decode.no_context);
        REQUIRE(cfg.decode.single_segment);
        REQUIRE(cfg.decode.no_timestamps);
        REQUIRE(cfg.decode.token_timestamps);
        REQUIRE(cfg.decode.max_len == 40);
        REQUIRE(cfg.decode.split_on_word);
        REQUIRE(cfg.decode.offset_ms == 1500);
        REQUIRE(cfg.decode.duration_ms == 30000);
        REQUIRE(cfg.decode.temperature == 0.2f);
        REQUIRE_FALSE(cfg.decode.suppress_blank);
        REQUIRE(cfg.decode.initial_prompt == "Glossary: ggml");
        REQUIRE(cfg.decode.best_of == 3);
        REQUIRE(cfg.decode.beam_size == 8);
        REQUIRE(cfg.output.format == "json");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "decode": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.decode.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.model_path.empty());
        REQUIRE(cfg.decode.n_threads == 4);
        REQUIRE(cfg.engine.use_gpu);
        REQUIRE(cfg.output.format == "text");
    }

    SECTION("UnknownStrategyKeepsGreedy") {
        TmpFile f(R"({ "decode": { "strategy": "sampling", "threads": 2 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.decode.strategy == SamplingStrategy::Greedy);
        REQUIRE(cfg.decode.n_threads == 2);
    }

    SECTION("WrongTypeFallsBackToDefaults") {
        TmpFile f(R"({ "model": "m.bin", "decode": { "threads": "many" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.model_path.empty());
        REQUIRE(cfg.decode.n_threads == 4);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.decode.language == "en");
        REQUIRE(cfg.output.format == "text");
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ws_test_nonexistent_config_file.json");
        REQUIRE(cfg.decode.language == "en");
        REQUIRE(cfg.model_path.empty());
    }
}
