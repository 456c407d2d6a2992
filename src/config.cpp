#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key)) out = obj[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        read_key(j, "model", cfg.model_path);

        if (j.contains("engine")) {
            auto& e = j["engine"];
            read_key(e, "use_gpu", cfg.engine.use_gpu);
            read_key(e, "gpu_device", cfg.engine.gpu_device);
            read_key(e, "flash_attn", cfg.engine.flash_attn);
        }

        if (j.contains("decode")) {
            auto& d = j["decode"];
            if (d.contains("strategy")) {
                auto s = d["strategy"].get<std::string>();
                if (s == "beam_search") {
                    cfg.decode.strategy = SamplingStrategy::BeamSearch;
                } else if (s == "greedy") {
                    cfg.decode.strategy = SamplingStrategy::Greedy;
                } else {
                    std::println(stderr, "config: unknown strategy '{}', using greedy", s);
                }
            }
            read_key(d, "threads", cfg.decode.n_threads);
            read_key(d, "language", cfg.decode.language);
            read_key(d, "translate", cfg.decode.translate);
            read_key(d, "no_context", cfg.decode.no_context);
            read_key(d, "single_segment", cfg.decode.single_segment);
            read_key(d, "no_timestamps", cfg.decode.no_timestamps);
            read_key(d, "token_timestamps", cfg.decode.token_timestamps);
            read_key(d, "max_len", cfg.decode.max_len);
            read_key(d, "split_on_word", cfg.decode.split_on_word);
            read_key(d, "offset_ms", cfg.decode.offset_ms);
            read_key(d, "duration_ms", cfg.decode.duration_ms);
            read_key(d, "temperature", cfg.decode.temperature);
            read_key(d, "suppress_blank", cfg.decode.suppress_blank);
            read_key(d, "initial_prompt", cfg.decode.initial_prompt);
            read_key(d, "best_of", cfg.decode.best_of);
            read_key(d, "beam_size", cfg.decode.beam_size);
        }

        if (j.contains("output")) {
            read_key(j["output"], "format", cfg.output.format);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
