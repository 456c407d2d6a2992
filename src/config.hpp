#pragma once

#include "engine/engine.hpp"
#include "engine/whisper_engine.hpp"

#include <string>

struct Config {
    std::string model_path;

    WhisperEngine::ContextParams engine;
    DecodeParams decode;

    struct Output {
        std::string format = "text"; // "text" or "json"
    } output;

    static Config load(const std::string& path);
    static Config load_default();
};
