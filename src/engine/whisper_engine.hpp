#pragma once

#include "engine/engine.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>

struct whisper_context;

class WhisperEngine : public Engine {
public:
    struct ContextParams {
        bool use_gpu = true;
        int gpu_device = 0;
        bool flash_attn = false;
    };

    static std::expected<std::unique_ptr<WhisperEngine>, std::string>
        from_file(const std::string& model_path, const ContextParams& cparams);

    // The model bytes are copied before loading.
    static std::expected<std::unique_ptr<WhisperEngine>, std::string>
        from_buffer(std::span<const uint8_t> model_data, const ContextParams& cparams);

    ~WhisperEngine() override;

    WhisperEngine(const WhisperEngine&) = delete;
    WhisperEngine& operator=(const WhisperEngine&) = delete;

    int run_full(std::span<const float> samples, const DecodeParams& params) override;
    int segment_count() const override;
    NativeSegment segment(int index) const override;

    // whisper.cpp and ggml log to stderr unless silenced.
    static void set_log_verbose(bool verbose);

private:
    explicit WhisperEngine(whisper_context* ctx);

    whisper_context* context_ = nullptr;
};
