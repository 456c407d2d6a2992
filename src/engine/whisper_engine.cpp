#include "engine/whisper_engine.hpp"

#include <print>
#include <vector>
#include <whisper.h>

static_assert(ENGINE_SAMPLE_RATE == WHISPER_SAMPLE_RATE);

namespace {

whisper_context_params to_whisper(const WhisperEngine::ContextParams& p) {
    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = p.use_gpu;
    cparams.gpu_device = p.gpu_device;
    cparams.flash_attn = p.flash_attn;
    return cparams;
}

// whisper.cpp hands back the user data we registered; for every slot that is
// the DecodeParams of the current call, which outlives whisper_full().
void forward_new_segment(whisper_context*, whisper_state*, int n_new, void* user_data) {
    auto* p = static_cast<const DecodeParams*>(user_data);
    if (p->new_segment_callback) p->new_segment_callback(n_new, p->new_segment_user_data);
}

bool forward_encoder_begin(whisper_context*, whisper_state*, void* user_data) {
    auto* p = static_cast<const DecodeParams*>(user_data);
    if (!p->continue_callback) return true;
    return p->continue_callback(p->continue_user_data);
}

bool forward_abort(void* user_data) {
    auto* p = static_cast<const DecodeParams*>(user_data);
    if (!p->continue_callback) return false;
    return !p->continue_callback(p->continue_user_data);
}

void log_to_stderr(ggml_log_level /*level*/, const char* text, void* /*user_data*/) {
    std::print(stderr, "{}", text);
}

void log_discard(ggml_log_level /*level*/, const char* /*text*/, void* /*user_data*/) {}

} // namespace

WhisperEngine::WhisperEngine(whisper_context* ctx) : context_(ctx) {}

WhisperEngine::~WhisperEngine() {
    if (context_) whisper_free(context_);
}

std::expected<std::unique_ptr<WhisperEngine>, std::string>
WhisperEngine::from_file(const std::string& model_path, const ContextParams& cparams) {
    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), to_whisper(cparams));
    if (!ctx) {
        return std::unexpected("failed to load model: " + model_path);
    }
    return std::unique_ptr<WhisperEngine>(new WhisperEngine(ctx));
}

std::expected<std::unique_ptr<WhisperEngine>, std::string>
WhisperEngine::from_buffer(std::span<const uint8_t> model_data, const ContextParams& cparams) {
    if (model_data.empty()) {
        return std::unexpected("empty model buffer");
    }

    std::vector<uint8_t> copy(model_data.begin(), model_data.end());
    whisper_context* ctx = whisper_init_from_buffer_with_params(copy.data(), copy.size(),
                                                                to_whisper(cparams));
    if (!ctx) {
        return std::unexpected("failed to load model from buffer");
    }
    return std::unique_ptr<WhisperEngine>(new WhisperEngine(ctx));
}

int WhisperEngine::run_full(std::span<const float> samples, const DecodeParams& params) {
    whisper_full_params wparams = whisper_full_default_params(
        params.strategy == SamplingStrategy::BeamSearch ? WHISPER_SAMPLING_BEAM_SEARCH
                                                        : WHISPER_SAMPLING_GREEDY);

    wparams.n_threads = params.n_threads;
    wparams.language = params.language.c_str();
    wparams.translate = params.translate;
    wparams.no_context = params.no_context;
    wparams.single_segment = params.single_segment;
    wparams.no_timestamps = params.no_timestamps;
    wparams.token_timestamps = params.token_timestamps;
    wparams.max_len = params.max_len;
    wparams.split_on_word = params.split_on_word;
    wparams.offset_ms = params.offset_ms;
    wparams.duration_ms = params.duration_ms;
    wparams.temperature = params.temperature;
    wparams.suppress_blank = params.suppress_blank;
    wparams.initial_prompt = params.initial_prompt.empty() ? nullptr : params.initial_prompt.c_str();
    wparams.greedy.best_of = params.best_of;
    wparams.beam_search.beam_size = params.beam_size;

    wparams.print_progress = false;
    wparams.print_realtime = false;
    wparams.print_special = false;
    wparams.print_timestamps = false;

    void* user_data = const_cast<DecodeParams*>(&params);

    wparams.new_segment_callback = forward_new_segment;
    wparams.new_segment_callback_user_data = user_data;

    // Continuation is polled before each encoder pass and, more often, by
    // ggml between graph computations.
    wparams.encoder_begin_callback = forward_encoder_begin;
    wparams.encoder_begin_callback_user_data = user_data;
    wparams.abort_callback = forward_abort;
    wparams.abort_callback_user_data = user_data;

    return whisper_full(context_, wparams, samples.data(), static_cast<int>(samples.size()));
}

int WhisperEngine::segment_count() const {
    return whisper_full_n_segments(context_);
}

NativeSegment WhisperEngine::segment(int index) const {
    const char* text = whisper_full_get_segment_text(context_, index);
    return NativeSegment{
        .t0 = whisper_full_get_segment_t0(context_, index),
        .t1 = whisper_full_get_segment_t1(context_, index),
        .text = text ? text : "",
    };
}

void WhisperEngine::set_log_verbose(bool verbose) {
    whisper_log_set(verbose ? log_to_stderr : log_discard, nullptr);
}
