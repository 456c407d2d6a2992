#pragma once

#include <cstdint>
#include <span>
#include <string>

// Fixed input rate of the recognition engine. Progress estimates derive the
// audio duration from the sample count and this rate.
inline constexpr uint32_t ENGINE_SAMPLE_RATE = 16000;

// Native callback slots. Invoked from whatever thread the engine runs its
// decoder on; user_data is passed back untouched.
using ContinueCallback = bool (*)(void* user_data);
using NewSegmentCallback = void (*)(int n_new, void* user_data);

enum class SamplingStrategy { Greedy, BeamSearch };

// Parameter bundle copied into every engine call.
struct DecodeParams {
    SamplingStrategy strategy = SamplingStrategy::Greedy;
    int n_threads = 4;
    std::string language = "en";
    bool translate = false;
    bool no_context = true;
    bool single_segment = false;
    bool no_timestamps = false;
    bool token_timestamps = false;
    int max_len = 0;            // 0 = unlimited
    bool split_on_word = false;
    int offset_ms = 0;
    int duration_ms = 0;        // 0 = whole buffer
    float temperature = 0.0f;
    bool suppress_blank = true;
    std::string initial_prompt;
    int best_of = 5;            // greedy
    int beam_size = 5;          // beam search

    ContinueCallback continue_callback = nullptr;
    void* continue_user_data = nullptr;
    NewSegmentCallback new_segment_callback = nullptr;
    void* new_segment_user_data = nullptr;
};

// A decoded segment as the engine reports it, times in centiseconds.
struct NativeSegment {
    int64_t t0 = 0;
    int64_t t1 = 0;
    std::string text;
};

class Engine {
public:
    virtual ~Engine() = default;

    // Blocks until decoding finishes or the continuation callback denies.
    // Returns the engine's status code (0 on success).
    virtual int run_full(std::span<const float> samples, const DecodeParams& params) = 0;

    // Segments of the most recent (or in-flight) run_full call.
    virtual int segment_count() const = 0;
    virtual NativeSegment segment(int index) const = 0;
};
