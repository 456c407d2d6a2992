#pragma once

#include "engine/engine.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct Segment {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string text;

    bool operator==(const Segment&) const = default;
};

// Engine timestamps are in units of 10 ms.
inline Segment to_segment(const NativeSegment& native) {
    return Segment{
        .start_ms = native.t0 * 10,
        .end_ms = native.t1 * 10,
        .text = native.text,
    };
}

// Reads segments [first, last) from the engine.
inline std::vector<Segment> read_segments(const Engine& engine, int first, int last) {
    std::vector<Segment> out;
    if (last <= first) return out;
    out.reserve(static_cast<size_t>(last - first));
    for (int i = first; i < last; ++i) {
        out.push_back(to_segment(engine.segment(i)));
    }
    return out;
}
