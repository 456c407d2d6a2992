#include "config.hpp"
#include "engine/whisper_engine.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "session_controller.hpp"
#include "wav_decoder.hpp"

#include <cstdint>
#include <cstdlib>
#include <format>
#include <memory>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

std::string format_timestamp(int64_t ms) {
    int64_t min = ms / 60000;
    int64_t sec = (ms / 1000) % 60;
    int64_t msec = ms % 1000;
    return std::format("{:02}:{:02}.{:03}", min, sec, msec);
}

void print_segment(const Segment& s) {
    std::println("[{} --> {}] {}", format_timestamp(s.start_ms), format_timestamp(s.end_ms), s.text);
}

class ConsoleObserver : public TranscriptionObserver {
public:
    explicit ConsoleObserver(bool stream_segments) : stream_segments_(stream_segments) {}

    void on_progress(double fraction) override {
        std::print(stderr, "\rprogress: {:3.0f}%", fraction * 100.0);
    }

    void on_new_segments(const std::vector<Segment>& segments, int /*start_index*/) override {
        if (!stream_segments_) return;
        std::print(stderr, "\r");
        for (auto& s : segments) print_segment(s);
    }

    void on_error(TranscriptionError error) override {
        std::println(stderr, "\ntranscription stopped: {}", error_message(error));
    }

private:
    bool stream_segments_;
};

void usage(const char* prog) {
    std::println("Usage: {} [options] <file.wav>", prog);
    std::println("Options:");
    std::println("  -m, --model PATH      whisper.cpp model file");
    std::println("  -c, --config PATH     Config file path");
    std::println("  -t, --threads N       Decoder threads");
    std::println("  -l, --language LANG   Spoken language (\"auto\" to detect)");
    std::println("      --translate       Translate to English");
    std::println("      --json            Print the result as JSON");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -h, --help            Show this help");
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string model_path;
    std::string audio_path;
    std::string language;
    int threads = 0;
    bool translate = false;
    bool as_json = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((arg == "--model" || arg == "-m") && i + 1 < argc) {
            model_path = argv[++i];
        } else if ((arg == "--threads" || arg == "-t") && i + 1 < argc) {
            threads = std::atoi(argv[++i]);
        } else if ((arg == "--language" || arg == "-l") && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--translate") {
            translate = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        } else {
            audio_path = arg;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!model_path.empty()) config.model_path = model_path;
    if (threads > 0) config.decode.n_threads = threads;
    if (!language.empty()) config.decode.language = language;
    if (translate) config.decode.translate = true;
    if (as_json) config.output.format = "json";

    if (audio_path.empty() || config.model_path.empty()) {
        usage(argv[0]);
        return 1;
    }

    auto audio = wav::read_file(audio_path);
    if (!audio) {
        std::println(stderr, "{}: {}", audio_path, audio.error());
        return 1;
    }
    if (audio->sample_rate != ENGINE_SAMPLE_RATE) {
        std::println(stderr, "{}: sample rate {} Hz, expected {} Hz",
                     audio_path, audio->sample_rate, ENGINE_SAMPLE_RATE);
        return 1;
    }

    WhisperEngine::set_log_verbose(verbose);
    auto engine = WhisperEngine::from_file(config.model_path, config.engine);
    if (!engine) {
        std::println(stderr, "{}", engine.error());
        return 1;
    }

    auto loop = std::make_shared<LinuxEventLoop>(verbose);
    if (!loop->init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    bool json_output = config.output.format == "json";
    auto controller = SessionController::create(std::move(*engine), loop, config.decode, verbose);
    controller->set_observer(std::make_shared<ConsoleObserver>(!json_output));

    // First signal cancels the session, a second one gives up waiting.
    loop->set_signal_handler([&loop, &controller](int /*signo*/) {
        auto res = controller->cancel([] { std::println(stderr, "\ncancelling..."); });
        if (!res) {
            std::println(stderr, "\n{}, exiting", error_message(res.error()));
            loop->request_stop();
        }
    });

    int exit_code = 0;
    auto accepted = controller->transcribe(std::move(audio->samples),
        [&](SessionController::TranscribeResult result) {
            if (!result) {
                exit_code = result.error() == TranscriptionError::Cancelled ? 2 : 1;
                loop->request_stop();
                return;
            }

            std::print(stderr, "\r");
            if (json_output) {
                json out = {{"segments", json::array()}};
                std::string text;
                for (auto& s : *result) {
                    out["segments"].push_back({
                        {"start_ms", s.start_ms},
                        {"end_ms", s.end_ms},
                        {"text", s.text},
                    });
                    text += s.text;
                }
                out["text"] = text;
                std::println("{}", out.dump(2));
            }
            loop->request_stop();
        });

    if (!accepted) {
        std::println(stderr, "{}", error_message(accepted.error()));
        return 1;
    }

    loop->run();

    if (controller->in_progress()) {
        // The engine never reached a continuation check; don't wait for it.
        std::_Exit(130);
    }
    return exit_code;
}
