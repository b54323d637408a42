/**
 * Live Lyrics Translator - Main Entry Point
 *
 * Listens to a song (microphone or audio file), follows along in the lyrics
 * and prints each recognized line with its translation.
 */

#include "llt/App.hpp"
#include "llt/Config.hpp"
#include "llt/audio/AudioEngine.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted = true;
}

struct CliOptions {
    llt::AppConfig app;
    llt::TranscriberConfig transcriber;
    bool list_devices = false;
};

void printUsage(const char* argv0) {
    llt::AppConfig app;
    llt::TranscriberConfig tc;

    fprintf(stderr, "\n");
    fprintf(stderr, "usage: %s --artist NAME --title TITLE [options]\n", argv0);
    fprintf(stderr, "\n");
    fprintf(stderr, "options:\n");
    fprintf(stderr, "  -h,       --help                show this help message and exit\n");
    fprintf(stderr, "  -a NAME,  --artist NAME         artist name for lyric lookup\n");
    fprintf(stderr, "  -t TITLE, --title TITLE         song title for lyric lookup\n");
    fprintf(stderr, "  -tl LANG, --target LANG         [%-7s] target language (ISO-639-1)\n", app.target_language.c_str());
    fprintf(stderr, "  -lf PATH, --lyrics-file PATH    local lyrics file, skips the HTTP lookup\n");
    fprintf(stderr, "  -af PATH, --audio-file PATH     follow an audio file (WAV, MP3, FLAC, ...) instead of the microphone\n");
    fprintf(stderr, "  -m PATH,  --model PATH          [%-7s] whisper model file\n", tc.model_path.c_str());
    fprintf(stderr, "  -ms SIZE, --model-size SIZE     use models/ggml-SIZE.bin (tiny, base, small, medium, large-v2)\n");
    fprintf(stderr, "  -d DEV,   --device DEV          [%-7s] auto, cpu, cuda or gpu\n", "auto");
    fprintf(stderr, "  -th N,    --threads N           [%-7d] whisper threads\n", tc.n_threads);
    fprintf(stderr, "  -l LANG,  --language LANG       [%-7s] spoken language, 'auto' to detect\n", tc.language.c_str());
    fprintf(stderr, "  -cd SEC,  --chunk-duration SEC  [%-7.1f] seconds of audio per transcription\n", tc.chunk_duration);
    fprintf(stderr, "  -r N,     --min-ratio N         [%-7.2f] minimum similarity to accept a line\n", app.min_ratio);
    fprintf(stderr, "  -c ID,    --capture ID          [%-7d] capture device index\n", tc.input_device);
    fprintf(stderr, "            --list-devices        list capture devices and exit\n");
    fprintf(stderr, "  -v,       --verbose             log every transcript and its best line\n");
    fprintf(stderr, "\n");
}

bool parseArgs(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto needValue = [&]() -> bool {
            if (i + 1 >= argc) {
                fprintf(stderr, "error: %s needs a value\n", arg.c_str());
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        }
        else if (arg == "--list-devices")                     { opts.list_devices = true; }
        else if (arg == "-v"  || arg == "--verbose")          { opts.app.verbose = true; }
        else if (!needValue())                                { return false; }
        else if (arg == "-a"  || arg == "--artist")           { opts.app.artist = argv[++i]; }
        else if (arg == "-t"  || arg == "--title")            { opts.app.title = argv[++i]; }
        else if (arg == "-tl" || arg == "--target")           { opts.app.target_language = argv[++i]; }
        else if (arg == "-lf" || arg == "--lyrics-file")      { opts.app.lyrics_file = argv[++i]; }
        else if (arg == "-af" || arg == "--audio-file")       { opts.app.audio_file = argv[++i]; }
        else if (arg == "-m"  || arg == "--model")            { opts.transcriber.model_path = argv[++i]; }
        else if (arg == "-ms" || arg == "--model-size")       { opts.transcriber.model_path = std::string("models/ggml-") + argv[++i] + ".bin"; }
        else if (arg == "-th" || arg == "--threads")          { opts.transcriber.n_threads = std::stoi(argv[++i]); }
        else if (arg == "-l"  || arg == "--language")         { opts.transcriber.language = argv[++i]; }
        else if (arg == "-cd" || arg == "--chunk-duration")   { opts.transcriber.chunk_duration = std::stod(argv[++i]); }
        else if (arg == "-r"  || arg == "--min-ratio")        { opts.app.min_ratio = std::stod(argv[++i]); }
        else if (arg == "-c"  || arg == "--capture")          { opts.transcriber.input_device = std::stoi(argv[++i]); }
        else if (arg == "-d"  || arg == "--device") {
            std::string device = argv[++i];
            if (device == "cpu") {
                opts.transcriber.use_gpu = false;
            } else if (device == "auto" || device == "cuda" || device == "gpu") {
                opts.transcriber.use_gpu = true;
            } else {
                fprintf(stderr, "error: unknown device '%s'\n", device.c_str());
                return false;
            }
        }
        else {
            fprintf(stderr, "error: unknown argument: %s\n", arg.c_str());
            printUsage(argv[0]);
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;

    try {
        if (!parseArgs(argc, argv, opts)) {
            return 1;
        }
    } catch (const std::exception& e) {
        // std::stoi / std::stod
        std::cerr << "error: invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    if (opts.list_devices) {
        auto devices = llt::audio::AudioEngine::listInputDevices();
        std::cout << "Capture devices:" << std::endl;
        for (const auto& device : devices) {
            std::cout << "  " << device << std::endl;
        }
        return 0;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        llt::App app(opts.transcriber);
        return app.run(opts.app, g_interrupted);
    } catch (const std::exception& e) {
        std::cerr << "[App] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
