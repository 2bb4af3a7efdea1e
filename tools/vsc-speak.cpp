/**
 * @file vsc-speak.cpp
 * @brief vsc-speak - Stream speech from a Kokoro-compatible synthesis service
 *
 * Usage:
 *   vsc-speak --text "Hello there" [options]
 *
 * Options:
 *   --text, -t <text>        Text to speak
 *   --text-file <path>       Read the text from a file ("-" for stdin)
 *   --voice, -v <voice>      Voice to mix in; repeatable. Accepts "id",
 *                            "id:weight" or "a(0.6)+b(1.2)"
 *   --speed, -s <x>          Speaking speed, 0.25 - 4.0 (default: 1.0)
 *   --format, -f <fmt>       mp3, wav, opus, flac, aac, pcm (default: mp3)
 *   --output, -o <dir>       Directory the audio file is saved to (default: .)
 *   --no-save                Do not save the audio file
 *   --play                   Play through ALSA while streaming (pcm / wav)
 *   --no-autoplay            With --play, start playback only after download
 *   --device <name>          ALSA output device (default: "default")
 *   --list-voices            Print the service's voices and exit
 *   --list-devices           Print ALSA playback devices and exit
 *   --api-url <url>          Service base URL (default: http://localhost:8880)
 *   --config, -c <path>      JSON config file
 *   --timeout <seconds>      Cancel the generation after this long
 *   --verbose                Enable debug logging
 *   --help, -h               Show this help message
 *
 * Environment Variables:
 *   VSC_API_URL, VSC_API_KEY, VSC_MODEL, VSC_FORMAT, VSC_OUTPUT_DEVICE,
 *   VSC_OUTPUT_DIR, VSC_LOG_LEVEL
 *
 * Example:
 *   vsc-speak -t "Welcome!" -v af_bella:0.6 -v am_adam:1.2 -f wav --play
 */

#include "vsc/audio/vsc_alsa_playback.h"
#include "vsc/config/vsc_config.h"
#include "vsc/core/vsc_error.h"
#include "vsc/core/vsc_events.h"
#include "vsc/core/vsc_logger.h"
#include "vsc/features/session/vsc_generation_session.h"
#include "vsc/features/synthesis/vsc_stream_ingestor.h"
#include "vsc/features/voice/vsc_voice_catalog.h"
#include "vsc/features/voice/vsc_voice_selection.h"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// =============================================================================
// SIGNAL HANDLING
// =============================================================================

static volatile sig_atomic_t g_interrupted = 0;

static void signalHandler(int signum) {
    (void)signum;
    g_interrupted = 1;
}

// =============================================================================
// ARGUMENT PARSING
// =============================================================================

struct SpeakOptions {
    std::string text;
    std::string textFile;
    std::vector<std::string> voices;
    double speed = 1.0;
    bool speedSet = false;
    std::string format;
    std::string outputDir;
    std::string device;
    std::string apiUrl;
    std::string configPath;
    double timeoutSec = 0.0;
    bool save = true;
    bool play = false;
    bool noAutoplay = false;
    bool listVoices = false;
    bool listDevices = false;
    bool verbose = false;
    bool showHelp = false;
};

static void printUsage(const char* programName) {
    printf("vsc-speak - Stream speech from a Kokoro-compatible synthesis service\n\n");
    printf("Usage: %s --text <text> [options]\n\n", programName);
    printf("Input:\n");
    printf("  --text, -t <text>        Text to speak\n");
    printf("  --text-file <path>       Read the text from a file (\"-\" for stdin)\n\n");
    printf("Options:\n");
    printf("  --voice, -v <voice>      Voice to mix in; repeatable (id, id:weight, a(0.6)+b(1.2))\n");
    printf("  --speed, -s <x>          Speaking speed, 0.25 - 4.0 (default: 1.0)\n");
    printf("  --format, -f <fmt>       mp3, wav, opus, flac, aac, pcm (default: mp3)\n");
    printf("  --output, -o <dir>       Directory the audio file is saved to (default: .)\n");
    printf("  --no-save                Do not save the audio file\n");
    printf("  --play                   Play through ALSA while streaming (pcm / wav)\n");
    printf("  --no-autoplay            With --play, start playback only after download\n");
    printf("  --device <name>          ALSA output device (default: \"default\")\n");
    printf("  --list-voices            Print the service's voices and exit\n");
    printf("  --list-devices           Print ALSA playback devices and exit\n");
    printf("  --api-url <url>          Service base URL (default: %s)\n", vsc::DEFAULT_API_URL);
    printf("  --config, -c <path>      JSON config file\n");
    printf("  --timeout <seconds>      Cancel the generation after this long\n");
    printf("  --verbose                Enable debug logging\n");
    printf("  --help, -h               Show this help message\n\n");
    printf("Environment Variables:\n");
    printf("  VSC_API_URL, VSC_API_KEY, VSC_MODEL, VSC_FORMAT, VSC_OUTPUT_DEVICE,\n");
    printf("  VSC_OUTPUT_DIR, VSC_LOG_LEVEL\n\n");
    printf("Example:\n");
    printf("  %s -t \"Welcome!\" -v af_bella:0.6 -v am_adam:1.2 -f wav --play\n", programName);
}

static bool parseArgs(int argc, char* argv[], SpeakOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        auto needValue = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                fprintf(stderr, "Error: %s requires a value\n", name);
                return nullptr;
            }
            return argv[++i];
        };

        if (strcmp(arg, "--text") == 0 || strcmp(arg, "-t") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.text = value;
        } else if (strcmp(arg, "--text-file") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.textFile = value;
        } else if (strcmp(arg, "--voice") == 0 || strcmp(arg, "-v") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.voices.push_back(value);
        } else if (strcmp(arg, "--speed") == 0 || strcmp(arg, "-s") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            char* end = nullptr;
            opts.speed = std::strtod(value, &end);
            opts.speedSet = true;
            if (end == value || *end != '\0') {
                fprintf(stderr, "Error: invalid speed '%s'\n", value);
                return false;
            }
        } else if (strcmp(arg, "--format") == 0 || strcmp(arg, "-f") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.format = value;
        } else if (strcmp(arg, "--output") == 0 || strcmp(arg, "-o") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.outputDir = value;
        } else if (strcmp(arg, "--device") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.device = value;
        } else if (strcmp(arg, "--api-url") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.apiUrl = value;
        } else if (strcmp(arg, "--config") == 0 || strcmp(arg, "-c") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.configPath = value;
        } else if (strcmp(arg, "--timeout") == 0) {
            const char* value = needValue(arg);
            if (!value) return false;
            opts.timeoutSec = std::atof(value);
        } else if (strcmp(arg, "--no-save") == 0) {
            opts.save = false;
        } else if (strcmp(arg, "--play") == 0) {
            opts.play = true;
        } else if (strcmp(arg, "--no-autoplay") == 0) {
            opts.noAutoplay = true;
        } else if (strcmp(arg, "--list-voices") == 0) {
            opts.listVoices = true;
        } else if (strcmp(arg, "--list-devices") == 0) {
            opts.listDevices = true;
        } else if (strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            opts.showHelp = true;
        } else {
            fprintf(stderr, "Error: unknown option '%s'\n", arg);
            return false;
        }
    }
    return true;
}

// =============================================================================
// HELPERS
// =============================================================================

static bool readText(const SpeakOptions& opts, std::string& text) {
    if (opts.textFile.empty()) {
        text = opts.text;
        return true;
    }

    if (opts.textFile == "-") {
        text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }

    std::ifstream file(opts.textFile);
    if (!file.is_open()) {
        VSC_LOG_ERROR("CLI", "Cannot read %s", opts.textFile.c_str());
        return false;
    }
    std::stringstream contents;
    contents << file.rdbuf();
    text = contents.str();
    return true;
}

// "id", "id:weight" or the wire form "a(0.6)+b(1.2)"
static bool parseVoiceArgs(const std::vector<std::string>& args,
                           std::vector<vsc::VoiceWeight>& out) {
    for (const auto& arg : args) {
        std::vector<vsc::VoiceWeight> parsed;
        size_t colon = arg.rfind(':');
        if (arg.find('(') == std::string::npos && colon != std::string::npos) {
            char* end = nullptr;
            std::string weight_text = arg.substr(colon + 1);
            double weight = std::strtod(weight_text.c_str(), &end);
            if (colon == 0 || end == weight_text.c_str() || *end != '\0') {
                fprintf(stderr, "Error: invalid voice '%s'\n", arg.c_str());
                return false;
            }
            parsed.push_back({arg.substr(0, colon), weight});
        } else if (!vsc::VoiceSelection::parse_wire_string(arg, parsed)) {
            fprintf(stderr, "Error: invalid voice '%s'\n", arg.c_str());
            return false;
        }
        out.insert(out.end(), parsed.begin(), parsed.end());
    }
    return true;
}

static void logToStderr(vsc::LogLevel level, const char* category, const char* message,
                        void* /*user_data*/) {
    // Keep the progress line intact
    fprintf(stderr, "\r\033[K[%s][%s] %s\n", vsc::Logger::level_name(level), category, message);
}

static void printEvent(const vsc::SessionEvent& event) {
    switch (event.type) {
        case vsc::SessionEventType::Progress: {
            double fraction = event.progress.fraction();
            if (fraction >= 0.0) {
                fprintf(stderr, "\r\033[KReceiving audio: %llu / %llu bytes (%.0f%%)",
                        static_cast<unsigned long long>(event.progress.loaded),
                        static_cast<unsigned long long>(event.progress.total), fraction * 100.0);
            } else {
                fprintf(stderr, "\r\033[KReceiving audio: %llu bytes",
                        static_cast<unsigned long long>(event.progress.loaded));
            }
            break;
        }
        case vsc::SessionEventType::BufferError:
            VSC_LOG_DEBUG("CLI", "%s", event.message.c_str());
            break;
        case vsc::SessionEventType::StreamComplete:
            fprintf(stderr, "\n");
            break;
        case vsc::SessionEventType::Failed:
            fprintf(stderr, "\n");
            break;
        default:
            VSC_LOG_DEBUG("CLI", "%s %s", vsc::event_type_name(event.type),
                          event.session_id.c_str());
            break;
    }
}

// =============================================================================
// COMMANDS
// =============================================================================

static int listVoices(vsc::HttpVoiceCatalog& catalog) {
    std::vector<std::string> voices;
    vsc_result_t rc = catalog.list_voices(voices);
    if (VSC_FAILED(rc)) {
        fprintf(stderr, "Error: %s\n", catalog.last_error().c_str());
        return 1;
    }
    for (const auto& voice : voices) {
        printf("%s%s\n", voice.c_str(), catalog.has_sample(voice) ? "  (sample)" : "");
    }
    return 0;
}

static int listDevices() {
    for (const auto& device : vsc::AlsaPlayback::list_devices()) {
        printf("%s\n", device.c_str());
    }
    return 0;
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[]) {
    SpeakOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
        return 2;
    }
    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    vsc::Logger::instance().set_callback(logToStderr);

    // Configuration: defaults < file < environment < command line
    vsc::ClientConfig config;
    if (!opts.configPath.empty() && VSC_FAILED(vsc::load_config_file(opts.configPath, config))) {
        return 2;
    }
    vsc::apply_env_overrides(config);

    if (!opts.apiUrl.empty()) config.api_url = opts.apiUrl;
    if (!opts.outputDir.empty()) config.output_dir = opts.outputDir;
    if (!opts.device.empty()) config.output_device = opts.device;
    if (opts.noAutoplay) config.autoplay = false;
    if (opts.speedSet) config.speed = opts.speed;
    if (!opts.format.empty() && VSC_FAILED(vsc::parse_audio_format(opts.format, config.format))) {
        fprintf(stderr, "Error: unknown format '%s'\n", opts.format.c_str());
        return 2;
    }
    if (opts.verbose) config.log_level = vsc::LogLevel::Debug;
    vsc::Logger::instance().set_min_level(config.log_level);

    if (VSC_FAILED(vsc::validate_config(config))) {
        return 2;
    }

    if (opts.listDevices) {
        return listDevices();
    }

    vsc::HttpVoiceCatalog catalog(config);
    if (VSC_FAILED(catalog.load_sample_manifest(config.sample_manifest))) {
        VSC_LOG_DEBUG("CLI", "No sample manifest: %s", catalog.last_error().c_str());
    }
    if (opts.listVoices) {
        return listVoices(catalog);
    }

    std::string text;
    if (!readText(opts, text)) {
        return 1;
    }

    std::vector<vsc::VoiceWeight> requested;
    if (!parseVoiceArgs(opts.voices, requested)) {
        return 2;
    }

    // The service's catalog decides which voices are valid
    std::vector<std::string> known;
    if (VSC_FAILED(catalog.list_voices(known))) {
        if (requested.empty()) {
            fprintf(stderr, "Error: %s\n", catalog.last_error().c_str());
            return 1;
        }
        VSC_LOG_WARNING("CLI", "Voice list unavailable, trusting --voice: %s",
                        catalog.last_error().c_str());
        for (const auto& entry : requested) {
            known.push_back(entry.voice);
        }
    }

    vsc::VoiceSelection selection(known);
    if (requested.empty() && !known.empty()) {
        selection.add(known.front());
        VSC_LOG_INFO("CLI", "No voice given, using %s", known.front().c_str());
    }
    for (const auto& entry : requested) {
        if (!selection.add(entry.voice, entry.weight)) {
            fprintf(stderr, "Error: unknown voice '%s' (see --list-voices)\n",
                    entry.voice.c_str());
            return 2;
        }
    }

    std::unique_ptr<vsc::AlsaPlayback> playback;
    if (opts.play) {
        if (vsc::AlsaPlayback::supports_format(config.format)) {
            vsc::AlsaPlaybackConfig audio_config;
            audio_config.device = config.output_device;
            playback = std::make_unique<vsc::AlsaPlayback>(config.format, audio_config);
        } else {
            VSC_LOG_WARNING("CLI", "Playback needs --format pcm or wav; saving only");
        }
    }

    vsc::EventBus events;
    events.subscribe(printEvent);

    vsc::HttpStreamIngestor ingestor(config);
    vsc::GenerationSession session(config, ingestor, events, playback.get(), playback.get());

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    vsc_result_t rc = session.start(text, selection, config.speed);
    if (VSC_FAILED(rc)) {
        fprintf(stderr, "Error: %s\n", session.last_error().c_str());
        return 2;
    }

    auto started = std::chrono::steady_clock::now();
    while (!session.wait_for(std::chrono::milliseconds(100))) {
        if (g_interrupted) {
            fprintf(stderr, "\nInterrupted, cancelling...\n");
            session.cancel();
        } else if (opts.timeoutSec > 0.0 &&
                   std::chrono::steady_clock::now() - started >
                       std::chrono::duration<double>(opts.timeoutSec)) {
            VSC_LOG_WARNING("CLI", "Timed out after %.1f s, cancelling", opts.timeoutSec);
            session.cancel();
        }
    }

    vsc::SessionState state = session.state();
    if (state == vsc::SessionState::Cancelled) {
        return 130;
    }
    if (state == vsc::SessionState::Failed) {
        fprintf(stderr, "Error: %s\n", session.last_error().c_str());
        return 1;
    }

    auto artifact = session.artifact();
    if (opts.save && artifact) {
        std::string filename = vsc::make_download_filename(
            session.voice_wire_string(), config.format, std::chrono::system_clock::now());
        std::string path = config.output_dir;
        if (!path.empty() && path.back() != '/') path += '/';
        path += filename;
        if (VSC_FAILED(vsc::write_artifact(*artifact, path))) {
            return 1;
        }
        printf("%s\n", path.c_str());
    }

    if (playback) {
        if (!session.is_playing() && !config.autoplay) {
            session.play();
        }
        while (session.is_playing() && !g_interrupted) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        session.pause();
    }

    return 0;
}
