/**
 * @file vsc-voice-samples.cpp
 * @brief vsc-voice-samples - Pre-generate a preview sample for every voice
 *
 * Usage:
 *   vsc-voice-samples [options]
 *
 * Options:
 *   --api-url <url>          Service base URL (default: http://localhost:8880)
 *   --output-dir, -o <dir>   Where samples are written (default: voice_samples)
 *   --format, -f <fmt>       Sample format (default: mp3)
 *   --text, -t <text>        Sample sentence
 *   --batch-size, -b <n>     Parallel requests (default: 3, keep low for CPU)
 *   --force                  Regenerate samples that already exist
 *   --config, -c <path>      JSON config file
 *   --verbose                Enable debug logging
 *   --help, -h               Show this help message
 *
 * Each voice is written to <output-dir>/<voice>.<fmt>. Existing non-empty
 * files are skipped. A manifest.json listing every voice that has a sample
 * is written at the end.
 */

#include "vsc/config/vsc_config.h"
#include "vsc/core/vsc_error.h"
#include "vsc/core/vsc_events.h"
#include "vsc/core/vsc_logger.h"
#include "vsc/features/session/vsc_generation_session.h"
#include "vsc/features/synthesis/vsc_stream_ingestor.h"
#include "vsc/features/voice/vsc_voice_catalog.h"
#include "vsc/features/voice/vsc_voice_selection.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static const char* const SAMPLE_TEXT = "Hello Everyone, Welcome to Dexterous!";

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

struct SampleOptions {
    std::string apiUrl;
    std::string outputDir = "voice_samples";
    std::string format;
    std::string text = SAMPLE_TEXT;
    std::string configPath;
    int batchSize = 3;
    bool force = false;
    bool verbose = false;
    bool showHelp = false;
};

static void printUsage(const char* programName) {
    printf("vsc-voice-samples - Pre-generate a preview sample for every voice\n\n");
    printf("Usage: %s [options]\n\n", programName);
    printf("Options:\n");
    printf("  --api-url <url>          Service base URL (default: %s)\n", vsc::DEFAULT_API_URL);
    printf("  --output-dir, -o <dir>   Where samples are written (default: voice_samples)\n");
    printf("  --format, -f <fmt>       Sample format (default: mp3)\n");
    printf("  --text, -t <text>        Sample sentence (default: \"%s\")\n", SAMPLE_TEXT);
    printf("  --batch-size, -b <n>     Parallel requests (default: 3, keep low for CPU)\n");
    printf("  --force                  Regenerate samples that already exist\n");
    printf("  --config, -c <path>      JSON config file\n");
    printf("  --verbose                Enable debug logging\n");
    printf("  --help, -h               Show this help message\n");
}

static bool parseArgs(int argc, char* argv[], SampleOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (strcmp(arg, "--api-url") == 0 && hasValue) {
            opts.apiUrl = argv[++i];
        } else if ((strcmp(arg, "--output-dir") == 0 || strcmp(arg, "-o") == 0) && hasValue) {
            opts.outputDir = argv[++i];
        } else if ((strcmp(arg, "--format") == 0 || strcmp(arg, "-f") == 0) && hasValue) {
            opts.format = argv[++i];
        } else if ((strcmp(arg, "--text") == 0 || strcmp(arg, "-t") == 0) && hasValue) {
            opts.text = argv[++i];
        } else if ((strcmp(arg, "--batch-size") == 0 || strcmp(arg, "-b") == 0) && hasValue) {
            opts.batchSize = std::atoi(argv[++i]);
        } else if ((strcmp(arg, "--config") == 0 || strcmp(arg, "-c") == 0) && hasValue) {
            opts.configPath = argv[++i];
        } else if (strcmp(arg, "--force") == 0) {
            opts.force = true;
        } else if (strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            opts.showHelp = true;
        } else {
            fprintf(stderr, "Error: unknown option or missing value '%s'\n", arg);
            return false;
        }
    }
    if (opts.batchSize < 1) {
        fprintf(stderr, "Error: --batch-size must be at least 1\n");
        return false;
    }
    return true;
}

// =============================================================================
// GENERATION
// =============================================================================

enum class SampleStatus { Generated, Skipped, Error };

struct SampleResult {
    SampleStatus status = SampleStatus::Error;
    size_t bytes = 0;
    std::string error;
};

static bool hasSample(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::file_size(path, ec) > 0 && !ec;
}

static SampleResult generateSample(const vsc::ClientConfig& config,
                                   vsc::StreamIngestor& ingestor, const std::string& voice,
                                   const std::string& text, const fs::path& path) {
    SampleResult result;
    if (hasSample(path)) {
        result.status = SampleStatus::Skipped;
        return result;
    }

    vsc::VoiceSelection selection(std::vector<std::string>{voice});
    selection.add(voice);

    vsc::EventBus events;
    vsc::GenerationSession session(config, ingestor, events);

    vsc_result_t rc = session.start(text, selection, 1.0);
    if (VSC_FAILED(rc)) {
        result.error = session.last_error();
        return result;
    }
    while (!session.wait_for(std::chrono::milliseconds(100))) {
        if (g_interrupted) {
            session.cancel();
        }
    }

    auto artifact = session.artifact();
    if (session.state() != vsc::SessionState::Complete || !artifact) {
        result.error = session.state() == vsc::SessionState::Cancelled ? "cancelled"
                                                                        : session.last_error();
        return result;
    }

    if (VSC_FAILED(vsc::write_artifact(*artifact, path.string()))) {
        result.error = "cannot write " + path.string();
        return result;
    }

    result.status = SampleStatus::Generated;
    result.bytes = artifact->size();
    return result;
}

static vsc_result_t writeManifest(const fs::path& dir, const std::vector<std::string>& voices,
                                  vsc::AudioFormat format) {
    nlohmann::json manifest = nlohmann::json::array();
    std::vector<std::string> sorted = voices;
    std::sort(sorted.begin(), sorted.end());
    for (const auto& voice : sorted) {
        if (hasSample(dir / (voice + "." + vsc::audio_format_name(format)))) {
            manifest.push_back(voice);
        }
    }

    fs::path path = dir / "manifest.json";
    std::ofstream file(path);
    if (!file.is_open()) {
        VSC_LOG_ERROR("CLI", "Cannot write %s", path.string().c_str());
        return VSC_ERROR_FILE_WRITE;
    }
    file << manifest.dump(2) << "\n";
    if (!file.good()) {
        return VSC_ERROR_FILE_WRITE;
    }
    printf("Manifest: %s (%zu voices)\n", path.string().c_str(), manifest.size());
    return VSC_SUCCESS;
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[]) {
    SampleOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        fprintf(stderr, "Run '%s --help' for usage\n", argv[0]);
        return 2;
    }
    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    vsc::ClientConfig config;
    if (!opts.configPath.empty() && VSC_FAILED(vsc::load_config_file(opts.configPath, config))) {
        return 2;
    }
    vsc::apply_env_overrides(config);
    if (!opts.apiUrl.empty()) config.api_url = opts.apiUrl;
    if (!opts.format.empty() && VSC_FAILED(vsc::parse_audio_format(opts.format, config.format))) {
        fprintf(stderr, "Error: unknown format '%s'\n", opts.format.c_str());
        return 2;
    }
    config.autoplay = false;
    if (opts.verbose) config.log_level = vsc::LogLevel::Debug;
    vsc::Logger::instance().set_min_level(config.log_level);
    if (VSC_FAILED(vsc::validate_config(config))) {
        return 2;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    printf("Fetching voices from %s...\n", config.api_url.c_str());
    vsc::HttpVoiceCatalog catalog(config);
    std::vector<std::string> voices;
    if (VSC_FAILED(catalog.list_voices(voices))) {
        fprintf(stderr, "ERROR: Could not connect to API at %s: %s\n", config.api_url.c_str(),
                catalog.last_error().c_str());
        fprintf(stderr, "Make sure the synthesis service is running.\n");
        return 1;
    }

    fs::path outputDir(opts.outputDir);
    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        fprintf(stderr, "ERROR: Cannot create %s: %s\n", outputDir.string().c_str(),
                ec.message().c_str());
        return 1;
    }

    const char* extension = vsc::audio_format_name(config.format);
    printf("Found %zu voices\n", voices.size());
    printf("Sample text: \"%s\"\n", opts.text.c_str());
    printf("Output directory: %s\n", outputDir.string().c_str());
    printf("Batch size: %d\n\n", opts.batchSize);

    if (opts.force) {
        for (const auto& voice : voices) {
            fs::remove(outputDir / (voice + "." + extension), ec);
        }
        printf("Cleared existing samples (--force)\n");
    }

    vsc::HttpStreamIngestor ingestor(config);
    std::atomic<size_t> nextIndex{0};
    std::mutex printMutex;
    size_t done = 0;
    size_t generated = 0;
    size_t skipped = 0;
    size_t errors = 0;
    auto started = std::chrono::steady_clock::now();

    auto worker = [&]() {
        while (!g_interrupted) {
            size_t index = nextIndex.fetch_add(1);
            if (index >= voices.size()) return;

            const std::string& voice = voices[index];
            fs::path path = outputDir / (voice + "." + extension);
            SampleResult result = generateSample(config, ingestor, voice, opts.text, path);

            std::lock_guard<std::mutex> lock(printMutex);
            ++done;
            switch (result.status) {
                case SampleStatus::Generated:
                    ++generated;
                    printf("  [%zu/%zu] %s - %.1f KB\n", done, voices.size(), voice.c_str(),
                           result.bytes / 1024.0);
                    break;
                case SampleStatus::Skipped:
                    ++skipped;
                    printf("  [%zu/%zu] %s - skipped (exists)\n", done, voices.size(),
                           voice.c_str());
                    break;
                case SampleStatus::Error:
                    ++errors;
                    printf("  [%zu/%zu] %s - ERROR: %s\n", done, voices.size(), voice.c_str(),
                           result.error.c_str());
                    break;
            }
        }
    };

    std::vector<std::thread> workers;
    size_t workerCount = std::min(static_cast<size_t>(opts.batchSize), voices.size());
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started)
                         .count();
    printf("\nDone in %.1fs\n", elapsed);
    printf("  Generated: %zu\n", generated);
    printf("  Skipped:   %zu\n", skipped);
    printf("  Errors:    %zu\n", errors);
    printf("  Total:     %zu\n", done);

    if (VSC_FAILED(writeManifest(outputDir, voices, config.format))) {
        return 1;
    }
    return errors == 0 && !g_interrupted ? 0 : 1;
}
