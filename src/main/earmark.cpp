#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fftw3.h>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "../audio/AudioLoader.h"
#include "../core/Config.h"
#include "../library/TrackLibrary.h"

void printUsage(const std::string& programName) {
    std::cout << "Usage: " << programName << " [command] [options]" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  register <directory>   - Register all tracks in directory" << std::endl;
    std::cout << "  recognize <file>       - Identify a recording" << std::endl;
    std::cout << "  stats                  - Show database statistics" << std::endl;
    std::cout << "  fingerprint <file>     - Generate fingerprints (no database)" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --workers <num>        - Number of worker threads (default: auto)" << std::endl;
    std::cout << "  --db <path>            - Database path (default: $" << Earmark::DB_PATH_ENV
              << " or " << Earmark::DEFAULT_DB_PATH << ")" << std::endl;
    std::cout << "  --config <file.json>   - Tuning parameters (default: $" << Earmark::CONFIG_PATH_ENV << ")" << std::endl;
}

int runFingerprint(const std::string& filename, const Earmark::FingerprintConfig& config) {
    std::cout << "Generating fingerprints for: " << filename << std::endl;

    auto startTime = std::chrono::high_resolution_clock::now();

    Earmark::Recognizer recognizer(config);
    Earmark::AudioBuffer audio = Earmark::loadAudioFile(filename, config.sampleRate);
    std::cout << "  Loaded audio: " << audio.samples.size() << " samples ("
              << audio.durationSeconds() << " s)" << std::endl;

    std::vector<Earmark::HashEntry> hashes = recognizer.fingerprint(audio.samples, audio.sampleRate);

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

    std::cout << std::string(50, '=') << std::endl;
    std::cout << "FINGERPRINT RESULT" << std::endl;
    std::cout << std::string(50, '=') << std::endl;
    std::cout << "Generated " << hashes.size() << " hashes in " << duration.count() << " ms" << std::endl;

    if (!hashes.empty()) {
        std::cout << "\nSample hashes:" << std::endl;
        for (size_t i = 0; i < std::min(size_t(10), hashes.size()); i++) {
            std::cout << "  " << hashes[i].toString() << std::endl;
        }
    }
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        if (argc < 2) {
            printUsage(argv[0]);
            return 1;
        }

        std::string command = argv[1];
        std::string dbPath = Earmark::getEnvOr(Earmark::DB_PATH_ENV, Earmark::DEFAULT_DB_PATH);
        std::string configPath = Earmark::getEnvOr(Earmark::CONFIG_PATH_ENV, "");
        int numWorkers = static_cast<int>(std::thread::hardware_concurrency());
        std::string target;

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--workers" && i + 1 < argc) {
                numWorkers = std::stoi(argv[++i]);
            } else if (arg == "--db" && i + 1 < argc) {
                dbPath = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (target.empty()) {
                target = arg;
            } else {
                std::cerr << "Error: Unexpected argument: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        }

        Earmark::FingerprintConfig config;
        if (!configPath.empty()) {
            config = Earmark::loadConfigFile(configPath);
        }
        config.validate();

        std::cout << "Earmark audio identification" << std::endl;
        std::cout << "Using " << numWorkers << " worker threads" << std::endl;
        std::cout << "Database: " << dbPath << std::endl;
        if (!configPath.empty()) {
            std::cout << "Config: " << configPath << std::endl;
        }
        std::cout << std::string(50, '=') << std::endl;

        int status = 0;

        if (command == "register") {
            if (target.empty()) {
                std::cerr << "Error: Please specify a directory to register" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            if (!std::filesystem::exists(target)) {
                std::cerr << "Error: Directory does not exist: " << target << std::endl;
                return 1;
            }

            Earmark::TrackLibrary library(dbPath, config);
            if (!library.initialize()) {
                std::cerr << "Error: Failed to initialize database" << std::endl;
                return 1;
            }

            std::cout << "Registering tracks from: " << target << std::endl;

            auto startTime = std::chrono::high_resolution_clock::now();
            bool success = library.registerDirectory(target, numWorkers);
            auto endTime = std::chrono::high_resolution_clock::now();

            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

            if (success) {
                std::cout << "Registration completed successfully in " << duration.count() << " ms" << std::endl;
            } else {
                std::cout << "Registration completed with some errors in " << duration.count() << " ms" << std::endl;
                status = 1;
            }

            library.printDatabaseStats();

        } else if (command == "recognize") {
            if (target.empty()) {
                std::cerr << "Error: Please specify a file to recognize" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            if (!std::filesystem::exists(target)) {
                std::cerr << "Error: File does not exist: " << target << std::endl;
                return 1;
            }

            Earmark::TrackLibrary library(dbPath, config);
            if (!library.initialize()) {
                std::cerr << "Error: Failed to initialize database" << std::endl;
                return 1;
            }

            auto startTime = std::chrono::high_resolution_clock::now();
            std::vector<Earmark::RankedMatch> matches = library.recognizeFile(target);
            auto endTime = std::chrono::high_resolution_clock::now();

            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

            library.printTopMatches(matches);

            std::cout << std::string(50, '=') << std::endl;
            std::cout << "RECOGNITION RESULT" << std::endl;
            std::cout << std::string(50, '=') << std::endl;

            if (!matches.empty()) {
                const Earmark::RankedMatch& best = matches.front();
                std::cout << "Match found!" << std::endl;
                std::cout << "Artist:   " << best.info.artist << std::endl;
                std::cout << "Album:    " << best.info.album << std::endl;
                std::cout << "Title:    " << best.info.title << std::endl;
                std::cout << "Track ID: " << best.result.trackId << std::endl;
                std::cout << "Offset:   " << best.result.offsetSeconds << " s" << std::endl;
                std::cout << "Score:    " << best.result.score << " / "
                          << best.result.totalCandidateHashes << std::endl;
            } else {
                std::cout << "No match found in database" << std::endl;
            }

            std::cout << "Recognition time: " << duration.count() << " ms" << std::endl;

        } else if (command == "stats") {
            Earmark::TrackLibrary library(dbPath, config);
            if (!library.initialize()) {
                std::cerr << "Error: Failed to initialize database" << std::endl;
                return 1;
            }

            library.printDatabaseStats();

        } else if (command == "fingerprint") {
            if (target.empty()) {
                std::cerr << "Error: Please specify a file to fingerprint" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            if (!std::filesystem::exists(target)) {
                std::cerr << "Error: File does not exist: " << target << std::endl;
                return 1;
            }

            status = runFingerprint(target, config);

        } else {
            std::cerr << "Error: Unknown command: " << command << std::endl;
            printUsage(argv[0]);
            return 1;
        }

        // Every plan has been destroyed with its provider by now
        fftw_cleanup();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
