#include <httplib.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fftw3.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "../audio/AudioLoader.h"
#include "../core/Config.h"
#include "../core/Errors.h"
#include "../library/TrackLibrary.h"

using json = nlohmann::json;

class EarmarkServer {
private:
    std::unique_ptr<Earmark::TrackLibrary> library;
    Earmark::FingerprintConfig config;
    std::string dbPath;
    std::string tempDir;
    std::atomic<unsigned long> uploadCounter{0};

    std::string saveUploadedFile(const std::string& fileData, const std::string& filename) {
        if (!std::filesystem::exists(tempDir)) {
            std::filesystem::create_directories(tempDir);
        }

        auto now = std::chrono::system_clock::now();
        auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
        std::string safeName = std::filesystem::path(filename).filename().string();
        std::string tempFilename = tempDir + "/" + std::to_string(timestamp) + "_" +
                                   std::to_string(uploadCounter++) + "_" + safeName;

        std::ofstream file(tempFilename, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to create temporary file");
        }

        file.write(fileData.data(), static_cast<std::streamsize>(fileData.size()));
        if (!file) {
            throw std::runtime_error("Failed to write temporary file");
        }
        return tempFilename;
    }

    void cleanupTempFile(const std::string& filepath) {
        std::error_code ec;
        std::filesystem::remove(filepath, ec);
        if (ec) {
            std::cerr << "Warning: could not remove " << filepath << ": " << ec.message() << std::endl;
        }
    }

    static void sendJson(httplib::Response& res, const json& body, int status = 200) {
        res.status = status;
        res.set_content(body.dump(2) + "\n", "application/json");
    }

    static void sendError(httplib::Response& res, const std::string& message, int status) {
        json error;
        error["success"] = false;
        error["error"] = message;
        sendJson(res, error, status);
    }

    json matchesToJson(const std::vector<Earmark::RankedMatch>& matches) {
        json response;
        response["success"] = true;
        response["match"] = !matches.empty();
        response["matches"] = json::array();

        for (const auto& match : matches) {
            response["matches"].push_back({
                {"trackId", match.result.trackId},
                {"title", match.info.title},
                {"artist", match.info.artist},
                {"album", match.info.album},
                {"offsetSeconds", match.result.offsetSeconds},
                {"score", match.result.score},
                {"totalCandidateHashes", match.result.totalCandidateHashes}
            });
        }

        if (matches.empty()) {
            response["message"] = "No match found in database";
        }
        return response;
    }

    // Writes the upload to disk for the decoders, recognizes it, cleans up
    void recognizeUpload(const std::string& data, const std::string& filename, httplib::Response& res) {
        std::string tempFilePath = saveUploadedFile(data, filename);

        auto startTime = std::chrono::high_resolution_clock::now();
        std::vector<Earmark::RankedMatch> matches;
        try {
            matches = library->recognizeFile(tempFilePath);
        } catch (...) {
            cleanupTempFile(tempFilePath);
            throw;
        }
        auto endTime = std::chrono::high_resolution_clock::now();
        cleanupTempFile(tempFilePath);

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime);

        json response = matchesToJson(matches);
        response["recognitionTimeMs"] = duration.count();
        sendJson(res, response);
    }

public:
    EarmarkServer(const std::string& dbPath, const std::string& tempDir,
                  const Earmark::FingerprintConfig& config)
        : config(config), dbPath(dbPath), tempDir(tempDir) {
        library = std::make_unique<Earmark::TrackLibrary>(dbPath, config);
    }

    bool initialize() {
        if (!library->initialize()) {
            std::cerr << "Failed to initialize database" << std::endl;
            return false;
        }

        std::cout << "Earmark server initialized" << std::endl;
        std::cout << "Database: " << dbPath << std::endl;
        return true;
    }

    void handleRecognition(const httplib::Request& req, httplib::Response& res) {
        try {
            if (!req.has_file("audio") && !req.has_file("file")) {
                sendError(res, "No audio file found in request. Use 'audio' or 'file' as field name.", 400);
                return;
            }

            auto file = req.has_file("audio") ? req.get_file_value("audio") : req.get_file_value("file");

            std::string filename = file.filename.empty() ? "upload.wav" : file.filename;
            if (!Earmark::isSupportedFormat(filename)) {
                sendError(res, "Unsupported file format. Supported formats: mp3, wav, flac", 400);
                return;
            }

            recognizeUpload(file.content, filename, res);

        } catch (const Earmark::AudioLoadError& e) {
            sendError(res, std::string("Could not decode audio: ") + e.what(), 400);
        } catch (const std::exception& e) {
            sendError(res, std::string("Recognition failed: ") + e.what(), 500);
        }
    }

    void handleStreamRecognition(const httplib::Request& req, httplib::Response& res) {
        try {
            if (req.body.empty()) {
                sendError(res, "No audio data found in request body", 400);
                return;
            }

            std::string filename = "stream.wav";
            auto contentType = req.get_header_value("Content-Type");
            if (contentType.find("audio/mpeg") != std::string::npos ||
                contentType.find("audio/mp3") != std::string::npos) {
                filename = "stream.mp3";
            } else if (contentType.find("audio/flac") != std::string::npos) {
                filename = "stream.flac";
            }

            recognizeUpload(req.body, filename, res);

        } catch (const Earmark::AudioLoadError& e) {
            sendError(res, std::string("Could not decode audio: ") + e.what(), 400);
        } catch (const std::exception& e) {
            sendError(res, std::string("Recognition failed: ") + e.what(), 500);
        }
    }

    void handleStats(const httplib::Request&, httplib::Response& res) {
        try {
            Earmark::IndexStats memory = library->engine().stats();

            json stats;
            stats["totalTracks"] = library->getTotalTracks();
            stats["totalHashes"] = library->getTotalHashes();
            stats["indexedTracks"] = memory.tracks;
            stats["distinctHashes"] = memory.distinctHashes;
            stats["database"] = dbPath;
            sendJson(res, stats);

        } catch (const std::exception& e) {
            sendError(res, std::string("Failed to get stats: ") + e.what(), 500);
        }
    }

    void handleConfig(const httplib::Request&, httplib::Response& res) {
        sendJson(res, Earmark::configToJson(config));
    }
};

int main(int argc, char* argv[]) {
    std::string dbPath = Earmark::getEnvOr(Earmark::DB_PATH_ENV, Earmark::DEFAULT_DB_PATH);
    std::string configPath = Earmark::getEnvOr(Earmark::CONFIG_PATH_ENV, "");
    std::string tempDir = "./temp";
    int port = 8080;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--db" && i + 1 < argc) {
            dbPath = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            port = std::stoi(argv[++i]);
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--temp" && i + 1 < argc) {
            tempDir = argv[++i];
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [options]\n";
            std::cout << "Options:\n";
            std::cout << "  --db <path>       Database path (default: $" << Earmark::DB_PATH_ENV
                      << " or " << Earmark::DEFAULT_DB_PATH << ")\n";
            std::cout << "  --port <port>     Server port (default: 8080)\n";
            std::cout << "  --config <file>   JSON tuning parameters (default: $" << Earmark::CONFIG_PATH_ENV << ")\n";
            std::cout << "  --temp <dir>      Directory for uploaded clips (default: ./temp)\n";
            std::cout << "  --help            Show this help\n";
            return 0;
        }
    }

    Earmark::FingerprintConfig config;
    try {
        if (!configPath.empty()) {
            config = Earmark::loadConfigFile(configPath);
            std::cout << "Loaded config from: " << configPath << std::endl;
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    EarmarkServer server(dbPath, tempDir, config);
    if (!server.initialize()) {
        return 1;
    }

    httplib::Server svr;
    svr.set_payload_max_length(50 * 1024 * 1024);

    svr.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.Options("/.*", [](const httplib::Request&, httplib::Response&) {});

    svr.Post("/recognize", [&server](const httplib::Request& req, httplib::Response& res) {
        server.handleRecognition(req, res);
    });

    svr.Post("/recognize/stream", [&server](const httplib::Request& req, httplib::Response& res) {
        server.handleStreamRecognition(req, res);
    });

    svr.Get("/stats", [&server](const httplib::Request& req, httplib::Response& res) {
        server.handleStats(req, res);
    });

    svr.Get("/config", [&server](const httplib::Request& req, httplib::Response& res) {
        server.handleConfig(req, res);
    });

    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        json health;
        health["status"] = "ok";
        health["service"] = "earmark";
        res.set_content(health.dump(2) + "\n", "application/json");
    });

    std::cout << "Starting Earmark server on port " << port << std::endl;
    std::cout << "Endpoints:" << std::endl;
    std::cout << "  POST /recognize        - Upload audio file for recognition (multipart)" << std::endl;
    std::cout << "  POST /recognize/stream - Raw audio body for recognition" << std::endl;
    std::cout << "  GET  /stats            - Database statistics" << std::endl;
    std::cout << "  GET  /config           - Effective tuning parameters" << std::endl;
    std::cout << "  GET  /health           - Health check" << std::endl;

    if (!svr.listen("0.0.0.0", port)) {
        std::cerr << "Failed to start server on port " << port << std::endl;
        return 1;
    }

    fftw_cleanup();
    return 0;
}
