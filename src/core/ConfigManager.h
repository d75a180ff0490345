#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <iterator>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <nlohmann/json.hpp>

struct Config {
    struct Server {
        // Explicit launch command; wins over source and bundled modes when non-empty.
        std::vector<std::string> command;
        bool useSource = false;
        std::string runtime = "bun";
        std::string entry = "src/server/index.ts";
        std::string repoRoot = ".";
        std::string resourceDir;  // empty: directory of the running executable
        std::string sidecarName = "cowork-server";
        long long startupTimeoutMs = 15000;
        long long shutdownGraceMs = 3000;
        long long shutdownPollMs = 100;
    } server;

    struct Storage {
        std::string dataDir;
    } storage;

    struct Logging {
        std::string file = "cowork.log";
        bool debug = false;
    } logging;

    static Config defaults() {
        Config cfg;
        cfg.storage.dataDir = defaultDataDir();
        cfg.applyEnvironment();
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config in " + path.string() + ": " + e.what());
        }
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        cfg.storage.dataDir = defaultDataDir();

        if (j.contains("server")) {
            const auto& s = j.at("server");
            cfg.server.command = s.value("command", std::vector<std::string>{});
            cfg.server.useSource = s.value("use_source", false);
            cfg.server.runtime = s.value("runtime", cfg.server.runtime);
            cfg.server.entry = s.value("entry", cfg.server.entry);
            cfg.server.repoRoot = s.value("repo_root", cfg.server.repoRoot);
            cfg.server.resourceDir = s.value("resource_dir", "");
            cfg.server.sidecarName = s.value("sidecar_name", cfg.server.sidecarName);
            cfg.server.startupTimeoutMs = s.value("startup_timeout_ms", cfg.server.startupTimeoutMs);
            cfg.server.shutdownGraceMs = s.value("shutdown_grace_ms", cfg.server.shutdownGraceMs);
            cfg.server.shutdownPollMs = s.value("shutdown_poll_ms", cfg.server.shutdownPollMs);
        }
        if (j.contains("storage")) {
            cfg.storage.dataDir = j.at("storage").value("data_dir", cfg.storage.dataDir);
        }
        if (j.contains("logging")) {
            cfg.logging.file = j.at("logging").value("file", cfg.logging.file);
            cfg.logging.debug = j.at("logging").value("debug", false);
        }

        if (cfg.server.startupTimeoutMs <= 0) {
            throw std::runtime_error("server.startup_timeout_ms must be positive");
        }
        if (cfg.server.shutdownPollMs <= 0) {
            throw std::runtime_error("server.shutdown_poll_ms must be positive");
        }

        cfg.applyEnvironment();
        return cfg;
    }

    void applyEnvironment() {
        const char* useSourceEnv = std::getenv("COWORK_DESKTOP_USE_SOURCE");
        if (useSourceEnv && std::string(useSourceEnv) == "1") {
            server.useSource = true;
        }
        const char* dataDirEnv = std::getenv("COWORK_DATA_DIR");
        if (dataDirEnv && *dataDirEnv) {
            storage.dataDir = dataDirEnv;
        }
    }

    static std::string defaultDataDir() {
        const char* xdg = std::getenv("XDG_DATA_HOME");
        if (xdg && *xdg) {
            return (std::filesystem::u8path(xdg) / "cowork").u8string();
        }
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return (std::filesystem::u8path(home) / ".local" / "share" / "cowork").u8string();
        }
        return (std::filesystem::u8path(".cowork")).u8string();
    }
};
