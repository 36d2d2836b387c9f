/**
 * @file profile_validate.cpp
 * @brief Validate a JSON profile document and print its transport form
 *
 * Reads one JSON object carrying profileId, profileActivationToken,
 * profileAtHandle, profileEmail, profileHash, profilePhone and profileSalt.
 *
 * Usage:
 *   ./profile_validate [--file PATH] [--log-level LEVEL]
 *
 * Exit status: 0 valid, 1 unreadable input, 2 validation failure.
 */

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include "profile/config/config_manager.h"
#include "profile/logging/logger.h"
#include "profile/service/profile_document.h"

namespace {

void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--file PATH] [--log-level LEVEL]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& config = profile::config::ConfigManager::getInstance();

    std::string filePath;
    std::string logLevel = config.getString(profile::config::ConfigManager::LOG_LEVEL, "warn");

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--file" && i + 1 < argc) {
            filePath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    profile::logging::Logger::initialize(
        "profile-validate",
        logLevel,
        config.getBool(profile::config::ConfigManager::LOG_TO_FILE, false),
        config.getString(profile::config::ConfigManager::LOG_FILE, "profile-core.log"));

    std::stringstream input;
    if (filePath.empty()) {
        input << std::cin.rdbuf();
    } else {
        std::ifstream file(filePath);
        if (!file) {
            spdlog::error("Cannot open input file: {}", filePath);
            return 1;
        }
        input << file.rdbuf();
    }

    auto result = profile::service::validateDocument(input);
    if (result.status != profile::service::DocumentStatus::UNREADABLE) {
        printJson(result.body);
    }

    profile::logging::Logger::flush();
    return static_cast<int>(result.status);
}
