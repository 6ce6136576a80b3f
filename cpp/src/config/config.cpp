// ==============================================================================
// config.cpp - Конфигурационный файл (yaml-cpp)
// ==============================================================================

#include "rccopy/config.hpp"

#include "rccopy/platform.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace rccopy::config {

namespace {

LoadResult parse_node(const YAML::Node& root) {
    LoadResult result;

    // Пустой файл - валидный конфиг без значений
    if (!root || root.IsNull()) {
        result.ok = true;
        return result;
    }
    if (!root.IsMap()) {
        result.error = "config root must be a mapping";
        return result;
    }

    try {
        if (root["checksum"]) {
            const auto name = root["checksum"].as<std::string>();
            try {
                result.config.checksum = hash::parse_algorithm(name);
            } catch (const std::invalid_argument& e) {
                result.error = "invalid value '" + name + "' for 'checksum': " + e.what();
                return result;
            }
        }

        if (root["mhl"]) {
            result.config.mhl = root["mhl"].as<bool>();
        }

        if (root["allow_missing_creation_time"]) {
            result.config.allow_missing_creation_time =
                root["allow_missing_creation_time"].as<bool>();
        }

        if (root["exclude"]) {
            if (!root["exclude"].IsSequence()) {
                result.error = "'exclude' must be a list of names";
                return result;
            }
            for (const auto& name : root["exclude"]) {
                result.config.exclude.push_back(name.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        result.error = std::string("invalid config value - ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace

LoadResult parse(std::string_view yaml) {
    try {
        return parse_node(YAML::Load(std::string(yaml)));
    } catch (const YAML::Exception& e) {
        LoadResult result;
        result.error = std::string("failed to parse config - ") + e.what();
        return result;
    }
}

LoadResult load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LoadResult result;
        result.error = "cannot open config file: " + platform::path_to_utf8(path);
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto result = parse(buffer.str());
    if (!result) {
        result.error += " (" + platform::path_to_utf8(path) + ")";
    }
    return result;
}

Settings merge(const FileConfig& file, std::optional<hash::Algorithm> cli_checksum, bool cli_mhl,
               bool cli_allow_missing_creation_time) {
    Settings settings;
    settings.checksum = cli_checksum.has_value() ? cli_checksum : file.checksum;
    settings.mhl = cli_mhl || file.mhl.value_or(false);
    settings.allow_missing_creation_time =
        cli_allow_missing_creation_time || file.allow_missing_creation_time.value_or(false);
    settings.exclude = file.exclude;
    return settings;
}

}  // namespace rccopy::config
