#include "config/Config.hpp"
#include "core/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <vector>

namespace Vigilant {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // anonymous namespace

const char* ConfigErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "file not found";
        case ConfigError::ParseError:   return "parse error";
        case ConfigError::WriteError:   return "write error";
    }
    return "unknown";
}

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        GAME_LOG_WARN("Config file not found: {}", filepath.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    try {
        auto parsed = nlohmann::json::parse(file);
        if (!parsed.is_object()) {
            GAME_LOG_ERROR("Config file {} does not contain a JSON object", filepath.string());
            return std::unexpected(ConfigError::ParseError);
        }
        m_data = std::move(parsed);
        GAME_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        GAME_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view text) {
    std::unique_lock lock(m_mutex);
    try {
        auto parsed = nlohmann::json::parse(text);
        if (!parsed.is_object()) {
            return std::unexpected(ConfigError::ParseError);
        }
        m_data = std::move(parsed);
        return {};
    } catch (const nlohmann::json::exception& e) {
        GAME_LOG_ERROR("Failed to parse config text: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        return std::unexpected(ConfigError::WriteError);
    }

    try {
        // Create parent directories if they don't exist
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            GAME_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << m_data << std::endl;
        GAME_LOG_INFO("Saved configuration to: {}", path.string());
        return {};
    } catch (const std::exception& e) {
        GAME_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        GAME_LOG_WARN("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(path);
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

void Config::Clear() {
    std::unique_lock lock(m_mutex);
    m_data = nlohmann::json::object();
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object() || !current->contains(p)) {
            return nullptr;
        }
        current = &(*current)[p];
    }
    return current;
}

} // namespace Vigilant
