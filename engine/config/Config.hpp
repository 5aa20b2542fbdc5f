#pragma once

#include <string>
#include <string_view>
#include <expected>
#include <filesystem>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace Vigilant {

/**
 * @brief Configuration error codes
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error) noexcept;

/**
 * @brief JSON-based configuration store
 *
 * Values are addressed by dot-separated key paths ("net.port"). A missing
 * or mistyped value yields the caller's default. The process-wide instance
 * is reached through Instance(); tests construct their own.
 */
class Config {
public:
    Config() = default;
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static Config& Instance();

    /**
     * @brief Load configuration from JSON file
     * @param filepath Path to configuration file
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the configuration with the parsed contents of a JSON string
     */
    std::expected<void, ConfigError> LoadFromString(std::string_view text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from the last loaded path
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "net.port")
     * @param defaultValue Value to return if key not found or of another type
     */
    template<typename T>
    [[nodiscard]] T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    [[nodiscard]] bool Has(std::string_view key) const;

    void Clear();

    [[nodiscard]] const nlohmann::json& GetJson() const noexcept { return m_data; }
    [[nodiscard]] const std::filesystem::path& GetPath() const noexcept { return m_filepath; }

private:
    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            if (node->is_array() && node->size() >= 2) {
                return glm::vec2((*node)[0].get<float>(), (*node)[1].get<float>());
            }
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            if (node->is_array() && node->size() >= 3) {
                return glm::vec3(
                    (*node)[0].get<float>(),
                    (*node)[1].get<float>(),
                    (*node)[2].get<float>()
                );
            }
        } else if constexpr (std::is_same_v<T, bool>) {
            if (node->is_boolean()) {
                return node->get<bool>();
            }
        } else if constexpr (std::is_arithmetic_v<T>) {
            if (node->is_number()) {
                return node->get<T>();
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            *node = nlohmann::json::array({value.x, value.y, value.z});
        } else {
            *node = value;
        }
    }
}

} // namespace Vigilant
