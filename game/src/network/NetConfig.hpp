#pragma once

#include <cstdint>
#include <string>

namespace Vigilant {
    class Config;
}

namespace Spacewar {

/**
 * @brief Network and runtime settings for the server and clients
 *
 * Maps the "net.*" and "log.*" keys of the JSON configuration. Absent keys
 * keep their defaults.
 */
class NetConfig {
public:
    NetConfig() = default;
    ~NetConfig() = default;

    // =========================================================================
    // NETWORK SETTINGS
    // =========================================================================

    uint16_t port = 34244;
    uint32_t stalenessTicks = 200;       // Resend unchanged entities after this many ticks
    double clientTimeoutSeconds = 0.0;   // 0 disables eviction of silent clients
    uint32_t pingIntervalTicks = 0;      // 0 sends only the initial ping

    // =========================================================================
    // TIMING SETTINGS
    // =========================================================================

    double timeStep = 0.080;             // Server fixed step, seconds
    double clientMinStep = 0.020;        // Client minimum frame time, seconds

    // =========================================================================
    // LOGGING SETTINGS
    // =========================================================================

    std::string logLevel = "info";
    std::string logFile;

    // =========================================================================
    // METHODS
    // =========================================================================

    /**
     * @brief Read settings from a loaded configuration
     */
    void LoadFrom(const Vigilant::Config& config);

    /**
     * @brief Write settings into a configuration
     */
    void SaveTo(Vigilant::Config& config) const;

    /**
     * @brief Load settings from a JSON file
     * @return false if the file is missing or malformed (settings unchanged)
     */
    bool LoadFromFile(const std::string& path);

    /**
     * @brief Save settings to a JSON file
     */
    bool SaveToFile(const std::string& path) const;

    /**
     * @brief Reset to default values
     */
    void ResetToDefaults();

    /**
     * @brief Validate settings
     * @param errorMessage Set to a description of the first problem found
     */
    bool Validate(std::string& errorMessage) const;
};

} // namespace Spacewar
