#pragma once

#include <toml++/toml.h>

class ConfigManager;
struct SplitterConfig;
struct LoggingConfig;

// TOML deserialization for the splitter settings:
//   [splitter], [splitter.destinations], [[frontmatter]], [logging]
class ConfigSerializer
{
public:
    static void deserializeSplitter(const toml::table& root, SplitterConfig& config);
    static void deserializeLogging(const toml::table& root, LoggingConfig& logging);

    // Registers load handlers for every table above; config must outlive the manager.
    static void registerHandlers(ConfigManager& manager, SplitterConfig& config);

private:
    static void deserializeFrontmatter(const toml::array& entries, SplitterConfig& config);
};
