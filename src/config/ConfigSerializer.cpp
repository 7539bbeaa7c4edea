#include "ConfigSerializer.hpp"
#include "ConfigManager.hpp"
#include "SplitterConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <string>
#include <utility>

void ConfigSerializer::deserializeSplitter(const toml::table& root, SplitterConfig& config)
{
    if (auto* s = root["splitter"].as_table())
    {
        if (auto v = (*s)["source_dir"].value<std::string>())
            config.source_dir = *v;
        if (auto v = (*s)["output_root"].value<std::string>())
            config.output_root = *v;
        if (auto v = (*s)["source_root"].value<std::string>())
            config.source_root = *v;
        if (auto v = (*s)["dry_run"].value<bool>())
            config.dry_run = *v;
        if (auto v = (*s)["continue_on_error"].value<bool>())
            config.continue_on_error = *v;
        if (auto v = (*s)["write_index"].value<bool>())
            config.write_index = *v;
        if (auto v = (*s)["max_collision_suffix"].value<int64_t>())
        {
            if (*v > 0 && *v <= 1000000)
                config.max_collision_suffix = static_cast<int>(*v);
            else
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                    "max_collision_suffix out of range, keeping default",
                                                    "value=" + std::to_string(*v));
        }

        // Parse [splitter.destinations]
        if (auto* dest = (*s)["destinations"].as_table())
        {
            if (auto v = (*dest)["monitoring"].value<std::string>())
                config.monitoring_dir = *v;
            if (auto v = (*dest)["performance"].value<std::string>())
                config.performance_dir = *v;
        }
    }

    if (auto* entries = root["frontmatter"].as_array())
        deserializeFrontmatter(*entries, config);
}

void ConfigSerializer::deserializeFrontmatter(const toml::array& entries, SplitterConfig& config)
{
    config.extra_frontmatter.clear();

    std::size_t index = 0;
    for (const auto& node : entries)
    {
        const auto* entry = node.as_table();
        auto key = entry ? (*entry)["key"].value<std::string>() : std::nullopt;
        auto value = entry ? (*entry)["value"].value<std::string>() : std::nullopt;
        if (!key || key->empty() || !value)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Skipping [[frontmatter]] entry without string key/value",
                                                "entry #" + std::to_string(index));
        }
        else
        {
            config.extra_frontmatter.emplace_back(std::move(*key), std::move(*value));
        }
        ++index;
    }
}

void ConfigSerializer::deserializeLogging(const toml::table& root, LoggingConfig& logging)
{
    if (auto* l = root["logging"].as_table())
    {
        if (auto v = (*l)["directory"].value<std::string>())
            logging.directory = *v;
        if (auto v = (*l)["append_logs"].value<bool>())
            logging.append_logs = *v;
        if (auto v = (*l)["level"].value<int64_t>())
        {
            if (*v >= 0 && *v <= 6)
                logging.level = static_cast<int>(*v);
        }
        if (auto v = (*l)["verbose"].value<bool>())
            logging.verbose = *v;
        if (auto v = (*l)["preview_bytes"].value<int64_t>())
        {
            if (*v > 0 && *v <= 1000000)
                logging.preview_bytes = static_cast<int>(*v);
            else
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                    "preview_bytes out of range, keeping default",
                                                    "value=" + std::to_string(*v));
        }
    }
}

void ConfigSerializer::registerHandlers(ConfigManager& manager, SplitterConfig& config)
{
    TableCallbacks splitter_cb;
    splitter_cb.load = [&config](const toml::table& root) {
        deserializeSplitter(root, config);
    };
    manager.registerTable("", std::move(splitter_cb), {"splitter", "frontmatter"});

    TableCallbacks logging_cb;
    logging_cb.load = [&config](const toml::table& root) {
        deserializeLogging(root, config.logging);
    };
    manager.registerTable("", std::move(logging_cb), {"logging"});
}
