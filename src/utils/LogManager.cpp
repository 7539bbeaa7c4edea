#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../issues/Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <map>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_log_directory = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

namespace
{

// Appenders already attached to each plog instance
struct RegisteredLogger
{
    plog::RollingFileAppender<plog::TxtFormatter>* file = nullptr;
    bool console = false;
};

std::map<int, RegisteredLogger> registered_loggers;

} // anonymous namespace

bool LogManager::Initialize(const std::string& log_directory, bool append_logs, plog::Severity default_level)
{
    if (s_initialized)
        return true;

    s_log_directory = log_directory.empty() ? std::string("logs") : log_directory;
    s_append_logs = append_logs;
    s_default_level = default_level;

    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        const std::string filepath = (std::filesystem::path(s_log_directory) / config.filename).string();

        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(filepath, std::ios::trunc).close();
        }

        plog::Severity level = config.level_override.value_or(s_default_level);

        // A logger registered before (earlier run in this process) keeps its appenders;
        // point the file appender at the new path instead of stacking another one.
        auto& slot = registered_loggers[InstanceId];
        if (slot.file)
        {
            slot.file->setFileName(filepath.c_str());
        }
        else
        {
            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
            plog::init<InstanceId>(level, file_appender.get());
            slot.file = file_appender.get();
            s_appenders.push_back(std::move(file_appender));
        }

        auto logger = plog::get<InstanceId>();
        if (!logger)
        {
            ErrorReporter::ReportError(ErrorCategory::Initialization, "plog logger missing after init", config.name);
            return false;
        }

        // plog::init only sets the severity the first time an instance is created
        logger->setMaxSeverity(level);

        if (config.add_console_appender && !slot.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger->addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
            slot.console = true;
        }

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<issues::Diagnostics::kLogInstance>(const LoggerConfig&);

// plog loggers keep raw pointers to their appenders, so the appenders stay owned
// here for the life of the process and the loggers are only silenced.
void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto logger = plog::get<issues::Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);
    s_initialized = false;
}

const std::string& LogManager::LogDirectory() { return s_log_directory; }

plog::Severity LogManager::SeverityFromInt(long long level)
{
    if (level >= 0 && level <= 6)
        return static_cast<plog::Severity>(level);
    return plog::info;
}

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_log_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory",
                                   s_log_directory + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
