#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace civerify::utils
{

std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Options& options)
{
    if (!s_appenders.empty())
        return true;

    try
    {
        auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
        auto& logger = plog::init(options.level, console.get());
        // init() only applies the severity the first time the logger is created
        logger.setMaxSeverity(options.level);
        s_appenders.push_back(std::move(console));

        if (options.filepath.empty())
            return true;

        if (!PrepareLogDirectory(options.filepath))
            return false;

        if (!options.append)
        {
            std::ofstream(options.filepath, std::ios::trunc).close();
        }

        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            options.filepath.c_str(), options.max_file_size, options.backup_count);
        logger.addAppender(file.get());
        s_appenders.push_back(std::move(file));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "cannot set up logging", ex.what());
        return false;
    }
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get())
    {
        logger->setMaxSeverity(plog::none);
    }
    s_appenders.clear();
}

bool LogManager::PrepareLogDirectory(const std::string& filepath)
{
    std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "cannot create log directory " + parent.string(),
                                     ec.message());
        return false;
    }
    return true;
}

bool LogManager::TryParseSeverity(const std::string& name, plog::Severity& out)
{
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    struct Entry
    {
        const char* name;
        plog::Severity severity;
    };
    static constexpr Entry kLevels[] = {
        { "none", plog::none },     { "fatal", plog::fatal }, { "error", plog::error },
        { "warning", plog::warning }, { "warn", plog::warning }, { "info", plog::info },
        { "debug", plog::debug },   { "verbose", plog::verbose },
    };

    for (const auto& entry : kLevels)
    {
        if (lowered == entry.name)
        {
            out = entry.severity;
            return true;
        }
    }
    return false;
}

} // namespace civerify::utils
