#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace civerify::config
{

ConfigManager::ConfigManager(std::string configPath)
    : config_path_(std::move(configPath))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        auto clash = std::find_first_of(ownedKeys.begin(), ownedKeys.end(), handler.ownedKeys.begin(),
                                        handler.ownedKeys.end());
        if (clash != ownedKeys.end())
        {
            last_error_ = "key '" + *clash + "' of [" + path + "] is already owned by another handler";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load(bool required)
{
    last_error_.clear();
    file_found_ = false;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(config_path_, ec))
    {
        if (required)
        {
            last_error_ = "config file not found: " + config_path_;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, last_error_);
            return false;
        }
        PLOG_DEBUG << "No config file at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        return dispatch();
    }

    std::ifstream in(config_path_, std::ios::binary);
    if (!in)
    {
        last_error_ = "cannot open config file: " + config_path_;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, last_error_);
        return false;
    }
    file_found_ = true;

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(in, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        return handleParseError(pe);
    }

    PLOG_INFO << "Loaded config from " << config_path_;
    return dispatch();
}

bool ConfigManager::loadFromString(std::string_view content)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(content, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        return handleParseError(pe);
    }
    return dispatch();
}

bool ConfigManager::handleParseError(const toml::parse_error& pe)
{
    root_.reset();

    const auto& where = pe.source().begin;
    last_error_ = "config parse error in " + config_path_;
    if (where.line > 0)
    {
        last_error_ += " at line " + std::to_string(where.line) + ", column " + std::to_string(where.column);
    }
    last_error_ += ": " + std::string(pe.description());

    utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, last_error_);
    return false;
}

// Hands every registered section to its owner. Keys nobody owns are only
// warned about so that newer config files still load.
bool ConfigManager::dispatch()
{
    const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = root_->at_path(handler.path).as_table();
        if (!section)
        {
            section = &empty;
        }

        section->for_each(
            [&](const toml::key& key, const auto&)
            {
                const auto& owned = handler.ownedKeys;
                if (std::find(owned.begin(), owned.end(), key.str()) == owned.end())
                {
                    PLOG_WARNING << "Ignoring unknown key '" << key.str() << "' in [" << handler.path << "] of "
                                 << config_path_;
                }
            });

        std::string error;
        if (!handler.callbacks.load(*section, error))
        {
            last_error_ = "[" + handler.path + "] " + error;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, last_error_, config_path_);
            return false;
        }
    }
    return true;
}

} // namespace civerify::config
