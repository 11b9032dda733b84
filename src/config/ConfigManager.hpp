#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

namespace civerify::config
{

struct TableCallbacks
{
    // Returns false and fills outError when the section holds invalid values
    std::function<bool(const toml::table& section, std::string& outError)> load;
};

// Loads a TOML file and hands each registered section to its owner.
// Sections absent from the file are delivered as empty tables so owners keep
// their defaults.
class ConfigManager
{
public:
    explicit ConfigManager(std::string configPath);
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file is not an error unless required is true
    bool load(bool required = false);
    bool loadFromString(std::string_view content);

    bool fileFound() const { return file_found_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    bool dispatch();
    bool handleParseError(const toml::parse_error& pe);

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};

} // namespace civerify::config
