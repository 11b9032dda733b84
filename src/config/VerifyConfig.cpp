#include "VerifyConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/LogManager.hpp"

#include <toml++/toml.h>

#include <limits>

namespace civerify::config
{

namespace
{

bool readString(const toml::table& section, const char* key, std::string& out, std::string& outError)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    auto value = node->value<std::string>();
    if (!value)
    {
        outError = std::string("'") + key + "' must be a string";
        return false;
    }
    out = *value;
    return true;
}

bool readPositiveInt(const toml::table& section, const char* key, int& out, std::string& outError)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    auto value = node->value<int64_t>();
    if (!value || !node->is_integer())
    {
        outError = std::string("'") + key + "' must be an integer";
        return false;
    }
    if (*value <= 0 || *value > std::numeric_limits<int>::max())
    {
        outError = std::string("'") + key + "' must be greater than 0, got " + std::to_string(*value);
        return false;
    }
    out = static_cast<int>(*value);
    return true;
}

bool readBool(const toml::table& section, const char* key, bool& out, std::string& outError)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    if (!node->is_boolean())
    {
        outError = std::string("'") + key + "' must be true or false";
        return false;
    }
    out = node->value<bool>().value_or(out);
    return true;
}

bool readStringArray(const toml::table& section, const char* key, std::vector<std::string>& out,
                     std::string& outError)
{
    const toml::node* node = section.get(key);
    if (!node)
        return true;
    const toml::array* arr = node->as_array();
    if (!arr)
    {
        outError = std::string("'") + key + "' must be an array of strings";
        return false;
    }

    std::vector<std::string> values;
    for (const auto& element : *arr)
    {
        auto value = element.value<std::string>();
        if (!value || !element.is_string())
        {
            outError = std::string("'") + key + "' must contain only strings";
            return false;
        }
        values.push_back(*value);
    }
    out = std::move(values);
    return true;
}

} // namespace

const std::vector<std::string>& VerifyConfig::DefaultRequiredJobs()
{
    static const std::vector<std::string> kDefaults = {
        "Gates (ubuntu-latest)",
        "Gates (windows-latest)",
        "Security Audit",
        "Clippy (annotated)",
    };
    return kDefaults;
}

std::vector<std::string> VerifyConfig::effectiveRequiredJobs() const
{
    return verify.required_jobs.empty() ? DefaultRequiredJobs() : verify.required_jobs;
}

bool VerifyConfig::registerWith(ConfigManager& manager)
{
    bool ok = manager.registerTable(
        "github",
        { [this](const toml::table& section, std::string& outError)
          {
              return readString(section, "owner", github.owner, outError) &&
                     readString(section, "repo", github.repo, outError) &&
                     readString(section, "api_url", github.api_url, outError) &&
                     readString(section, "user_agent", github.user_agent, outError) &&
                     readPositiveInt(section, "connect_timeout_ms", github.connect_timeout_ms, outError) &&
                     readPositiveInt(section, "request_timeout_ms", github.request_timeout_ms, outError);
          } },
        { "owner", "repo", "api_url", "user_agent", "connect_timeout_ms", "request_timeout_ms" });

    ok = ok && manager.registerTable(
                   "verify",
                   { [this](const toml::table& section, std::string& outError)
                     {
                         return readStringArray(section, "required_jobs", verify.required_jobs, outError) &&
                                readPositiveInt(section, "timeout_secs", verify.timeout_secs, outError) &&
                                readPositiveInt(section, "poll_secs", verify.poll_secs, outError) &&
                                readBool(section, "require_run_success", verify.require_run_success, outError);
                     } },
                   { "required_jobs", "timeout_secs", "poll_secs", "require_run_success" });

    ok = ok && manager.registerTable(
                   "logging",
                   { [this](const toml::table& section, std::string& outError)
                     {
                         std::string level;
                         if (!readString(section, "level", level, outError))
                             return false;
                         if (!level.empty() && !utils::LogManager::TryParseSeverity(level, logging.level))
                         {
                             outError = "unknown log level '" + level + "'";
                             return false;
                         }
                         return readString(section, "file", logging.file, outError) &&
                                readBool(section, "append", logging.append, outError);
                     } },
                   { "level", "file", "append" });

    return ok;
}

bool VerifyConfig::validate(std::string& outError) const
{
    if (github.owner.empty())
    {
        outError = "repository owner is required (--owner or [github] owner)";
        return false;
    }
    if (github.repo.empty())
    {
        outError = "repository name is required (--repo or [github] repo)";
        return false;
    }
    if (github.api_url.empty())
    {
        outError = "API URL must not be empty";
        return false;
    }
    if (verify.timeout_secs <= 0)
    {
        outError = "timeout must be greater than 0 seconds";
        return false;
    }
    if (verify.poll_secs <= 0)
    {
        outError = "poll interval must be greater than 0 seconds";
        return false;
    }
    return true;
}

} // namespace civerify::config
