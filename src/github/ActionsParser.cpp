#include "ActionsParser.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace
{

// GitHub sends null for fields that are not yet known, such as conclusion
std::string stringOr(const json& obj, const char* key, const std::string& fallback = "")
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return fallback;
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

bool readId(const json& obj, civerify::github::RunId& outId, std::string& outError)
{
    auto it = obj.find("id");
    if (it == obj.end() || !it->is_number_integer())
    {
        outError = "run object missing integer 'id' field";
        return false;
    }
    outId = it->get<civerify::github::RunId>();
    return true;
}

} // namespace

namespace civerify::github
{

bool ActionsParser::parseRun(const std::string& jsonContent, RunSnapshot& outRun, std::string& outError) const
{
    try
    {
        json runJson = json::parse(jsonContent);
        if (!runJson.is_object())
        {
            outError = "run payload is not a JSON object";
            return false;
        }

        RunSnapshot run;
        if (!readId(runJson, run.id, outError))
            return false;

        if (!runJson.contains("status") || !runJson["status"].is_string())
        {
            outError = "run " + std::to_string(run.id) + " missing 'status' field";
            return false;
        }

        run.status = runJson["status"].get<std::string>();
        run.conclusion = optionalString(runJson, "conclusion");
        run.headRevision = stringOr(runJson, "head_sha").substr(0, kShortShaLength);
        run.reportUrl = stringOr(runJson, "html_url");

        outRun = std::move(run);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool ActionsParser::parseRunList(const std::string& jsonContent, std::vector<RunSummary>& outRuns,
                                 std::string& outError) const
{
    try
    {
        json listJson = json::parse(jsonContent);
        if (!listJson.is_object())
        {
            outError = "runs listing is not a JSON object";
            return false;
        }

        outRuns.clear();
        auto it = listJson.find("workflow_runs");
        if (it == listJson.end() || it->is_null())
        {
            return true;
        }
        if (!it->is_array())
        {
            outError = "'workflow_runs' is not an array";
            return false;
        }

        for (const auto& runJson : *it)
        {
            RunSummary summary;
            if (!readId(runJson, summary.id, outError))
                return false;
            summary.htmlUrl = stringOr(runJson, "html_url");
            outRuns.push_back(std::move(summary));
        }
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool ActionsParser::parseJobsPage(const std::string& jsonContent, JobsPage& outPage, std::string& outError) const
{
    try
    {
        json pageJson = json::parse(jsonContent);
        if (!pageJson.is_object())
        {
            outError = "jobs listing is not a JSON object";
            return false;
        }

        JobsPage page;
        if (pageJson.contains("total_count") && pageJson["total_count"].is_number_unsigned())
        {
            page.totalCount = pageJson["total_count"].get<std::size_t>();
        }

        auto it = pageJson.find("jobs");
        if (it != pageJson.end() && !it->is_null())
        {
            if (!it->is_array())
            {
                outError = "'jobs' is not an array";
                return false;
            }
            page.entryCount = it->size();

            for (const auto& jobJson : *it)
            {
                Job job;
                job.name = stringOr(jobJson, "name");
                job.status = stringOr(jobJson, "status");
                job.conclusion = optionalString(jobJson, "conclusion");

                if (job.name.empty())
                {
                    PLOG_WARNING << "Skipping job entry with empty name";
                    continue;
                }
                page.jobs.push_back(std::move(job));
            }
        }

        outPage = std::move(page);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

std::string ActionsParser::errorMessage(const std::string& jsonContent)
{
    json body = json::parse(jsonContent, nullptr, /*allow_exceptions*/ false);
    if (!body.is_object())
        return {};
    return stringOr(body, "message");
}

} // namespace civerify::github
