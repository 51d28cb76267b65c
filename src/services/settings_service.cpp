#include "services/settings_service.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

namespace waypoint::services
{
namespace
{
constexpr char kSettingsDir[] = ".waypoint";
constexpr char kSettingsFile[] = "config.json";

constexpr char kRootsKey[] = "roots";
constexpr char kManifestPathKey[] = "manifestPath";
constexpr char kExecutableDirectoryKey[] = "executableDirectory";
constexpr char kResourcesDirectoryKey[] = "resourcesDirectory";
constexpr char kWorkersKey[] = "workers";
constexpr char kDeduplicateKey[] = "deduplicate";

bool ReadRelativePath(const nlohmann::json& document, const char* key, std::filesystem::path& target)
{
    if (!document.contains(key) || !document[key].is_string())
    {
        return false;
    }

    const std::filesystem::path value{document[key].get<std::string>()};
    if (value.empty() || value.is_absolute())
    {
        std::cerr << "Ignoring setting \"" << key << "\": expected a relative path" << '\n';
        return false;
    }

    target = value;
    return true;
}
} // namespace

SettingsService::SettingsService()
{
    config_.roots = DefaultRoots();
}

std::filesystem::path SettingsService::HomeDirectory()
{
    std::filesystem::path base = std::filesystem::path{std::getenv("HOME") ? std::getenv("HOME") : ""};
#ifdef _WIN32
    if (base.empty())
    {
        if (const char* userProfile = std::getenv("USERPROFILE"))
        {
            base = userProfile;
        }
    }
#endif
    return base;
}

std::filesystem::path SettingsService::ExpandHome(const std::string& path)
{
    if (path == "~" || path.rfind("~/", 0) == 0)
    {
        const std::filesystem::path home = HomeDirectory();
        if (!home.empty())
        {
            return path.size() <= 2 ? home : home / path.substr(2);
        }
    }
    return std::filesystem::path{path};
}

std::vector<std::filesystem::path> SettingsService::DefaultRoots()
{
    std::vector<std::filesystem::path> roots{"/Applications", "/System/Applications"};
    const std::filesystem::path home = HomeDirectory();
    if (!home.empty())
    {
        roots.push_back(home / "Applications");
    }
    return roots;
}

std::filesystem::path SettingsService::DefaultPath()
{
    std::filesystem::path base = HomeDirectory();
    if (base.empty())
    {
        base = std::filesystem::current_path();
    }
    return base / kSettingsDir / kSettingsFile;
}

void SettingsService::Load(const std::filesystem::path& settingsPath)
{
    if (settingsPath.empty())
    {
        return;
    }

    std::error_code error;
    if (!std::filesystem::exists(settingsPath, error) || error)
    {
        return;
    }

    std::ifstream input{settingsPath};
    if (!input.is_open())
    {
        std::cerr << "Unable to open settings file: " << settingsPath << '\n';
        return;
    }

    try
    {
        const nlohmann::json document = nlohmann::json::parse(input, nullptr, true, true);
        if (!document.is_object())
        {
            std::cerr << "Settings file must contain a JSON object: " << settingsPath << '\n';
            return;
        }

        if (document.contains(kRootsKey) && document[kRootsKey].is_array())
        {
            std::vector<std::filesystem::path> roots;
            for (const auto& entry : document[kRootsKey])
            {
                if (!entry.is_string() || entry.get<std::string>().empty())
                {
                    continue;
                }
                roots.push_back(ExpandHome(entry.get<std::string>()));
            }
            config_.roots = std::move(roots);
        }

        ReadRelativePath(document, kManifestPathKey, config_.manifestPath);
        ReadRelativePath(document, kExecutableDirectoryKey, config_.layout.executableDirectory);
        ReadRelativePath(document, kResourcesDirectoryKey, config_.layout.resourcesDirectory);

        if (document.contains(kWorkersKey) && document[kWorkersKey].is_number_integer())
        {
            const auto workers = document[kWorkersKey].get<long long>();
            if (workers >= 0)
            {
                config_.workerCount = static_cast<std::size_t>(workers);
            }
        }

        if (document.contains(kDeduplicateKey) && document[kDeduplicateKey].is_boolean())
        {
            config_.deduplicate = document[kDeduplicateKey].get<bool>();
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Failed to load settings: " << ex.what() << '\n';
    }
}

void SettingsService::Save(const std::filesystem::path& settingsPath) const
{
    if (settingsPath.empty())
    {
        return;
    }

    const std::filesystem::path directory = settingsPath.parent_path();
    std::error_code error;
    if (!directory.empty() && !std::filesystem::exists(directory, error))
    {
        std::filesystem::create_directories(directory, error);
        if (error)
        {
            std::cerr << "Unable to create settings directory: " << directory << '\n';
            return;
        }
    }

    nlohmann::json roots = nlohmann::json::array();
    for (const auto& root : config_.roots)
    {
        roots.push_back(root.string());
    }

    nlohmann::json document;
    document[kRootsKey] = std::move(roots);
    document[kManifestPathKey] = config_.manifestPath.generic_string();
    document[kExecutableDirectoryKey] = config_.layout.executableDirectory.generic_string();
    document[kResourcesDirectoryKey] = config_.layout.resourcesDirectory.generic_string();
    document[kWorkersKey] = config_.workerCount;
    document[kDeduplicateKey] = config_.deduplicate;

    std::ofstream output{settingsPath};
    if (!output.is_open())
    {
        std::cerr << "Unable to write settings file: " << settingsPath << '\n';
        return;
    }

    output << document.dump(2) << '\n';
}

} // namespace waypoint::services
