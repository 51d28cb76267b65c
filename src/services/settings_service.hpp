#pragma once

#include "core/browser_discovery.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace waypoint::services
{

class SettingsService
{
  public:
    SettingsService();

    [[nodiscard]] const DiscoveryConfig& Config() const noexcept { return config_; }
    [[nodiscard]] DiscoveryConfig& Config() noexcept { return config_; }

    //! Missing files keep the defaults. Unreadable or invalid files are
    //! reported on stderr and keep the defaults; wrong-typed keys are skipped.
    void Load(const std::filesystem::path& settingsPath);
    void Save(const std::filesystem::path& settingsPath) const;

    [[nodiscard]] static std::filesystem::path DefaultPath();
    [[nodiscard]] static std::vector<std::filesystem::path> DefaultRoots();
    [[nodiscard]] static std::filesystem::path ExpandHome(const std::string& path);

  private:
    static std::filesystem::path HomeDirectory();

    DiscoveryConfig config_;
};

} // namespace waypoint::services
