#pragma once

#include "core/browser.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace waypoint
{

struct DisplayItem
{
    std::string title;
    // Non-empty parts of version, architecture, company and description
    // joined with " | ".
    std::string subtitle;
    // Position of the source candidate in the list given to BuildDisplayList.
    std::size_t candidateIndex = 0;
    bool available = true;
};

//! Canonical form of an executable path used as the deduplication key.
[[nodiscard]] std::filesystem::path NormalizeExecutablePath(const std::filesystem::path& path);

[[nodiscard]] std::string BuildSubtitle(const BrowserCandidate& browser);

// Stable sort by display name using plain byte ordering, so "Zeta" sorts
// before "alpha". With |deduplicate| set, later candidates sharing an
// executable with an earlier one are dropped before sorting.
[[nodiscard]] std::vector<DisplayItem> BuildDisplayList(
    const std::vector<BrowserCandidate>& browsers,
    bool deduplicate = true);

} // namespace waypoint
