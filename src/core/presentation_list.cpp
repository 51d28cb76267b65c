#include "core/presentation_list.hpp"

#include <algorithm>
#include <set>
#include <string_view>
#include <system_error>
#include <utility>

namespace waypoint
{

std::filesystem::path NormalizeExecutablePath(const std::filesystem::path& path)
{
    std::error_code error;
    std::filesystem::path canonical = std::filesystem::weakly_canonical(path, error);
    if (error)
    {
        canonical = path;
    }
    return canonical.lexically_normal();
}

std::string BuildSubtitle(const BrowserCandidate& browser)
{
    const std::string_view parts[] = {
        browser.version.productVersion,
        ToString(browser.version.binaryType),
        browser.version.companyName,
        browser.version.fileDescription,
    };

    std::string subtitle;
    for (std::string_view part : parts)
    {
        if (part.empty())
        {
            continue;
        }
        if (!subtitle.empty())
        {
            subtitle += " | ";
        }
        subtitle += part;
    }
    return subtitle;
}

std::vector<DisplayItem> BuildDisplayList(const std::vector<BrowserCandidate>& browsers, bool deduplicate)
{
    std::vector<DisplayItem> items;
    items.reserve(browsers.size());

    std::set<std::filesystem::path> seenExecutables;
    for (std::size_t index = 0; index < browsers.size(); ++index)
    {
        const auto& browser = browsers[index];
        if (deduplicate && !seenExecutables.insert(NormalizeExecutablePath(browser.executablePath)).second)
        {
            continue;
        }

        DisplayItem item;
        item.title = browser.displayName;
        item.subtitle = BuildSubtitle(browser);
        item.candidateIndex = index;
        item.available = browser.executableExists;
        items.push_back(std::move(item));
    }

    std::stable_sort(items.begin(), items.end(), [](const DisplayItem& lhs, const DisplayItem& rhs) {
        return lhs.title < rhs.title;
    });

    return items;
}

} // namespace waypoint
