#include "core/browser_discovery.hpp"

#include "core/manifest.hpp"
#include "core/url_capability.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace waypoint
{
namespace
{
constexpr char kRootStage[] = "root";
constexpr char kReadStage[] = "read";
constexpr char kFilterStage[] = "filter";
constexpr char kExtractStage[] = "extract";

struct WorkItem
{
    std::filesystem::path entry;
};

ErrorCategory CategoryFor(ManifestError::Kind kind)
{
    switch (kind)
    {
    case ManifestError::Kind::NotFound:
        return ErrorCategory::NotFound;
    case ManifestError::Kind::Unreadable:
        return ErrorCategory::ResourceUnavailable;
    case ManifestError::Kind::Malformed:
        break;
    }
    return ErrorCategory::Malformed;
}

ErrorCategory CategoryFor(ExtractError::Kind kind)
{
    return kind == ExtractError::Kind::MissingField ? ErrorCategory::MissingField : ErrorCategory::Malformed;
}

ScanDiagnostic MakeFilterDiagnostic(const std::filesystem::path& manifestPath, const std::vector<FilterError>& errors)
{
    std::string message = "Malformed URL type declarations: ";
    for (std::size_t index = 0; index < errors.size(); ++index)
    {
        if (index > 0)
        {
            message += "; ";
        }
        message += errors[index].what();
    }

    return ScanDiagnostic{manifestPath, kFilterStage, ErrorCategory::Malformed, std::move(message)};
}

std::vector<WorkItem> CollectEntries(
    const std::filesystem::path& root,
    const ScanOptions& options,
    std::vector<ScanDiagnostic>& diagnostics)
{
    std::vector<WorkItem> items;

    std::error_code ec;
    if (!std::filesystem::exists(root, ec))
    {
        diagnostics.push_back(ScanDiagnostic{
            root,
            kRootStage,
            ec ? ErrorCategory::ResourceUnavailable : ErrorCategory::NotFound,
            ec ? "Unable to access application directory: " + ec.message() : "Application directory does not exist"});
        return items;
    }

    if (!std::filesystem::is_directory(root, ec))
    {
        diagnostics.push_back(
            ScanDiagnostic{root, kRootStage, ErrorCategory::ResourceUnavailable, "Application root is not a directory"});
        return items;
    }

    std::vector<std::filesystem::path> children;
    for (std::filesystem::directory_iterator it{root, ec}; !ec && it != std::filesystem::directory_iterator{};
         it.increment(ec))
    {
        children.push_back(it->path());
    }

    if (ec)
    {
        diagnostics.push_back(ScanDiagnostic{
            root, kRootStage, ErrorCategory::ResourceUnavailable, "Unable to list application directory: " + ec.message()});
        if (children.empty())
        {
            return items;
        }
    }

    std::sort(children.begin(), children.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.filename() < rhs.filename();
    });

    for (auto& child : children)
    {
        // Only a manifest that is really absent skips the entry; a failed stat
        // is reported when the entry is read.
        std::error_code manifestError;
        if (!std::filesystem::exists(child / options.manifestPath, manifestError) && !manifestError)
        {
            continue;
        }
        items.push_back(WorkItem{std::move(child)});
    }

    return items;
}

std::size_t ResolveWorkerCount(std::size_t requested, std::size_t workItems)
{
    std::size_t workers = requested;
    if (workers == 0)
    {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    return std::clamp<std::size_t>(workers, 1, std::max<std::size_t>(workItems, 1));
}
} // namespace

EntryOutcome ScanEntry(const std::filesystem::path& entry, const ScanOptions& options)
{
    EntryOutcome outcome;
    const std::filesystem::path manifestPath = entry / options.manifestPath;

    try
    {
        const ManifestDocument manifest = ManifestDocument::Load(manifestPath);

        const SchemeScan scan = SupportedSchemes(manifest);
        if (!scan.errors.empty())
        {
            outcome.diagnostics.push_back(MakeFilterDiagnostic(manifestPath, scan.errors));
        }

        if (!HandlesWebUrls(scan.schemes))
        {
            return outcome;
        }

        outcome.browsers.push_back(ExtractBrowser(manifest, manifestPath.parent_path(), options.layout));
    }
    catch (const ManifestError& ex)
    {
        outcome.diagnostics.push_back(ScanDiagnostic{manifestPath, kReadStage, CategoryFor(ex.kind()), ex.what()});
    }
    catch (const ExtractError& ex)
    {
        outcome.diagnostics.push_back(ScanDiagnostic{manifestPath, kExtractStage, CategoryFor(ex.kind()), ex.what()});
    }
    catch (const std::exception& ex)
    {
        outcome.diagnostics.push_back(ScanDiagnostic{manifestPath, kExtractStage, ErrorCategory::Malformed, ex.what()});
    }

    return outcome;
}

ScanResult ScanDirectories(const std::vector<std::filesystem::path>& roots, const ScanOptions& options)
{
    ScanResult result;

    std::vector<WorkItem> items;
    for (const auto& root : roots)
    {
        if (options.stopToken.stop_requested())
        {
            result.cancelled = true;
            return result;
        }

        auto rootItems = CollectEntries(root, options, result.diagnostics);
        std::move(rootItems.begin(), rootItems.end(), std::back_inserter(items));
    }

    std::vector<EntryOutcome> outcomes(items.size());
    std::vector<char> processed(items.size(), 0);
    std::atomic<std::size_t> nextItem{0};

    auto work = [&]() {
        while (!options.stopToken.stop_requested())
        {
            const std::size_t index = nextItem.fetch_add(1);
            if (index >= items.size())
            {
                return;
            }
            outcomes[index] = ScanEntry(items[index].entry, options);
            processed[index] = 1;
        }
    };

    const std::size_t workerCount = ResolveWorkerCount(options.workerCount, items.size());
    if (workerCount == 1)
    {
        work();
    }
    else
    {
        std::vector<std::jthread> workers;
        workers.reserve(workerCount);
        for (std::size_t index = 0; index < workerCount; ++index)
        {
            workers.emplace_back(work);
        }
    }

    for (std::size_t index = 0; index < outcomes.size(); ++index)
    {
        if (processed[index] == 0)
        {
            result.cancelled = true;
            continue;
        }

        auto& outcome = outcomes[index];
        std::move(outcome.browsers.begin(), outcome.browsers.end(), std::back_inserter(result.browsers));
        std::move(outcome.diagnostics.begin(), outcome.diagnostics.end(), std::back_inserter(result.diagnostics));
    }

    return result;
}

ScanResult DiscoverBrowsers(const DiscoveryConfig& config, std::stop_token stopToken)
{
    ScanOptions options;
    options.manifestPath = config.manifestPath;
    options.layout = config.layout;
    options.workerCount = config.workerCount;
    options.stopToken = std::move(stopToken);
    return ScanDirectories(config.roots, options);
}

} // namespace waypoint
