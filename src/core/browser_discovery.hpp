#pragma once

#include "core/browser.hpp"
#include "core/browser_extractor.hpp"

#include <cstddef>
#include <filesystem>
#include <stop_token>
#include <vector>

namespace waypoint
{

struct ScanOptions
{
    // Manifest location relative to each application entry. Its parent
    // directory is the root handed to the extractor.
    std::filesystem::path manifestPath = "Contents/Info.plist";
    BundleLayout layout;
    // 0 picks std::thread::hardware_concurrency().
    std::size_t workerCount = 0;
    std::stop_token stopToken;
};

struct DiscoveryConfig
{
    std::vector<std::filesystem::path> roots;
    std::filesystem::path manifestPath = "Contents/Info.plist";
    BundleLayout layout;
    std::size_t workerCount = 0;
    bool deduplicate = true;
};

struct ScanResult
{
    std::vector<BrowserCandidate> browsers;
    std::vector<ScanDiagnostic> diagnostics;
    bool cancelled = false;
};

struct EntryOutcome
{
    std::vector<BrowserCandidate> browsers;
    std::vector<ScanDiagnostic> diagnostics;
};

//! Runs reader, filter and extractor for one application entry. Never throws
//! for problems with the entry itself; they come back as diagnostics.
[[nodiscard]] EntryOutcome ScanEntry(const std::filesystem::path& entry, const ScanOptions& options);

/**
 * @brief Scans the immediate children of every root for browser bundles.
 *
 * Entries without a manifest are skipped silently, entries that are not
 * browsers are dropped, and every other failure becomes a diagnostic so the
 * rest of the scan is unaffected. Output is ordered by root, then by entry
 * file name, regardless of how many workers ran.
 */
[[nodiscard]] ScanResult ScanDirectories(
    const std::vector<std::filesystem::path>& roots,
    const ScanOptions& options = {});

[[nodiscard]] ScanResult DiscoverBrowsers(const DiscoveryConfig& config, std::stop_token stopToken = {});

} // namespace waypoint
