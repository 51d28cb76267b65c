#pragma once

#include "core/browser_discovery.hpp"
#include "core/presentation_list.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace waypoint::app
{

class UsageError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct CommandLine
{
    std::filesystem::path configPath;
    std::string url;
    // 1-based positions into the printed list.
    std::optional<std::size_t> openIndex;
    std::optional<std::size_t> iconIndex;
    bool verbose = false;
    bool list = false;
    bool help = false;
};

//! Throws UsageError on unknown flags, missing values or bad indices.
[[nodiscard]] CommandLine ParseCommandLine(const std::vector<std::string>& arguments);

void PrintUsage(std::ostream& out);

void PrintDisplayList(std::ostream& out, const std::vector<DisplayItem>& items);

void PrintDiagnostics(std::ostream& out, const std::vector<ScanDiagnostic>& diagnostics);

class Application
{
  public:
    explicit Application(CommandLine commandLine);

    int Run();

  private:
    [[nodiscard]] const BrowserCandidate* Select(std::size_t index) const;
    int OpenSelected(std::size_t index);
    int ShowIcon(std::size_t index);

    CommandLine commandLine_;
    ScanResult scan_;
    std::vector<DisplayItem> items_;
};

} // namespace waypoint::app
