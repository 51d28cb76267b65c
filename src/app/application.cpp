#include "app/application.hpp"

#include "app/launcher.hpp"
#include "icons/icon_converter.hpp"
#include "services/settings_service.hpp"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <system_error>
#include <utility>

namespace waypoint::app
{
namespace
{
std::size_t ParseIndex(const std::string& flag, const std::string& value)
{
    std::size_t index = 0;
    const auto* first = value.data();
    const auto* last = value.data() + value.size();
    const auto [end, ec] = std::from_chars(first, last, index);
    if (ec != std::errc{} || end != last || index == 0)
    {
        throw UsageError(flag + " expects a positive list index, got \"" + value + "\"");
    }
    return index;
}

const std::string& RequireValue(const std::vector<std::string>& arguments, std::size_t& position)
{
    const std::string& flag = arguments[position];
    if (position + 1 >= arguments.size())
    {
        throw UsageError(flag + " requires a value");
    }
    return arguments[++position];
}
} // namespace

CommandLine ParseCommandLine(const std::vector<std::string>& arguments)
{
    CommandLine commandLine;
    for (std::size_t position = 0; position < arguments.size(); ++position)
    {
        const std::string& argument = arguments[position];
        if (argument == "--help" || argument == "-h")
        {
            commandLine.help = true;
        }
        else if (argument == "--verbose" || argument == "-v")
        {
            commandLine.verbose = true;
        }
        else if (argument == "--list")
        {
            commandLine.list = true;
        }
        else if (argument == "--config")
        {
            commandLine.configPath = RequireValue(arguments, position);
        }
        else if (argument == "--open")
        {
            commandLine.openIndex = ParseIndex(argument, RequireValue(arguments, position));
        }
        else if (argument == "--icon")
        {
            commandLine.iconIndex = ParseIndex(argument, RequireValue(arguments, position));
        }
        else if (argument.rfind("-", 0) == 0 && argument.size() > 1)
        {
            throw UsageError("Unknown option: " + argument);
        }
        else if (commandLine.url.empty())
        {
            commandLine.url = argument;
        }
        else
        {
            throw UsageError("Only one URL may be given");
        }
    }

    if (!commandLine.openIndex && !commandLine.iconIndex)
    {
        commandLine.list = true;
    }
    return commandLine;
}

void PrintUsage(std::ostream& out)
{
    out << "Usage: waypoint [--config PATH] [--verbose] [--list] [--open INDEX] [--icon INDEX] [URL]\n"
        << "  --config PATH  read settings from PATH instead of ~/.waypoint/config.json\n"
        << "  --verbose      print every scan diagnostic\n"
        << "  --list         print the browser list (default)\n"
        << "  --open INDEX   launch the browser at INDEX with URL\n"
        << "  --icon INDEX   decode the icon of the browser at INDEX\n";
}

void PrintDisplayList(std::ostream& out, const std::vector<DisplayItem>& items)
{
    if (items.empty())
    {
        out << "No browsers found." << '\n';
        return;
    }

    std::size_t position = 1;
    for (const auto& item : items)
    {
        out << position++ << ". " << item.title;
        if (!item.subtitle.empty())
        {
            out << " (" << item.subtitle << ')';
        }
        if (!item.available)
        {
            out << " [missing]";
        }
        out << '\n';
    }
}

void PrintDiagnostics(std::ostream& out, const std::vector<ScanDiagnostic>& diagnostics)
{
    for (const auto& diagnostic : diagnostics)
    {
        out << '[' << diagnostic.stage << "] " << diagnostic.source.string() << ": " << diagnostic.message << " ("
            << ToString(diagnostic.category) << ')' << '\n';
    }
}

Application::Application(CommandLine commandLine) : commandLine_(std::move(commandLine))
{
}

int Application::Run()
{
    if (commandLine_.help)
    {
        PrintUsage(std::cout);
        return EXIT_SUCCESS;
    }

    services::SettingsService settings;
    settings.Load(
        commandLine_.configPath.empty() ? services::SettingsService::DefaultPath() : commandLine_.configPath);

    scan_ = DiscoverBrowsers(settings.Config());
    items_ = BuildDisplayList(scan_.browsers, settings.Config().deduplicate);

    if (commandLine_.verbose)
    {
        PrintDiagnostics(std::cerr, scan_.diagnostics);
    }
    else if (!scan_.diagnostics.empty())
    {
        std::cerr << scan_.diagnostics.size() << " application(s) could not be read; run with --verbose for details"
                  << '\n';
    }

    if (commandLine_.list)
    {
        if (!commandLine_.url.empty())
        {
            std::cout << "Open " << commandLine_.url << " with:" << '\n';
        }
        PrintDisplayList(std::cout, items_);
    }

    int status = EXIT_SUCCESS;
    if (commandLine_.iconIndex)
    {
        status = ShowIcon(*commandLine_.iconIndex);
    }
    if (status == EXIT_SUCCESS && commandLine_.openIndex)
    {
        status = OpenSelected(*commandLine_.openIndex);
    }
    return status;
}

const BrowserCandidate* Application::Select(std::size_t index) const
{
    if (index == 0 || index > items_.size())
    {
        std::cerr << "No browser at position " << index << "; the list has " << items_.size() << " entries" << '\n';
        return nullptr;
    }
    return &scan_.browsers[items_[index - 1].candidateIndex];
}

int Application::OpenSelected(std::size_t index)
{
    const BrowserCandidate* browser = Select(index);
    if (browser == nullptr)
    {
        return EXIT_FAILURE;
    }

    std::cout << "Launching " << browser->displayName << "..." << '\n';
    return Launch(*browser, commandLine_.url) ? EXIT_SUCCESS : EXIT_FAILURE;
}

int Application::ShowIcon(std::size_t index)
{
    const BrowserCandidate* browser = Select(index);
    if (browser == nullptr)
    {
        return EXIT_FAILURE;
    }

    try
    {
        auto backend = icons::CreatePlatformIconBackend();
        const icons::IconImage image = icons::ResolveIcon(*browser, *backend);
        std::cout << browser->displayName << " icon: " << image.width() << 'x' << image.height() << ", "
                  << image.pixels().size() << " bytes" << '\n';
        return EXIT_SUCCESS;
    }
    catch (const icons::IconError& ex)
    {
        std::cerr << "Icon unavailable for " << browser->displayName << ": " << ex.what() << " ("
                  << ToString(icons::CategoryFor(ex.kind())) << ')' << '\n';
        return EXIT_FAILURE;
    }
}

} // namespace waypoint::app
