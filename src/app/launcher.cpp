#include "app/launcher.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace waypoint::app
{

std::string QuotePosixArgument(std::string_view argument)
{
    std::string quoted;
    quoted.reserve(argument.size() + 2);
    quoted.push_back('\'');
    for (char ch : argument)
    {
        if (ch == '\'')
        {
            quoted.append("'\\''");
            continue;
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

std::string QuoteWindowsArgument(std::string_view argument)
{
    std::string quoted;
    quoted.reserve(argument.size() + 2);
    quoted.push_back('"');
    for (char ch : argument)
    {
        // cmd.exe has no escape inside a quoted string, so a quote would end it.
        if (ch == '"')
        {
            quoted.append("%22");
            continue;
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

std::string QuoteArgument(std::string_view argument)
{
#if defined(_WIN32)
    return QuoteWindowsArgument(argument);
#else
    return QuotePosixArgument(argument);
#endif
}

std::string BuildLaunchCommand(const BrowserCandidate& browser, std::string_view url)
{
#if defined(_WIN32)
    std::string command = "start \"\" " + QuoteArgument(browser.executablePath.string());
#else
    std::string command = QuoteArgument(browser.executablePath.string());
#endif

    for (const auto& argument : browser.launchArguments)
    {
        command += ' ';
        command += QuoteArgument(argument);
    }

    if (!url.empty())
    {
        command += ' ';
        command += QuoteArgument(url);
    }

#if !defined(_WIN32)
    command += " &";
#endif
    return command;
}

bool Launch(const BrowserCandidate& browser, std::string_view url)
{
    std::error_code ec;
    if (!std::filesystem::exists(browser.executablePath, ec))
    {
        std::cerr << "Executable missing: " << browser.executablePath << '\n';
        return false;
    }

    const std::string command = BuildLaunchCommand(browser, url);
    const int status = std::system(command.c_str());
    if (status != 0)
    {
        std::cerr << "Failed to launch " << browser.executablePath << " (status " << status << ")" << '\n';
        return false;
    }
    return true;
}

} // namespace waypoint::app
