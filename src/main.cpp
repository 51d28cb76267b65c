#include "app/application.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char** argv)
{
    const std::vector<std::string> arguments(argv + 1, argv + argc);

    waypoint::app::CommandLine commandLine;
    try
    {
        commandLine = waypoint::app::ParseCommandLine(arguments);
    }
    catch (const waypoint::app::UsageError& ex)
    {
        std::cerr << ex.what() << '\n';
        waypoint::app::PrintUsage(std::cerr);
        return 2;
    }

    try
    {
        waypoint::app::Application app{std::move(commandLine)};
        return app.Run();
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << '\n';
        return EXIT_FAILURE;
    }
}
