#include "doctest/doctest.h"

#include "core/presentation_list.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

using waypoint::BrowserCandidate;
using waypoint::BuildDisplayList;

namespace
{
BrowserCandidate Candidate(std::string name, std::filesystem::path executable, bool exists = true)
{
    BrowserCandidate browser;
    browser.displayName = std::move(name);
    browser.executablePath = std::move(executable);
    browser.executableExists = exists;
    browser.version.productName = browser.displayName;
    return browser;
}

std::vector<std::string> Titles(const std::vector<waypoint::DisplayItem>& items)
{
    std::vector<std::string> titles;
    for (const auto& item : items)
    {
        titles.push_back(item.title);
    }
    return titles;
}
} // namespace

TEST_CASE("BuildDisplayList sorts titles by byte order")
{
    const std::vector<BrowserCandidate> browsers{
        Candidate("Zeta", "/Applications/Zeta.app/Contents/MacOS/zeta"),
        Candidate("Alpha", "/Applications/Alpha.app/Contents/MacOS/alpha"),
        Candidate("alpha", "/Applications/alpha.app/Contents/MacOS/alpha"),
    };

    const auto items = BuildDisplayList(browsers);
    CHECK(Titles(items) == std::vector<std::string>{"Alpha", "Zeta", "alpha"});
    CHECK(items[0].candidateIndex == 1);
    CHECK(items[1].candidateIndex == 0);
    CHECK(items[2].candidateIndex == 2);
}

TEST_CASE("BuildDisplayList keeps discovery order for equal titles")
{
    const std::vector<BrowserCandidate> browsers{
        Candidate("Chrome", "/Applications/Chrome.app/Contents/MacOS/Google Chrome"),
        Candidate("Chrome", "/Users/me/Applications/Chrome.app/Contents/MacOS/Google Chrome"),
    };

    const auto items = BuildDisplayList(browsers);
    REQUIRE(items.size() == 2);
    CHECK(items[0].candidateIndex == 0);
    CHECK(items[1].candidateIndex == 1);
}

TEST_CASE("BuildDisplayList drops later candidates sharing an executable")
{
    const std::vector<BrowserCandidate> browsers{
        Candidate("Edge", "/Applications/Edge.app/Contents/MacOS/Edge"),
        Candidate("Edge Beta", "/Applications/Edge.app/Contents/MacOS/../MacOS/Edge"),
        Candidate("Brave", "/Applications/Brave.app/Contents/MacOS/Brave", false),
    };

    const auto deduplicated = BuildDisplayList(browsers);
    CHECK(Titles(deduplicated) == std::vector<std::string>{"Brave", "Edge"});
    CHECK_FALSE(deduplicated[0].available);
    CHECK(deduplicated[1].available);

    const auto everything = BuildDisplayList(browsers, false);
    CHECK(Titles(everything) == std::vector<std::string>{"Brave", "Edge", "Edge Beta"});
}

TEST_CASE("BuildDisplayList handles an empty candidate list")
{
    CHECK(BuildDisplayList({}).empty());
}

TEST_CASE("BuildSubtitle joins the available version details")
{
    BrowserCandidate browser = Candidate("Firefox", "/Applications/Firefox.app/Contents/MacOS/firefox");
    CHECK(waypoint::BuildSubtitle(browser).empty());

    browser.version.productVersion = "128.0";
    browser.version.binaryType = waypoint::BinaryType::Universal;
    CHECK(waypoint::BuildSubtitle(browser) == "128.0 | Universal");

    browser.version.companyName = "Mozilla";
    browser.version.fileDescription = "Web browser";
    CHECK(waypoint::BuildSubtitle(browser) == "128.0 | Universal | Mozilla | Web browser");
}

TEST_CASE("NormalizeExecutablePath resolves symlinks to the same key")
{
    waypoint::testing::TempDirectory temp{"waypoint-normalize"};
    const auto target = waypoint::testing::WriteFile(temp.path() / "real" / "browser", "#!/bin/sh\n");
    const auto link = temp.path() / "link";

    std::error_code ec;
    std::filesystem::create_directory_symlink(temp.path() / "real", link, ec);
    if (ec)
    {
        MESSAGE("symlinks unavailable: " << ec.message());
        return;
    }

    CHECK(waypoint::NormalizeExecutablePath(link / "browser") == waypoint::NormalizeExecutablePath(target));
}
