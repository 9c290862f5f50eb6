#include <catch2/catch_test_macros.hpp>

#include <apktool_mcp/core/terminal.hpp>

#include <cstdlib>

#include <fcntl.h>
#include <unistd.h>

using namespace apktool_mcp;

// ===========================================================================
// Terminal detection
// ===========================================================================

TEST_CASE("IsTerminal: a regular file descriptor is not a terminal", "[core][terminal]") {
    int fd = ::open("/dev/null", O_RDONLY);
    REQUIRE(fd >= 0);
    CHECK_FALSE(IsTerminal(fd));
    ::close(fd);
}

TEST_CASE("IsTerminal: an invalid descriptor is not a terminal", "[core][terminal]") {
    CHECK_FALSE(IsTerminal(-1));
}

TEST_CASE("IsStderrTty / IsStdinTty: agree with IsTerminal", "[core][terminal]") {
    CHECK(IsStderrTty() == IsTerminal(STDERR_FILENO));
    CHECK(IsStdinTty() == IsTerminal(STDIN_FILENO));
}

TEST_CASE("NoColorEnvSet: follows the NO_COLOR variable", "[core][terminal]") {
    const char* saved = std::getenv("NO_COLOR");
    const bool had = saved != nullptr;
    const std::string old = had ? saved : "";

    ::setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    ::unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());

    if (had) ::setenv("NO_COLOR", old.c_str(), 1);
}
