#include <gtest/gtest.h>

#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "cli.hpp"
#include "errors.hpp"
#include "terminal.hpp"

namespace {

// Delivers SIGINT to this process once the completion banner is written.
class InterruptOnBanner : public std::stringbuf {
private:
    bool raised = false;

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        std::streamsize written = std::stringbuf::xsputn(s, n);
        if (!raised && str().find("DONE!") != std::string::npos) {
            raised = true;
            std::raise(SIGINT);
        }
        return written;
    }
};

}  // namespace

TEST(ParseArgs, DefaultsLabel) {
    const char* argv[] = {"pomotimer", "25m"};
    CliOptions options = parse_args(2, argv);
    EXPECT_EQ(options.duration, "25m");
    EXPECT_EQ(options.label, "TIMER");
    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.help);
}

TEST(ParseArgs, LabelAndFlags) {
    const char* argv[] = {"pomotimer", "-v", "25:00", "FOCUS"};
    CliOptions options = parse_args(4, argv);
    EXPECT_EQ(options.duration, "25:00");
    EXPECT_EQ(options.label, "FOCUS");
    EXPECT_TRUE(options.verbose);
}

TEST(ParseArgs, DashedDurationIsPositional) {
    const char* argv[] = {"pomotimer", "-5s"};
    EXPECT_EQ(parse_args(2, argv).duration, "-5s");
}

TEST(ParseArgs, FlagLookingLabel) {
    const char* argv[] = {"pomotimer", "25m", "-h"};
    CliOptions options = parse_args(3, argv);
    EXPECT_EQ(options.duration, "25m");
    EXPECT_EQ(options.label, "-h");
    EXPECT_FALSE(options.help);

    const char* verbose_label[] = {"pomotimer", "-v", "25m", "--verbose"};
    options = parse_args(4, verbose_label);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.label, "--verbose");
}

TEST(ParseArgs, DoubleDashEndsFlags) {
    const char* argv[] = {"pomotimer", "--", "-h"};
    CliOptions options = parse_args(3, argv);
    EXPECT_FALSE(options.help);
    EXPECT_EQ(options.duration, "-h");
}

TEST(ParseArgs, MissingDuration) {
    const char* argv[] = {"pomotimer", "--verbose"};
    EXPECT_THROW(parse_args(2, argv), MissingArgument);
}

TEST(RunCli, UsageWithoutArguments) {
    std::ostringstream out;
    const char* argv[] = {"pomotimer"};
    EXPECT_EQ(run_cli(1, argv, out), 1);
    EXPECT_EQ(out.str(),
              "Usage: pomotimer DURATION [LABEL]\n"
              "  DURATION examples: 25m, 90s, 1m30s, 25:00, 1500\n");
}

TEST(RunCli, Help) {
    std::ostringstream out;
    const char* argv[] = {"pomotimer", "--help"};
    EXPECT_EQ(run_cli(2, argv, out), 0);
    EXPECT_NE(out.str().find("LABEL optional"), std::string::npos);
}

TEST(RunCli, InvalidDuration) {
    std::ostringstream out;
    const char* argv[] = {"pomotimer", "25.5m"};
    EXPECT_EQ(run_cli(2, argv, out), 2);
    EXPECT_TRUE(out.str().empty());
}

TEST(RunCli, ZeroDuration) {
    std::ostringstream out;
    const char* argv[] = {"pomotimer", "00:00"};
    EXPECT_EQ(run_cli(2, argv, out), 2);
}

TEST(RunCli, Completes) {
    std::ostringstream out;
    const char* argv[] = {"pomotimer", "1s", "TEA"};
    EXPECT_EQ(run_cli(3, argv, out), 0);
    EXPECT_NE(out.str().find("\x1b[7m DONE! TEA finished. \x1b[0m"), std::string::npos);
}

TEST(RunCli, HelpAsLabelStillRuns) {
    std::ostringstream out;
    const char* argv[] = {"pomotimer", "1s", "-h"};
    EXPECT_EQ(run_cli(3, argv, out), 0);
    EXPECT_NE(out.str().find("DONE! -h finished."), std::string::npos);
    EXPECT_EQ(out.str().find("Usage:"), std::string::npos);
}

TEST(RunCli, InterruptDuringBannerExitsWith130) {
    InterruptOnBanner buffer;
    std::ostream out(&buffer);
    const char* argv[] = {"pomotimer", "1s", "TEA"};
    EXPECT_EQ(run_cli(3, argv, out), 130);
    EXPECT_NE(buffer.str().find("Interrupted."), std::string::npos);
}

TEST(RunCli, InterruptExitsWith130) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        close(fds[1]);
        const char* argv[] = {"pomotimer", "30s", "FOCUS"};
        int status = run_cli(3, argv, std::cout);
        std::cout.flush();
        _exit(status);
    }
    close(fds[1]);

    std::string output;
    char buffer[256];
    ssize_t n = 0;
    // The handler is installed before the first frame is drawn.
    while (output.find('%') == std::string::npos && (n = read(fds[0], buffer, sizeof(buffer))) > 0) {
        output.append(buffer, static_cast<size_t>(n));
    }
    ASSERT_EQ(kill(pid, SIGINT), 0);
    while ((n = read(fds[0], buffer, sizeof(buffer))) > 0) {
        output.append(buffer, static_cast<size_t>(n));
    }
    close(fds[0]);

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 130);

    size_t interrupted = output.find("Interrupted.");
    ASSERT_NE(interrupted, std::string::npos);
    EXPECT_NE(output.find(ansi::SHOW_CURSOR, interrupted), std::string::npos);
    EXPECT_EQ(output.find("DONE!"), std::string::npos);
}
