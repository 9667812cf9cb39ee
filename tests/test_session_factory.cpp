#include <gtest/gtest.h>
#include <sstream>
#include "factory/SessionFactory.hpp"

using namespace tempconv;
using factory::SessionFactory;

TEST(SessionFactory, StreamSessionRunsFullCycle) {
    std::istringstream in("  F \n212\n");
    std::ostringstream out, err;

    auto session = SessionFactory::createWithStreams(in, out, err);
    auto result = session->run();
    app::reportOutcome(session->console(), result);

    EXPECT_EQ(result.status, app::SessionStatus::FINISHED);
    EXPECT_EQ(app::exitCode(result.status), 0);
    EXPECT_NE(out.str().find("\n(212°F - 32) * (5/9) = 100°C\n"), std::string::npos);
    EXPECT_NE(out.str().find("\nProgram finished normally.\n"), std::string::npos);
    EXPECT_EQ(out.str().find('\x1b'), std::string::npos);
    EXPECT_EQ(err.str(), "");
}

TEST(SessionFactory, EndOfInputReportsOnErrorStream) {
    std::istringstream in("");
    std::ostringstream out, err;

    auto session = SessionFactory::createWithStreams(in, out, err);
    auto result = session->run();
    app::reportOutcome(session->console(), result);

    EXPECT_EQ(result.status, app::SessionStatus::IO_FAILURE);
    EXPECT_EQ(app::exitCode(result.status), 1);
    EXPECT_EQ(err.str(), "Program terminated due to I/O error: unexpected end of input\n");
    EXPECT_EQ(out.str().find("Program finished normally."), std::string::npos);
}

TEST(SessionFactory, InvalidUtf8StopsAtFirstRead) {
    std::istringstream in("\xFF\xFE\nc\n10\n");
    std::ostringstream out, err;

    auto session = SessionFactory::createWithStreams(in, out, err);
    auto result = session->run();
    app::reportOutcome(session->console(), result);

    EXPECT_EQ(result.status, app::SessionStatus::IO_FAILURE);
    EXPECT_EQ(app::exitCode(result.status), 1);
    EXPECT_EQ(session->state(), app::SessionState::IO_FAILURE);
    EXPECT_EQ(err.str(), "Program terminated due to I/O error: stream did not contain valid UTF-8\n");
    EXPECT_EQ(out.str().find("Invalid input."), std::string::npos);
    EXPECT_EQ(out.str().find("Enter a number"), std::string::npos);
}

TEST(SessionFactory, InvalidUtf8AtValuePromptFails) {
    std::istringstream in("f\n98\xC0\xAF\n");
    std::ostringstream out, err;

    auto session = SessionFactory::createWithStreams(in, out, err);
    auto result = session->run();

    EXPECT_EQ(result.status, app::SessionStatus::IO_FAILURE);
    EXPECT_EQ(result.error, "stream did not contain valid UTF-8");
    EXPECT_EQ(out.str().find("Invalid temperature."), std::string::npos);
}

TEST(SessionFactory, NonBreakingSpaceAroundInputIsTrimmed) {
    std::istringstream in("c\xC2\xA0\n\xC2\xA0" "10\n");
    std::ostringstream out, err;

    auto session = SessionFactory::createWithStreams(in, out, err);
    auto result = session->run();

    EXPECT_EQ(result.status, app::SessionStatus::FINISHED);
    EXPECT_EQ(out.str().find("Invalid"), std::string::npos);
    EXPECT_NE(out.str().find("\n(10°C * 9/5) + 32 = 50°F\n"), std::string::npos);
}

TEST(SessionFactory, QuitSkipsFinishedMessage) {
    std::istringstream in("c\nquit\n");
    std::ostringstream out, err;

    auto session = SessionFactory::createWithStreams(in, out, err);
    auto result = session->run();
    app::reportOutcome(session->console(), result);

    EXPECT_EQ(result.status, app::SessionStatus::QUIT);
    EXPECT_NE(out.str().find("Exiting program.\n"), std::string::npos);
    EXPECT_EQ(out.str().find("Program finished normally."), std::string::npos);
}

TEST(SessionFactory, ColorStreamsCarryEscapes) {
    std::istringstream in("x\nquit\n");
    std::ostringstream out, err;

    auto session = SessionFactory::createWithStreams(in, out, err, true);
    session->run();

    EXPECT_NE(out.str().find("\x1b[1;36m--- Temperature Conversion ---\x1b[0m"), std::string::npos);
    EXPECT_NE(out.str().find("\x1b[1;31mInvalid input. Please enter 'C' or 'F'.\x1b[0m"), std::string::npos);
    EXPECT_NE(out.str().find("\x1b[1;33mExiting program.\x1b[0m"), std::string::npos);
}

TEST(SessionFactory, CreateAppliesSessionConfig) {
    factory::FactoryConfig config;
    config.mode = factory::ConsoleMode::PLAIN;
    config.session_config.header = "plain";

    auto session = SessionFactory::create(config);
    ASSERT_NE(session, nullptr);
    EXPECT_EQ(session->config().header, "plain");
    EXPECT_EQ(session->state(), app::SessionState::AWAITING_UNIT);
}

TEST(SessionFactory, FallbackConsoleIsAvailable) {
    auto console = SessionFactory::createConsole(factory::ConsoleMode::PLAIN);
    ASSERT_NE(console, nullptr);
}
