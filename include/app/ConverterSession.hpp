#pragma once
#include "interfaces/IConsole.hpp"
#include "core/Types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace tempconv::app {

/// Session texts
struct SessionConfig {
    std::string header = "--- Temperature Conversion ---";
    std::string unit_prompt = "Enter C to convert to Fahrenheit or F to convert to Celsius";
    std::string unit_error = "Invalid input. Please enter 'C' or 'F'.";
    std::string celsius_value_prompt = "Enter a number to convert Celsius to Fahrenheit.";
    std::string fahrenheit_value_prompt = "Enter a number to convert Fahrenheit to Celsius.";
    std::string value_error = "Invalid temperature. Please enter a number.";
    std::string quit_keyword = "quit";  // Compared against sanitized (lower-case) input
    std::string quit_notice = "Exiting program.";
};

/// Position in the conversion cycle
enum class SessionState {
    AWAITING_UNIT,
    AWAITING_VALUE,
    CONVERTING,
    DONE,
    QUIT,
    IO_FAILURE
};

/// How the session terminated
enum class SessionStatus {
    FINISHED,   // Conversion printed
    QUIT,       // User typed the quit keyword
    IO_FAILURE  // Input could not be read
};

struct SessionResult {
    SessionStatus status = SessionStatus::FINISHED;
    std::string error;                          // Set for IO_FAILURE
    std::optional<core::Conversion> conversion; // Set for FINISHED
};

/// Process exit code for a session outcome (0 finished/quit, 1 I/O failure)
int exitCode(SessionStatus status);

/// Print the closing message for a finished session
/// FINISHED: "Program finished normally." on the output channel
/// QUIT: nothing (the quit notice was already printed)
/// IO_FAILURE: "Program terminated due to I/O error: <error>" on the error channel
void reportOutcome(interfaces::IConsole& console, const SessionResult& result);

/// Print "Program terminated due to error: <what>" on the error channel
void reportFatalError(interfaces::IConsole& console, const std::string& what);

/// One interactive conversion cycle over a console
class ConverterSession {
public:
    /// @throws std::invalid_argument if console is null
    explicit ConverterSession(
        interfaces::ConsolePtr console,
        const SessionConfig& config = {}
    );

    /// Drive the cycle to a terminal state
    /// Only the first call touches the console; later calls return the same result.
    SessionResult run();

    SessionState state() const { return state_; }
    const SessionConfig& config() const { return config_; }
    interfaces::IConsole& console() { return *console_; }

    using ConversionCallback = std::function<void(const core::Conversion&)>;
    void setConversionCallback(ConversionCallback cb) { conversion_callback_ = std::move(cb); }

private:
    interfaces::ConsolePtr console_;
    SessionConfig config_;

    SessionState state_ = SessionState::AWAITING_UNIT;
    SessionResult result_;
    bool finished_ = false;

    core::TemperatureUnit source_unit_ = core::TemperatureUnit::CELSIUS;
    double source_value_ = 0.0;

    ConversionCallback conversion_callback_;

    void stepAwaitingUnit();
    void stepAwaitingValue();
    void stepConverting();
    void fail(const std::string& error);
    void quit();
};

} // namespace tempconv::app
