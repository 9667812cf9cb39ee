#pragma once
#include "interfaces/IConsole.hpp"
#include <iosfwd>

namespace tempconv::adapters::terminal {

/// Console adapter configuration
struct ConsoleConfig {
    bool use_color = true;  // Emit ANSI SGR sequences around styled text
};

/// IConsole over standard streams, styling output with ANSI escape codes
/// The streams are borrowed and must outlive the console.
class AnsiConsole : public interfaces::IConsole {
public:
    AnsiConsole(
        std::istream& in,
        std::ostream& out,
        std::ostream& err,
        const ConsoleConfig& config = {}
    );

    interfaces::ReadStatus readLine(std::string& line) override;
    void write(const std::string& text, interfaces::TextStyle style = interfaces::TextStyle::PLAIN) override;
    void writeError(const std::string& text, interfaces::TextStyle style = interfaces::TextStyle::ERROR) override;

    bool colorEnabled() const { return config_.use_color; }

    /// SGR opening sequence for a style ("" for PLAIN)
    static const char* sequenceFor(interfaces::TextStyle style);

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    ConsoleConfig config_;

    void emit(std::ostream& stream, const std::string& text, interfaces::TextStyle style);
};

/// True when stdout is attached to a terminal
bool stdoutIsTerminal();

} // namespace tempconv::adapters::terminal
