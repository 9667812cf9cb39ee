#include "adapters/terminal/AnsiConsole.hpp"
#include "core/Utf8.hpp"
#include <istream>
#include <ostream>
#include <unistd.h>

namespace tempconv::adapters::terminal {

namespace {

const char* kReset = "\x1b[0m";

} // namespace

AnsiConsole::AnsiConsole(
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    const ConsoleConfig& config
)
    : in_(in)
    , out_(out)
    , err_(err)
    , config_(config)
{
}

interfaces::ReadStatus AnsiConsole::readLine(std::string& line) {
    // Prompts must be visible before blocking
    out_.flush();

    if (std::getline(in_, line)) {
        if (!core::isValidUtf8(line)) {
            return interfaces::ReadStatus::INVALID_ENCODING;
        }
        return interfaces::ReadStatus::OK;
    }
    if (in_.bad()) {
        return interfaces::ReadStatus::STREAM_ERROR;
    }
    return interfaces::ReadStatus::END_OF_INPUT;
}

void AnsiConsole::write(const std::string& text, interfaces::TextStyle style) {
    emit(out_, text, style);
}

void AnsiConsole::writeError(const std::string& text, interfaces::TextStyle style) {
    emit(err_, text, style);
    err_.flush();
}

const char* AnsiConsole::sequenceFor(interfaces::TextStyle style) {
    // Bold + foreground colour
    switch (style) {
        case interfaces::TextStyle::PLAIN:   return "";
        case interfaces::TextStyle::HEADER:  return "\x1b[1;36m";
        case interfaces::TextStyle::KEYWORD: return "\x1b[1;33m";
        case interfaces::TextStyle::ERROR:   return "\x1b[1;31m";
        case interfaces::TextStyle::NOTICE:  return "\x1b[1;33m";
        case interfaces::TextStyle::RESULT:  return "\x1b[1;32m";
    }
    return "";
}

void AnsiConsole::emit(std::ostream& stream, const std::string& text, interfaces::TextStyle style) {
    if (!config_.use_color || style == interfaces::TextStyle::PLAIN) {
        stream << text;
        return;
    }
    stream << sequenceFor(style) << text << kReset;
}

bool stdoutIsTerminal() {
    return isatty(STDOUT_FILENO) != 0;
}

} // namespace tempconv::adapters::terminal
