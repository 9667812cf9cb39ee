#pragma once
#include <memory>
#include <string>

namespace tempconv::interfaces {

/// Presentation style for a piece of console output
enum class TextStyle {
    PLAIN,
    HEADER,     // Section banner
    KEYWORD,    // Inline keyword the user can type
    ERROR,      // Validation and fatal errors
    NOTICE,     // Status messages (quit confirmation)
    RESULT      // Conversion output
};

/// Outcome of a blocking line read
enum class ReadStatus {
    OK,
    END_OF_INPUT,     // No more lines available
    STREAM_ERROR,     // Underlying transport failed
    INVALID_ENCODING  // Line is not valid UTF-8
};

/// Human-readable description of a failed read
inline const char* describe(ReadStatus status) {
    switch (status) {
        case ReadStatus::OK:               return "no error";
        case ReadStatus::END_OF_INPUT:     return "unexpected end of input";
        case ReadStatus::STREAM_ERROR:     return "failed to read from input stream";
        case ReadStatus::INVALID_ENCODING: return "stream did not contain valid UTF-8";
    }
    return "unknown read status";
}

/// Abstract interface for line-oriented console I/O
/// Implementations: AnsiConsole (terminal/streams), MockConsole (test)
class IConsole {
public:
    virtual ~IConsole() = default;

    /// Block until one full line is available
    /// @param line Output line, without the trailing newline
    /// @return OK, or the reason no line could be read
    virtual ReadStatus readLine(std::string& line) = 0;

    /// Write text to the output channel (no newline appended)
    virtual void write(const std::string& text, TextStyle style = TextStyle::PLAIN) = 0;

    /// Write text to the error channel (no newline appended)
    virtual void writeError(const std::string& text, TextStyle style = TextStyle::ERROR) = 0;

    /// Convenience: write text followed by a newline
    virtual void writeLine(const std::string& text, TextStyle style = TextStyle::PLAIN) {
        write(text, style);
        write("\n");
    }
};

using ConsolePtr = std::unique_ptr<IConsole>;

} // namespace tempconv::interfaces
