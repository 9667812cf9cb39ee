#pragma once
#include "interfaces/IConsole.hpp"
#include "core/Conversion.hpp"
#include <cctype>
#include <optional>
#include <string>

namespace tempconv::app {

/// How a prompt ended
enum class PromptStatus {
    VALUE,      // A valid value was parsed
    QUIT,       // User typed the quit keyword
    IO_FAILURE  // Input could not be read
};

template <typename T>
struct PromptResult {
    PromptStatus status = PromptStatus::IO_FAILURE;
    T value{};            // Valid only when status == VALUE
    std::string error;    // Set only when status == IO_FAILURE
};

/// Texts for one prompt
struct PromptTexts {
    std::string message;
    std::string error_message;
    std::string quit_keyword = "quit";
    std::string quit_notice = "Exiting program.";
};

/// Write the quit hint followed by the prompt message
inline void writePrompt(interfaces::IConsole& console, const PromptTexts& texts) {
    console.write("\nType \"");
    std::string keyword = texts.quit_keyword;
    for (auto& c : keyword) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    console.write(keyword, interfaces::TextStyle::KEYWORD);
    console.write("\" to end the program or\n");
    console.writeLine(texts.message);
}

/// Ask until the input parses, the user quits, or input fails
/// @param parser Callable std::string -> std::optional<T>, given sanitized input
template <typename T, typename Parser>
PromptResult<T> promptUntilValid(
    interfaces::IConsole& console,
    const PromptTexts& texts,
    Parser parser
) {
    PromptResult<T> result;

    while (true) {
        writePrompt(console, texts);

        std::string line;
        interfaces::ReadStatus status = console.readLine(line);
        if (status != interfaces::ReadStatus::OK) {
            result.status = PromptStatus::IO_FAILURE;
            result.error = interfaces::describe(status);
            return result;
        }

        std::string input = core::sanitizeInput(line);
        if (input == texts.quit_keyword) {
            console.writeLine(texts.quit_notice, interfaces::TextStyle::NOTICE);
            result.status = PromptStatus::QUIT;
            return result;
        }

        std::optional<T> parsed = parser(input);
        if (parsed) {
            result.status = PromptStatus::VALUE;
            result.value = *parsed;
            return result;
        }

        console.writeLine(texts.error_message, interfaces::TextStyle::ERROR);
    }
}

} // namespace tempconv::app
