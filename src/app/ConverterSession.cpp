#include "app/ConverterSession.hpp"
#include "app/InputPrompt.hpp"
#include "core/Conversion.hpp"
#include "core/EquationFormatter.hpp"
#include <stdexcept>

namespace tempconv::app {

int exitCode(SessionStatus status) {
    return status == SessionStatus::IO_FAILURE ? 1 : 0;
}

void reportOutcome(interfaces::IConsole& console, const SessionResult& result) {
    switch (result.status) {
        case SessionStatus::FINISHED:
            console.write("\n");
            console.writeLine("Program finished normally.");
            break;
        case SessionStatus::QUIT:
            break;
        case SessionStatus::IO_FAILURE:
            console.writeError("Program terminated due to I/O error: " + result.error);
            console.writeError("\n", interfaces::TextStyle::PLAIN);
            break;
    }
}

void reportFatalError(interfaces::IConsole& console, const std::string& what) {
    console.writeError("Program terminated due to error: " + what);
    console.writeError("\n", interfaces::TextStyle::PLAIN);
}

ConverterSession::ConverterSession(
    interfaces::ConsolePtr console,
    const SessionConfig& config
)
    : console_(std::move(console))
    , config_(config)
{
    if (!console_) {
        throw std::invalid_argument("ConverterSession requires a console");
    }
}

SessionResult ConverterSession::run() {
    if (finished_) {
        return result_;
    }

    console_->write("\n");
    console_->writeLine(config_.header, interfaces::TextStyle::HEADER);

    while (!finished_) {
        switch (state_) {
            case SessionState::AWAITING_UNIT:
                stepAwaitingUnit();
                break;
            case SessionState::AWAITING_VALUE:
                stepAwaitingValue();
                break;
            case SessionState::CONVERTING:
                stepConverting();
                break;
            case SessionState::DONE:
            case SessionState::QUIT:
            case SessionState::IO_FAILURE:
                finished_ = true;
                break;
        }
    }
    return result_;
}

void ConverterSession::stepAwaitingUnit() {
    PromptTexts texts;
    texts.message = config_.unit_prompt;
    texts.error_message = config_.unit_error;
    texts.quit_keyword = config_.quit_keyword;
    texts.quit_notice = config_.quit_notice;

    auto prompt = promptUntilValid<core::TemperatureUnit>(*console_, texts, core::parseUnit);
    switch (prompt.status) {
        case PromptStatus::VALUE:
            source_unit_ = prompt.value;
            state_ = SessionState::AWAITING_VALUE;
            break;
        case PromptStatus::QUIT:
            quit();
            break;
        case PromptStatus::IO_FAILURE:
            fail(prompt.error);
            break;
    }
}

void ConverterSession::stepAwaitingValue() {
    PromptTexts texts;
    texts.message = source_unit_ == core::TemperatureUnit::CELSIUS
        ? config_.celsius_value_prompt
        : config_.fahrenheit_value_prompt;
    texts.error_message = config_.value_error;
    texts.quit_keyword = config_.quit_keyword;
    texts.quit_notice = config_.quit_notice;

    auto prompt = promptUntilValid<double>(*console_, texts, core::parseValue);
    switch (prompt.status) {
        case PromptStatus::VALUE:
            source_value_ = prompt.value;
            state_ = SessionState::CONVERTING;
            break;
        case PromptStatus::QUIT:
            quit();
            break;
        case PromptStatus::IO_FAILURE:
            fail(prompt.error);
            break;
    }
}

void ConverterSession::stepConverting() {
    core::Conversion conversion;
    conversion.source.value = source_value_;
    conversion.source.unit = source_unit_;
    conversion.target = core::convertTo(conversion.source, core::oppositeUnit(source_unit_));

    console_->writeLine(core::formatEquation(conversion), interfaces::TextStyle::RESULT);

    if (conversion_callback_) {
        conversion_callback_(conversion);
    }

    result_.status = SessionStatus::FINISHED;
    result_.conversion = conversion;
    state_ = SessionState::DONE;
}

void ConverterSession::fail(const std::string& error) {
    result_.status = SessionStatus::IO_FAILURE;
    result_.error = error;
    state_ = SessionState::IO_FAILURE;
}

void ConverterSession::quit() {
    result_.status = SessionStatus::QUIT;
    state_ = SessionState::QUIT;
}

} // namespace tempconv::app
