#include "factory/SessionFactory.hpp"
#include <iostream>

namespace tempconv::factory {

namespace {

bool colorFor(ConsoleMode mode) {
    return mode == ConsoleMode::INTERACTIVE && adapters::terminal::stdoutIsTerminal();
}

} // namespace

std::unique_ptr<app::ConverterSession> SessionFactory::create(const FactoryConfig& config) {
    return createWithStreams(
        std::cin, std::cout, std::cerr, colorFor(config.mode), config.session_config);
}

interfaces::ConsolePtr SessionFactory::createConsole(ConsoleMode mode) {
    adapters::terminal::ConsoleConfig console_config;
    console_config.use_color = colorFor(mode);
    return std::make_unique<adapters::terminal::AnsiConsole>(
        std::cin, std::cout, std::cerr, console_config);
}

std::unique_ptr<app::ConverterSession> SessionFactory::createInteractive() {
    return create(FactoryConfig{});
}

std::unique_ptr<app::ConverterSession> SessionFactory::createWithStreams(
    std::istream& in,
    std::ostream& out,
    std::ostream& err,
    bool use_color,
    const app::SessionConfig& session_config
) {
    adapters::terminal::ConsoleConfig console_config;
    console_config.use_color = use_color;

    interfaces::ConsolePtr console =
        std::make_unique<adapters::terminal::AnsiConsole>(in, out, err, console_config);
    return std::make_unique<app::ConverterSession>(std::move(console), session_config);
}

} // namespace tempconv::factory
