#pragma once
#include "app/ConverterSession.hpp"
#include "adapters/terminal/AnsiConsole.hpp"
#include <iosfwd>
#include <memory>

namespace tempconv::factory {

/// Output styling mode
enum class ConsoleMode {
    INTERACTIVE,  // Colour when stdout is a terminal
    PLAIN         // Never colour
};

/// Factory configuration
struct FactoryConfig {
    ConsoleMode mode = ConsoleMode::INTERACTIVE;
    app::SessionConfig session_config;
};

/// Builds converter sessions with their console wired in
class SessionFactory {
public:
    /// Create a session on stdin/stdout/stderr
    static std::unique_ptr<app::ConverterSession> create(const FactoryConfig& config);

    /// Console on stdin/stdout/stderr styled per `mode`
    static interfaces::ConsolePtr createConsole(ConsoleMode mode = ConsoleMode::INTERACTIVE);

    /// Convenience: interactive session with default texts
    static std::unique_ptr<app::ConverterSession> createInteractive();

    /// Create a session over caller-owned streams (tests, embedding)
    static std::unique_ptr<app::ConverterSession> createWithStreams(
        std::istream& in,
        std::ostream& out,
        std::ostream& err,
        bool use_color = false,
        const app::SessionConfig& session_config = {}
    );
};

} // namespace tempconv::factory
