/**
 * @file main.cpp
 * @brief tempconv - interactive Celsius/Fahrenheit converter
 *
 * @details One cycle per invocation:
 * 1. Ask for the source unit (C or F)
 * 2. Ask for the value
 * 3. Convert to the other unit and print the equation
 *
 * "quit" at either prompt ends the program (exit 0).
 * A failed read (e.g. end of input) ends it with exit 1.
 */

#include <exception>
#include "factory/SessionFactory.hpp"

using namespace tempconv;

int main() {
    try {
        auto session = factory::SessionFactory::createInteractive();
        app::SessionResult result = session->run();

        app::reportOutcome(session->console(), result);
        return app::exitCode(result.status);
    } catch (const std::exception& e) {
        auto console = factory::SessionFactory::createConsole();
        app::reportFatalError(*console, e.what());
        return 1;
    }
}
