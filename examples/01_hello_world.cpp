/**
 * Example 01: Hello World
 *
 * The smallest Cascade application.
 * Concepts:
 * - App instance creation
 * - A single middleware that sets the body
 * - Starting the server
 */

#include <cascade/app.h>
#include <cascade/environment.h>
#include <iostream>

using namespace cascade;

int main() {
    load_env();

    // 1. Create the application (configuration comes from CASCADE_* variables)
    App app;

    // 2. Every request runs through this middleware
    app.use([](Context& ctx) -> Async<void> {
        ctx.body("Hello from Cascade!");
        co_return;
    });

    // 3. Start the server on port 8080 (blocking)
    const int port = env<int>("PORT", 8080);
    std::cout << "Starting server on http://localhost:" << port << std::endl;
    app.listen(port);

    return 0;
}
