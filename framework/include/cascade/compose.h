#ifndef CASCADE_COMPOSE_H
#define CASCADE_COMPOSE_H

#include <cascade/async.h>
#include <functional>
#include <vector>

namespace cascade {

class Context;

using Next = std::function<Async<void>()>;
using Middleware = std::function<Async<void>(Context&, Next)>;

/**
 * @brief Compiles a middleware list into one middleware.
 *
 * Each middleware runs until it awaits next(), which runs the rest of the
 * chain and then resumes it, so code after next() executes in reverse order.
 * The outer next passed to the result runs after the last middleware.
 *
 * @throws std::invalid_argument if the list contains an empty function.
 */
Middleware compose(std::vector<Middleware> middleware);

} // namespace cascade

#endif
