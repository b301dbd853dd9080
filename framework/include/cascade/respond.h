#ifndef CASCADE_RESPOND_H
#define CASCADE_RESPOND_H

#include <cascade/async.h>

namespace cascade {

class Context;

/**
 * @brief Writes the context's final status, headers and body to the
 * transport. Runs once, after the middleware pipeline has resolved.
 */
Async<void> respond(Context& ctx);

} // namespace cascade

#endif
