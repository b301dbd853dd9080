#ifndef CASCADE_ASYNC_H
#define CASCADE_ASYNC_H

#include <utility> // std::exchange, used by awaitable.hpp without including it
#include <boost/asio/awaitable.hpp>

namespace cascade {

template <typename T = void>
using Async = boost::asio::awaitable<T>;

} // namespace cascade

#endif
