#ifndef BLOBPIPE_COMMON_COROUTINE_CONTEXT_HPP
#define BLOBPIPE_COMMON_COROUTINE_CONTEXT_HPP

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>

namespace blobpipe {

// Handle passed to cooperative operations: the io_context the coroutine runs on
// and the yield context used to suspend it.
struct CoroutineContext {
  boost::asio::io_context& io_context;
  boost::asio::yield_context yield;

  // Gives other coroutines on the same io_context a chance to run
  void yield_now() const {
    boost::asio::post(io_context, yield);
  }
};

// Spawns operation as a coroutine on io_context, runs the context until it is
// out of work and returns the operation's result. Exceptions thrown by the
// operation are rethrown on the calling thread.
template <typename Operation>
auto run_coroutine(boost::asio::io_context& io_context, Operation&& operation)
    -> decltype(operation(std::declval<CoroutineContext>())) {
  using Result = decltype(operation(std::declval<CoroutineContext>()));

  std::exception_ptr error;
  io_context.restart();

  if constexpr (std::is_void_v<Result>) {
    boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
      try {
        operation(CoroutineContext{io_context, yield});
      } catch (const std::exception&) {
        error = std::current_exception();
      }
    });
    io_context.run();
    if (error) {
      std::rethrow_exception(error);
    }
  } else {
    std::optional<Result> result;
    boost::asio::spawn(io_context, [&](boost::asio::yield_context yield) {
      try {
        result = operation(CoroutineContext{io_context, yield});
      } catch (const std::exception&) {
        error = std::current_exception();
      }
    });
    io_context.run();
    if (error) {
      std::rethrow_exception(error);
    }
    return std::move(*result);
  }
}

} // namespace blobpipe

#endif // BLOBPIPE_COMMON_COROUTINE_CONTEXT_HPP
