#pragma once

#include <exception>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace model_batcher {

struct ExceptionLoggingMessages {
  std::string_view context_prefix;
};

// Runs callback and logs any standard exception it lets escape. Returns
// false when an exception was logged. Cancellation of a blocked poll is the
// normal way a worker leaves its loop and is not logged.
template <typename Callback>
auto
run_with_logged_exceptions(
    Callback&& callback,
    const ExceptionLoggingMessages& messages = ExceptionLoggingMessages{})
    -> bool
{
  try {
    std::forward<Callback>(callback)();
    return true;
  }
  catch (const PollCancelledException&) {
    return true;
  }
  catch (const ModelBatcherException& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  catch (const std::bad_alloc& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  catch (const std::logic_error& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  catch (const std::exception& e) {
    log_error(std::string(messages.context_prefix) + e.what());
  }
  return false;
}

}  // namespace model_batcher
