#pragma once

#include <utility>

#include <fmt/format.h>

#include <mpqx/types.hpp>

namespace mpqx::detail {

// Fills outError (if provided) with a code and a formatted message
template <typename... Args>
void setError(Error *outError, ErrorCode code, fmt::format_string<Args...> format,
              Args &&...args) {
  if (outError) {
    outError->code = code;
    outError->message = fmt::format(format, std::forward<Args>(args)...);
  }
}

} // namespace mpqx::detail
