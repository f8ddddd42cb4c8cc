#pragma once

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "util/compiler_attribute.hpp"

namespace resonant {

/// Result of checking a precondition; throws on demand if the condition does not hold.
class Ensure {
  public:
    explicit Ensure(bool condition) : m_condition(condition) {}

    template <typename Error>
    RESONANT_ALWAYSINLINE void or_throw(Error&& error) {
        if (not m_condition) {
            throw std::forward<Error>(error);
        }
    }

    /// Throws `Error` constructed from a message formatted only when the condition fails.
    template <typename Error = std::invalid_argument, typename... Args>
    RESONANT_ALWAYSINLINE void or_throw_with(fmt::format_string<Args...> format, Args&&... args) {
        if (not m_condition) {
            throw Error(fmt::format(format, std::forward<Args>(args)...));
        }
    }

  private:
    bool m_condition;
};

[[nodiscard]] inline auto ensure(bool condition) -> Ensure {
    return Ensure(condition);
}

}  // namespace resonant
