#pragma once

#include <utility>
#include <variant>

#include "tlsdial/connect-error.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Outcome of one poll of a non-blocking operation: still pending (with the readiness the executor should
// wait for before polling again), ready with a value, or failed.
template <class T>
class PollResult {
 public:
  struct Pending {
    TransportHint want;
  };

  static PollResult NotReady(TransportHint want) { return PollResult(Pending{want}); }

  static PollResult Ready(T value) { return PollResult(std::move(value)); }

  static PollResult Failed(ConnectError error) { return PollResult(std::move(error)); }

  [[nodiscard]] bool isPending() const noexcept { return std::holds_alternative<Pending>(_state); }
  [[nodiscard]] bool isReady() const noexcept { return std::holds_alternative<T>(_state); }
  [[nodiscard]] bool isFailed() const noexcept { return std::holds_alternative<ConnectError>(_state); }

  // Readiness to wait for. Only meaningful when pending.
  [[nodiscard]] TransportHint want() const noexcept {
    const auto* pending = std::get_if<Pending>(&_state);
    return pending == nullptr ? TransportHint::None : pending->want;
  }

  // Throws std::bad_variant_access if not ready.
  [[nodiscard]] T& value() & { return std::get<T>(_state); }
  [[nodiscard]] T&& value() && { return std::get<T>(std::move(_state)); }

  // Throws std::bad_variant_access if not failed.
  [[nodiscard]] const ConnectError& error() const { return std::get<ConnectError>(_state); }

  // Converts a non-ready result into another value type.
  template <class U>
  [[nodiscard]] PollResult<U> propagate() && {
    if (isPending()) {
      return PollResult<U>::NotReady(want());
    }
    return PollResult<U>::Failed(std::get<ConnectError>(std::move(_state)));
  }

 private:
  explicit PollResult(Pending pending) : _state(pending) {}
  explicit PollResult(T&& value) : _state(std::in_place_type<T>, std::move(value)) {}
  explicit PollResult(ConnectError&& error) : _state(std::in_place_type<ConnectError>, std::move(error)) {}

  std::variant<Pending, T, ConnectError> _state;
};

}  // namespace tlsdial
