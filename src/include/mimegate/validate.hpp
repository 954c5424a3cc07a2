#pragma once

#include <mimegate/policy.hpp>
#include <mimegate/registry.hpp>

#include <optional>
#include <utility>
#include <string>
#include <string_view>
#include <variant>

namespace mimegate {

  // Outcome of validate(). An accepted result carries the canonical string,
  // or nothing when the input declared no media type.
  class validation_result {
    std::variant<std::optional<std::string>, rejection> value_;

    explicit validation_result(
        std::variant<std::optional<std::string>, rejection> value)
        : value_(std::move(value)) {}

  public:
    static validation_result
    accept(std::optional<std::string> canonical) {
      return validation_result(std::move(canonical));
    }

    static validation_result
    reject(rejection r) {
      return validation_result(std::move(r));
    }

    bool
    accepted() const {
      return value_.index() == 0;
    }

    explicit
    operator bool() const {
      return accepted();
    }

    // Precondition: accepted().
    const std::optional<std::string>&
    canonical() const {
      return std::get<0>(value_);
    }

    // Precondition: !accepted().
    const rejection&
    error() const {
      return std::get<1>(value_);
    }

    bool
    operator==(const validation_result&) const = default;
  };

  // The single entry point for both request composition and chain replay:
  // tokenize, apply the registry policy, canonicalize. Deterministic and free
  // of side effects; safe to call concurrently with a shared registry.
  validation_result
  validate(std::string_view raw, const registry& reg);

} // namespace mimegate
