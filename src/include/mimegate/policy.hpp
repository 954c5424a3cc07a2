#pragma once

#include <mimegate/media_type.hpp>
#include <mimegate/registry.hpp>

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace mimegate {

  enum class reject_reason {
    too_long,
    parse_error,
    duplicate_parameter,
    unregistered_type_with_parameters,
    disallowed_parameter,
    invalid_parameter_value,
  };

  std::string_view
  to_string(reject_reason r);

  struct rejection {
    reject_reason reason;
    std::string token; // offending text, for client-facing messages
    std::optional<syntax_error> detail; // set when reason is parse_error

    std::string
    message() const;

    bool
    operator==(const rejection&) const = default;
  };

  inline std::ostream&
  operator<<(std::ostream& os, const rejection& r) {
    return os << r.message();
  }

  // Maps a tokenizer failure onto the rejection taxonomy.
  rejection
  to_rejection(const tokenize_error& e);

  using evaluation = std::variant<media_type, rejection>;

  // Applies the registry's parameter policy. On success the returned value
  // has every parameter name lowercased and every value rendered with its
  // constraint's case rule; type, subtype and parameter order are untouched.
  //
  // A value without parameters is accepted for any type/subtype, registered
  // or not. A value with parameters needs a registry entry that allows every
  // name and value; one bad parameter rejects the whole value.
  evaluation
  evaluate(const media_type& parsed, const registry& reg);

} // namespace mimegate
