#include <mimegate/policy.hpp>

#include <mimegate/ascii.hpp>

#include <utility>
#include <vector>

namespace mimegate {

  std::string_view
  to_string(reject_reason r) {
    switch (r) {
      case reject_reason::too_long:
        return "too_long";
      case reject_reason::parse_error:
        return "parse_error";
      case reject_reason::duplicate_parameter:
        return "duplicate_parameter";
      case reject_reason::unregistered_type_with_parameters:
        return "unregistered_type_with_parameters";
      case reject_reason::disallowed_parameter:
        return "disallowed_parameter";
      case reject_reason::invalid_parameter_value:
        return "invalid_parameter_value";
    }
    return "unknown";
  }

  std::string
  rejection::message() const {
    switch (reason) {
      case reject_reason::too_long:
        return "media type longer than " +
               std::to_string(max_media_type_length) + " bytes";
      case reject_reason::parse_error:
        return "malformed media type (" +
               std::string(detail ? to_string(*detail) : "syntax") +
               ") near '" + token + "'";
      case reject_reason::duplicate_parameter:
        return "duplicate parameter '" + token + "'";
      case reject_reason::unregistered_type_with_parameters:
        return "media type '" + token + "' does not accept parameters";
      case reject_reason::disallowed_parameter:
        return "parameter '" + token + "' is not allowed";
      case reject_reason::invalid_parameter_value:
        return "invalid value for parameter '" + token + "'";
    }
    return "rejected";
  }

  rejection
  to_rejection(const tokenize_error& e) {
    switch (e.error) {
      case syntax_error::too_long:
        return {reject_reason::too_long, e.token, std::nullopt};
      case syntax_error::duplicate_parameter:
        return {reject_reason::duplicate_parameter, e.token, std::nullopt};
      default:
        return {reject_reason::parse_error, e.token, e.error};
    }
  }

  evaluation
  evaluate(const media_type& parsed, const registry& reg) {
    if (!parsed.has_parameters()) return parsed;

    const registry_entry* entry = reg.find(parsed.type(), parsed.subtype());
    if (entry == nullptr) {
      return rejection{reject_reason::unregistered_type_with_parameters,
                       parsed.essence(), std::nullopt};
    }

    std::vector<parameter> normalized;
    normalized.reserve(parsed.parameters().size());
    for (const auto& p : parsed.parameters()) {
      const value_constraint* constraint = entry->find(p.name);
      if (constraint == nullptr) {
        return rejection{reject_reason::disallowed_parameter, p.name,
                         std::nullopt};
      }
      if (!constraint->accepts(p.value)) {
        return rejection{reject_reason::invalid_parameter_value, p.name,
                         std::nullopt};
      }
      normalized.push_back({to_lower(p.name), constraint->render(p.value)});
    }

    return media_type{parsed.type(), parsed.subtype(), std::move(normalized)};
  }

} // namespace mimegate
