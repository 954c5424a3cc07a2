#pragma once

#include <mimegate/xml_reader.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mimegate {

  enum class value_match { exact, one_of, any_token };

  enum class value_case { sensitive, insensitive };

  std::string_view
  to_string(value_match m);

  std::string_view
  to_string(value_case c);

  struct value_constraint {
    value_match match = value_match::any_token;
    value_case case_rule = value_case::sensitive;
    std::vector<std::string> values; // exact: one entry; one_of: the set

    bool
    accepts(std::string_view value) const;

    // The spelling that goes into the canonical string.
    std::string
    render(std::string_view value) const;

    bool
    operator==(const value_constraint&) const = default;
  };

  // Parameters permitted for one type/subtype, keyed by lowercase name.
  struct registry_entry {
    std::map<std::string, value_constraint> parameters;

    const value_constraint*
    find(std::string_view name) const;

    bool
    operator==(const registry_entry&) const = default;
  };

  // Known media types. A registry is assembled once (defaults, optionally
  // merged with a loaded override file) and then only used through a const
  // reference; lookups never mutate it, so sharing it across threads needs
  // no locking.
  class registry {
    std::map<std::string, registry_entry> entries_; // "type/subtype", lower

  public:
    registry() = default;

    static registry
    defaults();

    static registry
    load(xml_reader& reader);

    void
    merge(const registry& overrides);

    void
    set(std::string_view type, std::string_view subtype, registry_entry entry);

    const registry_entry*
    find(std::string_view type, std::string_view subtype) const;

    std::size_t
    size() const;

    bool
    contains(std::string_view type, std::string_view subtype) const;

    const std::map<std::string, registry_entry>&
    entries() const {
      return entries_;
    }
  };

} // namespace mimegate
