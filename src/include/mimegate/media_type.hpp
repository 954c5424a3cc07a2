#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mimegate {

  // Inputs longer than this are refused before any parsing work.
  inline constexpr std::size_t max_media_type_length = 255;

  struct parameter {
    std::string name;
    std::string value;

    bool
    operator==(const parameter&) const = default;
  };

  // A parsed media type. Parameters keep their order of appearance and the
  // spelling they were written with; names are unique ignoring case.
  class media_type {
    std::string type_;
    std::string subtype_;
    std::vector<parameter> parameters_;

  public:
    media_type() = default;

    media_type(std::string type, std::string subtype,
               std::vector<parameter> parameters = {})
        : type_(std::move(type)),
          subtype_(std::move(subtype)),
          parameters_(std::move(parameters)) {}

    const std::string&
    type() const {
      return type_;
    }

    const std::string&
    subtype() const {
      return subtype_;
    }

    const std::vector<parameter>&
    parameters() const {
      return parameters_;
    }

    bool
    has_parameters() const {
      return !parameters_.empty();
    }

    // Case-insensitive lookup by parameter name.
    const parameter*
    find_parameter(std::string_view name) const;

    // Lowercase "type/subtype" without parameters.
    std::string
    essence() const;

    bool
    operator==(const media_type&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const media_type& mt) {
      os << mt.type_ << '/' << mt.subtype_;
      for (const auto& p : mt.parameters_)
        os << ';' << p.name << '=' << p.value;
      return os;
    }
  };

  enum class syntax_error {
    too_long,
    missing_separator,
    empty_type,
    empty_subtype,
    illegal_character,
    unterminated_quote,
    malformed_parameter,
    duplicate_parameter,
  };

  std::string_view
  to_string(syntax_error e);

  struct tokenize_error {
    syntax_error error;
    std::size_t offset = 0;
    std::string token;
  };

  using tokenize_result = std::variant<media_type, tokenize_error>;

  // Grammar:
  //   media-type = type "/" subtype *( OWS ";" OWS parameter )
  //   parameter  = attribute "=" ( token / quoted-string )
  // The empty string is not a media type; callers that treat "" as "none
  // declared" must check for it first.
  tokenize_result
  tokenize(std::string_view raw);

} // namespace mimegate
