#include <mimegate/media_type.hpp>

#include <mimegate/ascii.hpp>

#include <optional>
#include <utility>

namespace mimegate {

  const parameter*
  media_type::find_parameter(std::string_view name) const {
    for (const auto& p : parameters_)
      if (iequals(p.name, name)) return &p;
    return nullptr;
  }

  std::string
  media_type::essence() const {
    return to_lower(type_) + '/' + to_lower(subtype_);
  }

  std::string_view
  to_string(syntax_error e) {
    switch (e) {
      case syntax_error::too_long:
        return "too_long";
      case syntax_error::missing_separator:
        return "missing_separator";
      case syntax_error::empty_type:
        return "empty_type";
      case syntax_error::empty_subtype:
        return "empty_subtype";
      case syntax_error::illegal_character:
        return "illegal_character";
      case syntax_error::unterminated_quote:
        return "unterminated_quote";
      case syntax_error::malformed_parameter:
        return "malformed_parameter";
      case syntax_error::duplicate_parameter:
        return "duplicate_parameter";
    }
    return "unknown";
  }

  namespace {

    // Single pass over the input. Only the first failure is recorded.
    class tokenizer {
      std::string_view input_;
      std::size_t pos_ = 0;
      std::optional<tokenize_error> error_;
      std::size_t param_start_ = 0;

    public:
      explicit tokenizer(std::string_view input) : input_(input) {}

      tokenize_result
      run() {
        std::string type = read_token();
        if (!at_end() && peek() == '/') {
          if (type.empty()) fail(syntax_error::empty_type, 0, "");
        } else if (at_end() ||
                   (!type.empty() && (peek() == ';' || is_space(peek())))) {
          fail(syntax_error::missing_separator, 0, type);
        } else {
          fail_illegal();
        }
        if (error_) return *error_;
        ++pos_; // '/'

        std::string subtype = read_token();
        if (subtype.empty()) {
          if (at_end() || peek() == ';' || is_space(peek()))
            fail(syntax_error::empty_subtype, pos_, std::string(input_));
          else
            fail_illegal();
        }
        if (error_) return *error_;

        std::vector<parameter> params;
        while (!at_end()) {
          skip_ows();
          if (at_end() || peek() != ';') {
            // Trailing whitespace or stray text after the last segment.
            if (at_end())
              fail(syntax_error::illegal_character, pos_ - 1,
                   std::string(1, input_[pos_ - 1]));
            else
              fail_illegal();
            return *error_;
          }
          ++pos_; // ';'
          skip_ows();

          auto p = read_parameter();
          if (error_) return *error_;

          for (const auto& existing : params) {
            if (iequals(existing.name, p.name)) {
              fail(syntax_error::duplicate_parameter, param_start_, p.name);
              return *error_;
            }
          }
          params.push_back(std::move(p));
        }

        return media_type{std::move(type), std::move(subtype),
                          std::move(params)};
      }

    private:
      bool
      at_end() const {
        return pos_ >= input_.size();
      }

      char
      peek() const {
        return input_[pos_];
      }

      void
      skip_ows() {
        while (!at_end() && is_space(peek()))
          ++pos_;
      }

      std::string
      read_token() {
        auto start = pos_;
        while (!at_end() && is_token_char(peek()))
          ++pos_;
        return std::string(input_.substr(start, pos_ - start));
      }

      void
      fail(syntax_error e, std::size_t offset, std::string token) {
        if (!error_) error_ = tokenize_error{e, offset, std::move(token)};
      }

      void
      fail_illegal() {
        fail(syntax_error::illegal_character, pos_, std::string(1, peek()));
      }

      // attribute "=" value
      parameter
      read_parameter() {
        param_start_ = pos_;
        parameter p;
        p.name = read_token();

        if (p.name.empty()) {
          if (at_end() || peek() == '=' || peek() == ';' || is_space(peek()))
            fail(syntax_error::malformed_parameter, param_start_, "");
          else
            fail_illegal();
          return p;
        }

        if (at_end() || peek() != '=') {
          if (at_end() || peek() == ';' || is_space(peek()))
            fail(syntax_error::malformed_parameter, param_start_, p.name);
          else
            fail_illegal();
          return p;
        }
        ++pos_; // '='

        if (!at_end() && peek() == '"') {
          p.value = read_quoted();
          return p;
        }

        p.value = read_token();
        if (p.value.empty()) {
          if (at_end() || peek() == ';' || is_space(peek()))
            fail(syntax_error::malformed_parameter, param_start_, p.name);
          else
            fail_illegal();
        }
        return p;
      }

      // quoted-string = DQUOTE *( qdtext / quoted-pair ) DQUOTE
      // qdtext and the escaped octet of a quoted-pair are HTAB, SP or a
      // visible ASCII character.
      std::string
      read_quoted() {
        auto start = pos_;
        ++pos_; // opening quote
        std::string value;
        while (!at_end()) {
          char c = peek();
          if (c == '"') {
            ++pos_;
            return value;
          }
          if (c == '\\') {
            ++pos_;
            if (at_end()) break;
            c = peek();
          }
          if (!(c == '\t' || (c >= ' ' && c <= '~'))) {
            fail_illegal();
            return value;
          }
          value += c;
          ++pos_;
        }
        fail(syntax_error::unterminated_quote, start,
             std::string(input_.substr(start)));
        return value;
      }
    };

  } // namespace

  tokenize_result
  tokenize(std::string_view raw) {
    if (raw.size() > max_media_type_length)
      return tokenize_error{syntax_error::too_long, max_media_type_length, ""};
    return tokenizer(raw).run();
  }

} // namespace mimegate
