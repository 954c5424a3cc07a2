#include <mimegate/content.hpp>

#include <mimegate/ascii.hpp>
#include <mimegate/validate.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <variant>

namespace mimegate {

  std::string_view
  to_string(content_class c) {
    return c == content_class::text ? "text" : "binary";
  }

  namespace {

    // application/* types whose payload is textual.
    constexpr std::array<std::string_view, 9> textual_application_types = {
        "application/xml",
        "application/javascript",
        "application/json",
        "application/manifest+json",
        "application/x-python-code",
        "application/x-sh",
        "application/x-csh",
        "application/x-tex",
        "application/x-latex",
    };

    int
    hex_digit(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      throw std::runtime_error(std::string("invalid hex digit: ") + c);
    }

    char
    hex_char(int nibble) {
      return "0123456789abcdef"[nibble & 0xF];
    }

  } // namespace

  content_class
  classify(const media_type& mt) {
    auto type = to_lower(mt.type());
    auto subtype = to_lower(mt.subtype());

    if (type == "text" || type == "message" || subtype.ends_with("+xml"))
      return content_class::text;

    auto essence = type + '/' + subtype;
    if (std::find(textual_application_types.begin(),
                  textual_application_types.end(),
                  essence) != textual_application_types.end())
      return content_class::text;

    return content_class::binary;
  }

  std::vector<std::byte>
  content_to_bytes(std::string_view content, content_class cls) {
    std::vector<std::byte> result;

    if (cls == content_class::text) {
      result.reserve(content.size());
      for (char c : content)
        result.push_back(static_cast<std::byte>(c));
      return result;
    }

    if (content.size() % 2 != 0)
      throw std::runtime_error("hex string has odd length");

    result.reserve(content.size() / 2);
    for (std::size_t i = 0; i < content.size(); i += 2) {
      int high = hex_digit(content[i]);
      int low = hex_digit(content[i + 1]);
      result.push_back(static_cast<std::byte>((high << 4) | low));
    }
    return result;
  }

  std::string
  bytes_to_content(const std::vector<std::byte>& bytes, content_class cls) {
    std::string result;

    if (cls == content_class::text) {
      result.reserve(bytes.size());
      for (auto b : bytes)
        result += static_cast<char>(b);
      return result;
    }

    result.reserve(bytes.size() * 2);
    for (auto b : bytes) {
      auto val = static_cast<unsigned char>(b);
      result += hex_char(val >> 4);
      result += hex_char(val & 0xF);
    }
    return result;
  }

  std::vector<std::string>
  check_content(std::string_view raw_type, std::string_view content,
                const registry& reg) {
    std::vector<std::string> problems;
    std::string_view effective = raw_type.empty() ? "text/plain" : raw_type;

    // A rejected type is still classified from whatever parses, falling back
    // to binary, so the description gets checked as well.
    content_class cls = content_class::binary;
    auto verdict = validate(effective, reg);
    if (!verdict)
      problems.push_back("Invalid mime type: " + std::string(effective));

    auto parsed = tokenize(effective);
    if (auto* mt = std::get_if<media_type>(&parsed)) cls = classify(*mt);

    try {
      content_to_bytes(content, cls);
    } catch (const std::exception& e) {
      problems.push_back(std::string("Error converting description to bytes: ") +
                         e.what());
    }

    return problems;
  }

} // namespace mimegate
