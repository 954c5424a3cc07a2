#pragma once

#include <mimegate/media_type.hpp>
#include <mimegate/registry.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mimegate {

  // How an issuance description is carried for a given media type: text
  // types travel as the UTF-8 string itself, everything else as hex.
  enum class content_class { text, binary };

  std::string_view
  to_string(content_class c);

  // Parameters are ignored; comparison is case-insensitive.
  content_class
  classify(const media_type& mt);

  // Throws std::runtime_error when binary content is not valid hex.
  std::vector<std::byte>
  content_to_bytes(std::string_view content, content_class cls);

  // Binary content is rendered as lowercase hex.
  std::string
  bytes_to_content(const std::vector<std::byte>& bytes, content_class cls);

  // Problems with a (media type, description) pair, empty when both are
  // usable. An empty media type means text/plain.
  std::vector<std::string>
  check_content(std::string_view raw_type, std::string_view content,
                const registry& reg);

} // namespace mimegate
