#pragma once

#include <mimegate/media_type.hpp>

#include <string>
#include <string_view>

namespace mimegate {

  // Renders an accepted media type (the output of evaluate) as
  //   type "/" subtype *( ";" name "=" value )
  // with type, subtype and names lowercased and parameters sorted bytewise by
  // name. Values are written as given; a value that is not a bare token is
  // written as a quoted-string with '"' and '\' escaped. The output parses
  // back to a value that canonicalizes to the same string.
  std::string
  canonicalize(const media_type& accepted);

  // Appends value to out, quoting it when it is not a bare token.
  void
  append_parameter_value(std::string& out, std::string_view value);

} // namespace mimegate
