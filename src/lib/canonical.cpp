#include <mimegate/canonical.hpp>

#include <mimegate/ascii.hpp>

#include <algorithm>
#include <vector>

namespace mimegate {

  void
  append_parameter_value(std::string& out, std::string_view value) {
    if (is_token(value)) {
      out += value;
      return;
    }
    out += '"';
    for (char c : value) {
      if (c == '"' || c == '\\') out += '\\';
      out += c;
    }
    out += '"';
  }

  std::string
  canonicalize(const media_type& accepted) {
    std::string out = accepted.essence();

    std::vector<parameter> params;
    params.reserve(accepted.parameters().size());
    for (const auto& p : accepted.parameters())
      params.push_back({to_lower(p.name), p.value});

    // Names are unique, so the order is total.
    std::sort(params.begin(), params.end(),
              [](const parameter& a, const parameter& b) {
                return a.name < b.name;
              });

    for (const auto& p : params) {
      out += ';';
      out += p.name;
      out += '=';
      append_parameter_value(out, p.value);
    }
    return out;
  }

} // namespace mimegate
