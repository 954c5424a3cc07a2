#include <mimegate/registry.hpp>

#include <mimegate/ascii.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace mimegate {

  std::string_view
  to_string(value_match m) {
    switch (m) {
      case value_match::exact:
        return "exact";
      case value_match::one_of:
        return "one-of";
      case value_match::any_token:
        return "any-token";
    }
    return "unknown";
  }

  std::string_view
  to_string(value_case c) {
    return c == value_case::insensitive ? "insensitive" : "sensitive";
  }

  bool
  value_constraint::accepts(std::string_view value) const {
    if (match == value_match::any_token) return is_token(value);

    return std::any_of(values.begin(), values.end(), [&](const auto& v) {
      return case_rule == value_case::insensitive ? iequals(v, value)
                                                  : v == value;
    });
  }

  std::string
  value_constraint::render(std::string_view value) const {
    if (case_rule == value_case::insensitive) return to_lower(value);
    return std::string(value);
  }

  const value_constraint*
  registry_entry::find(std::string_view name) const {
    auto it = parameters.find(to_lower(name));
    if (it == parameters.end()) return nullptr;
    return &it->second;
  }

  namespace {

    std::string
    make_key(std::string_view type, std::string_view subtype) {
      return to_lower(type) + '/' + to_lower(subtype);
    }

    value_constraint
    one_of_insensitive(std::vector<std::string> values) {
      return {value_match::one_of, value_case::insensitive, std::move(values)};
    }

  } // namespace

  // The media types the embedding pipeline gives meaning to, and the
  // parameters each may carry. Parameter-free use of any type is accepted
  // whether or not it appears here.
  registry
  registry::defaults() {
    registry reg;

    // Audio
    reg.set("audio", "ogg",
            {{{"codecs",
               {value_match::exact, value_case::insensitive, {"opus"}}}}});
    reg.set("audio", "opus", {});
    reg.set("audio", "webm",
            {{{"codecs", one_of_insensitive({"opus", "vorbis"})}}});
    reg.set("audio", "mp4",
            {{{"codecs", one_of_insensitive({"mp4a.40.2", "opus", "flac"})}}});
    reg.set("audio", "flac", {});

    // Video and containers
    reg.set("video", "webm",
            {{{"codecs",
               one_of_insensitive({"vp8", "vp9", "av1", "opus", "vorbis"})}}});
    reg.set("video", "ogg",
            {{{"codecs", one_of_insensitive({"theora", "vorbis", "opus"})}}});
    reg.set("video", "mp4", {});
    reg.set("application", "ogg", {});

    // Text
    reg.set("text", "plain",
            {{{"charset", one_of_insensitive({"utf-8", "us-ascii"})}}});
    reg.set("text", "html", {{{"charset", one_of_insensitive({"utf-8"})}}});
    reg.set("application", "json",
            {{{"charset", one_of_insensitive({"utf-8"})}}});

    return reg;
  }

  namespace {

    const std::string registry_ns = "http://mimegate.dev/registry";

    bool
    is_whitespace_only(std::string_view sv) {
      return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    [[noreturn]] void
    load_error(const xml_reader& reader, const std::string& what) {
      throw std::runtime_error("registry::load: line " +
                               std::to_string(reader.line()) + ": " + what);
    }

    void
    next(xml_reader& reader) {
      if (!read_skip_ws(reader))
        throw std::runtime_error("registry::load: unexpected end of document");
    }

    bool
    is_start(const xml_reader& reader, const char* local) {
      return reader.node_type() == xml_node_type::start_element &&
             reader.name() == xml_name{registry_ns, local};
    }

    bool
    is_end(const xml_reader& reader, const char* local) {
      return reader.node_type() == xml_node_type::end_element &&
             reader.name() == xml_name{registry_ns, local};
    }

    std::string
    token_attribute(const xml_reader& reader, const char* attr) {
      auto value = reader.attribute_value(attr);
      if (!is_token(value))
        load_error(reader, std::string("attribute '") + attr +
                               "' must be a non-empty token, got '" +
                               std::string(value) + "'");
      return to_lower(value);
    }

    value_match
    parse_match(const xml_reader& reader) {
      auto m = reader.attribute_value("match");
      if (m == "exact") return value_match::exact;
      if (m == "one-of") return value_match::one_of;
      if (m == "any-token") return value_match::any_token;
      load_error(reader, "unknown match kind '" + std::string(m) + "'");
    }

    value_case
    parse_case(const xml_reader& reader) {
      auto c = reader.attribute_value("case");
      if (c.empty() || c == "sensitive") return value_case::sensitive;
      if (c == "insensitive") return value_case::insensitive;
      load_error(reader, "unknown case rule '" + std::string(c) + "'");
    }

    // Values must survive a round trip through a quoted-string.
    bool
    is_quotable(std::string_view v) {
      return std::all_of(v.begin(), v.end(), [](char c) {
        return c == '\t' || (c >= ' ' && c <= '~');
      });
    }

    // Positioned on <value>; leaves the reader on </value>.
    std::string
    read_value(xml_reader& reader) {
      std::string value;
      next(reader);
      if (reader.node_type() == xml_node_type::characters) {
        value = std::string(reader.text());
        next(reader);
      }
      if (!is_end(reader, "value"))
        load_error(reader, "<value> may only contain text");
      if (value.empty()) load_error(reader, "empty <value>");
      if (!is_quotable(value))
        load_error(reader, "value '" + value +
                               "' contains characters outside printable ASCII");
      return value;
    }

    // Positioned on <parameter>; leaves the reader on </parameter>.
    std::pair<std::string, value_constraint>
    read_parameter(xml_reader& reader) {
      auto name = token_attribute(reader, "name");
      value_constraint constraint;
      constraint.match = parse_match(reader);
      constraint.case_rule = parse_case(reader);
      auto start_line = reader.line();

      for (next(reader); !is_end(reader, "parameter"); next(reader)) {
        if (!is_start(reader, "value"))
          load_error(reader, "unexpected content inside <parameter>");
        constraint.values.push_back(read_value(reader));
      }

      auto count = constraint.values.size();
      bool ok = (constraint.match == value_match::exact && count == 1) ||
                (constraint.match == value_match::one_of && count >= 1) ||
                (constraint.match == value_match::any_token && count == 0);
      if (!ok) {
        throw std::runtime_error(
            "registry::load: line " + std::to_string(start_line) +
            ": parameter '" + name + "' with match '" +
            std::string(to_string(constraint.match)) + "' has " +
            std::to_string(count) + " value(s)");
      }

      return {std::move(name), std::move(constraint)};
    }

  } // namespace

  registry
  registry::load(xml_reader& reader) {
    if (!read_skip_ws(reader) || !is_start(reader, "registry")) {
      throw std::runtime_error(
          "registry::load: expected <registry> root element "
          "in namespace http://mimegate.dev/registry");
    }

    registry result;

    for (next(reader); !is_end(reader, "registry"); next(reader)) {
      if (!is_start(reader, "media-type"))
        load_error(reader, "unexpected element inside <registry>");

      auto type = token_attribute(reader, "type");
      auto subtype = token_attribute(reader, "subtype");
      if (result.contains(type, subtype))
        load_error(reader, "duplicate media type '" + type + "/" + subtype +
                               "'");

      registry_entry entry;
      for (next(reader); !is_end(reader, "media-type"); next(reader)) {
        if (!is_start(reader, "parameter"))
          load_error(reader, "unexpected content inside <media-type>");
        auto [name, constraint] = read_parameter(reader);
        if (entry.parameters.count(name) != 0)
          load_error(reader, "duplicate parameter '" + name + "' for '" +
                                 type + "/" + subtype + "'");
        entry.parameters.emplace(std::move(name), std::move(constraint));
      }

      result.set(type, subtype, std::move(entry));
    }

    return result;
  }

  void
  registry::merge(const registry& overrides) {
    for (const auto& [key, entry] : overrides.entries_)
      entries_.insert_or_assign(key, entry);
  }

  void
  registry::set(std::string_view type, std::string_view subtype,
                registry_entry entry) {
    entries_.insert_or_assign(make_key(type, subtype), std::move(entry));
  }

  const registry_entry*
  registry::find(std::string_view type, std::string_view subtype) const {
    auto it = entries_.find(make_key(type, subtype));
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  std::size_t
  registry::size() const {
    return entries_.size();
  }

  bool
  registry::contains(std::string_view type, std::string_view subtype) const {
    return entries_.count(make_key(type, subtype)) != 0;
  }

} // namespace mimegate
