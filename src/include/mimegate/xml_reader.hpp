#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace mimegate {

  struct xml_name {
    std::string namespace_uri;
    std::string local_name;

    bool
    operator==(const xml_name&) const = default;
  };

  enum class xml_node_type {
    start_element,
    end_element,
    characters,
  };

  // Pull-style cursor over an XML document. Used for registry override files.
  class xml_reader {
  public:
    virtual ~xml_reader() = default;

    virtual bool
    read() = 0;

    virtual xml_node_type
    node_type() const = 0;

    virtual const xml_name&
    name() const = 0;

    // Value of an unqualified attribute on the current start element, empty
    // when absent.
    virtual std::string_view
    attribute_value(std::string_view local_name) const = 0;

    virtual std::string_view
    text() const = 0;

    // 1-based source line of the current node.
    virtual std::size_t
    line() const = 0;
  };

} // namespace mimegate
