#pragma once

#include <mimegate/xml_reader.hpp>

#include <memory>
#include <string_view>

namespace mimegate {

  // Parses the whole document up front with expat and replays it as events.
  // Throws std::runtime_error on malformed XML.
  class expat_reader : public xml_reader {
  public:
    explicit expat_reader(std::string_view xml);
    ~expat_reader() override;

    expat_reader(const expat_reader&) = delete;
    expat_reader&
    operator=(const expat_reader&) = delete;
    expat_reader(expat_reader&&) noexcept;
    expat_reader&
    operator=(expat_reader&&) noexcept;

    bool
    read() override;

    xml_node_type
    node_type() const override;

    const xml_name&
    name() const override;

    std::string_view
    attribute_value(std::string_view local_name) const override;

    std::string_view
    text() const override;

    std::size_t
    line() const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace mimegate
