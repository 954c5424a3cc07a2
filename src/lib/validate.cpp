#include <mimegate/validate.hpp>

#include <mimegate/canonical.hpp>
#include <mimegate/media_type.hpp>

namespace mimegate {

  validation_result
  validate(std::string_view raw, const registry& reg) {
    if (raw.empty()) return validation_result::accept(std::nullopt);

    auto parsed = tokenize(raw);
    if (auto* err = std::get_if<tokenize_error>(&parsed))
      return validation_result::reject(to_rejection(*err));

    auto verdict = evaluate(std::get<media_type>(parsed), reg);
    if (auto* r = std::get_if<rejection>(&verdict))
      return validation_result::reject(std::move(*r));

    return validation_result::accept(
        canonicalize(std::get<media_type>(verdict)));
  }

} // namespace mimegate
