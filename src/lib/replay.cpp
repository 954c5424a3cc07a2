#include <mimegate/replay.hpp>

#include <mimegate/validate.hpp>

namespace mimegate {

  std::optional<std::string>
  replay_validate(std::string_view raw, const registry& reg) {
    auto result = validate(raw, reg);
    if (!result) {
      throw replay_divergence(raw, "replay: previously accepted media type '" +
                                       std::string(raw) + "' is now rejected: " +
                                       result.error().message());
    }
    return result.canonical();
  }

  void
  check_replay(std::string_view raw, std::string_view recorded,
               const registry& reg) {
    auto canonical = replay_validate(raw, reg);
    std::string_view now = canonical ? std::string_view(*canonical) : "";
    if (now != recorded) {
      throw replay_divergence(raw, "replay: media type '" + std::string(raw) +
                                       "' canonicalizes to '" +
                                       std::string(now) + "', recorded '" +
                                       std::string(recorded) + "'");
    }
  }

} // namespace mimegate
