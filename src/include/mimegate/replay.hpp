#pragma once

#include <mimegate/policy.hpp>
#include <mimegate/registry.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mimegate {

  // Raised while replaying history when a media type that was accepted at
  // the time no longer validates to the same canonical form. This is never a
  // recoverable condition: the indexed digest would change.
  class replay_divergence : public std::logic_error {
    std::string input_;

  public:
    replay_divergence(std::string_view input, const std::string& what)
        : std::logic_error(what), input_(input) {}

    const std::string&
    input() const {
      return input_;
    }
  };

  // validate() for the indexing path: rejections throw.
  std::optional<std::string>
  replay_validate(std::string_view raw, const registry& reg);

  // Throws replay_divergence unless raw validates to recorded. An empty
  // recorded string stands for "no media type".
  void
  check_replay(std::string_view raw, std::string_view recorded,
               const registry& reg);

} // namespace mimegate
