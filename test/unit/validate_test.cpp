#include <mimegate/registry.hpp>
#include <mimegate/validate.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

using namespace mimegate;

namespace {

  const registry&
  reg() {
    static const registry r = registry::defaults();
    return r;
  }

  std::optional<std::string>
  accepted(std::string_view raw) {
    auto result = validate(raw, reg());
    INFO("input: " << raw);
    REQUIRE(result.accepted());
    return result.canonical();
  }

  reject_reason
  rejected(std::string_view raw) {
    auto result = validate(raw, reg());
    INFO("input: " << raw);
    REQUIRE_FALSE(result.accepted());
    return result.error().reason;
  }

} // namespace

// ---------------------------------------------------------------------------
// reference scenarios
// ---------------------------------------------------------------------------

TEST_CASE("validate: opus in ogg", "[validate]") {
  CHECK(accepted("audio/ogg;codecs=opus") == "audio/ogg;codecs=opus");
}

TEST_CASE("validate: codec value is case-insensitive", "[validate]") {
  CHECK(accepted("audio/ogg;codecs=OPUS") == "audio/ogg;codecs=opus");
}

TEST_CASE("validate: unexpected parameter", "[validate]") {
  CHECK(rejected("audio/ogg;codecs=opus;unexpected=1") ==
        reject_reason::disallowed_parameter);
}

TEST_CASE("validate: unregistered parameter-free type", "[validate]") {
  CHECK(accepted("image/jpeg") == "image/jpeg");
}

TEST_CASE("validate: empty string declares no media type", "[validate]") {
  auto result = validate("", reg());
  REQUIRE(result.accepted());
  CHECK_FALSE(result.canonical().has_value());
}

TEST_CASE("validate: 256 bytes is too long", "[validate]") {
  std::string raw = "audio/" + std::string(250, 'x');
  REQUIRE(raw.size() == 256);
  CHECK(rejected(raw) == reject_reason::too_long);
}

TEST_CASE("validate: duplicate parameter", "[validate]") {
  CHECK(rejected("audio/ogg;codecs=opus;codecs=opus") ==
        reject_reason::duplicate_parameter);
}

// ---------------------------------------------------------------------------
// other paths
// ---------------------------------------------------------------------------

TEST_CASE("validate: parse errors", "[validate]") {
  for (const char* raw : {"audio", "/ogg", "audio/", "audio/og g",
                          "audio/ogg;codecs=\"opus", "audio/ogg;"}) {
    SECTION(raw) {
      CHECK(rejected(raw) == reject_reason::parse_error);
    }
  }
}

TEST_CASE("validate: parse error carries the syntax detail", "[validate]") {
  auto result = validate("audio/ogg;codecs=\"opus", reg());
  REQUIRE_FALSE(result);
  REQUIRE(result.error().detail.has_value());
  CHECK(*result.error().detail == syntax_error::unterminated_quote);
}

TEST_CASE("validate: unregistered type with parameters", "[validate]") {
  CHECK(rejected("image/jpeg;quality=90") ==
        reject_reason::unregistered_type_with_parameters);
}

TEST_CASE("validate: invalid parameter value", "[validate]") {
  CHECK(rejected("audio/ogg;codecs=vorbis") ==
        reject_reason::invalid_parameter_value);
  CHECK(rejected("audio/ogg;codecs=\"opus \"") ==
        reject_reason::invalid_parameter_value);
}

TEST_CASE("validate: input spelling does not change the canonical form",
          "[validate]") {
  auto expected = std::optional<std::string>("audio/ogg;codecs=opus");
  CHECK(accepted("AUDIO/OGG;CODECS=OPUS") == expected);
  CHECK(accepted("audio/ogg ; codecs=opus") == expected);
  CHECK(accepted("audio/ogg;codecs=\"opus\"") == expected);
  CHECK(accepted("audio/ogg;codecs=\"op\\us\"") == expected);
}

TEST_CASE("validate: multi-value registry entries", "[validate]") {
  CHECK(accepted("video/webm;codecs=VP9") == "video/webm;codecs=vp9");
  CHECK(accepted("audio/mp4;codecs=mp4a.40.2") == "audio/mp4;codecs=mp4a.40.2");
  CHECK(accepted("text/plain;charset=UTF-8") == "text/plain;charset=utf-8");
  CHECK(rejected("text/plain;charset=latin1") ==
        reject_reason::invalid_parameter_value);
}

// ---------------------------------------------------------------------------
// properties
// ---------------------------------------------------------------------------

TEST_CASE("validate: every parameter-free type is accepted as lowercase",
          "[validate][compat]") {
  for (const char* raw :
       {"image/jpeg", "image/png", "IMAGE/GIF", "text/plain", "audio/opus",
        "audio/mpeg", "video/mp4", "application/octet-stream",
        "application/vnd.ms-excel", "model/gltf+json", "x-made/up",
        "Application/X-Custom.Type+Zip", "a/b", "!#$&-^_.+/!#$&-^_.+"}) {
    SECTION(raw) {
      auto result = validate(raw, reg());
      REQUIRE(result.accepted());
      REQUIRE(result.canonical().has_value());

      std::string lower(raw);
      for (auto& c : lower)
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
      CHECK(*result.canonical() == lower);
    }
  }
}

TEST_CASE("validate: canonical output validates to itself",
          "[validate][idempotence]") {
  registry r = registry::defaults();
  r.set("text", "x-note",
        {{{"label", {value_match::one_of, value_case::sensitive,
                     {"A b", "semi;colon", "q\"uote"}}}}});

  for (const char* raw :
       {"audio/ogg;codecs=OPUS", "Video/WebM ; CODECS=\"Av1\"",
        "text/plain;charset=US-ASCII", "image/jpeg",
        "text/x-note;label=\"A b\"", "text/x-note;label=\"semi;colon\"",
        "text/x-note;label=\"q\\\"uote\""}) {
    SECTION(raw) {
      auto first = validate(raw, r);
      REQUIRE(first.accepted());
      REQUIRE(first.canonical().has_value());

      auto second = validate(*first.canonical(), r);
      REQUIRE(second.accepted());
      CHECK(second.canonical() == first.canonical());
    }
  }
}

TEST_CASE("validate: result equality", "[validate]") {
  CHECK(validate("audio/ogg;codecs=opus", reg()) ==
        validate("audio/OGG;codecs=Opus", reg()));
  CHECK_FALSE(validate("audio/ogg", reg()) == validate("", reg()));
}
