#include <mimegate/content.hpp>
#include <mimegate/media_type.hpp>
#include <mimegate/registry.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace mimegate;

namespace {

  content_class
  class_of(std::string type, std::string subtype) {
    return classify(media_type{std::move(type), std::move(subtype)});
  }

  std::vector<std::byte>
  bytes(std::initializer_list<unsigned char> values) {
    std::vector<std::byte> out;
    for (auto v : values)
      out.push_back(static_cast<std::byte>(v));
    return out;
  }

} // namespace

// ---------------------------------------------------------------------------
// classify
// ---------------------------------------------------------------------------

TEST_CASE("classify: textual families", "[content]") {
  CHECK(class_of("text", "plain") == content_class::text);
  CHECK(class_of("TEXT", "html") == content_class::text);
  CHECK(class_of("message", "rfc822") == content_class::text);
  CHECK(class_of("application", "atom+xml") == content_class::text);
  CHECK(class_of("image", "svg+XML") == content_class::text);
}

TEST_CASE("classify: textual application types", "[content]") {
  for (const char* subtype :
       {"xml", "javascript", "json", "manifest+json", "x-python-code", "x-sh",
        "x-csh", "x-tex", "x-latex"}) {
    SECTION(subtype) {
      CHECK(class_of("application", subtype) == content_class::text);
    }
  }
}

TEST_CASE("classify: everything else is binary", "[content]") {
  CHECK(class_of("image", "jpeg") == content_class::binary);
  CHECK(class_of("audio", "opus") == content_class::binary);
  CHECK(class_of("audio", "ogg") == content_class::binary);
  CHECK(class_of("application", "octet-stream") == content_class::binary);
  CHECK(class_of("application", "ld+json") == content_class::binary);
}

TEST_CASE("classify: parameters are ignored", "[content]") {
  media_type mt{"audio", "ogg", {{"codecs", "opus"}}};
  CHECK(classify(mt) == content_class::binary);

  media_type txt{"text", "plain", {{"charset", "utf-8"}}};
  CHECK(classify(txt) == content_class::text);
}

// ---------------------------------------------------------------------------
// content codec
// ---------------------------------------------------------------------------

TEST_CASE("content_to_bytes: text is taken as is", "[content]") {
  CHECK(content_to_bytes("texte", content_class::text) ==
        bytes({'t', 'e', 'x', 't', 'e'}));
}

TEST_CASE("content_to_bytes: binary is hex", "[content]") {
  CHECK(content_to_bytes("48656c6c6f", content_class::binary) ==
        bytes({'H', 'e', 'l', 'l', 'o'}));
  CHECK(content_to_bytes("DEADbeef", content_class::binary) ==
        bytes({0xde, 0xad, 0xbe, 0xef}));
  CHECK(content_to_bytes("", content_class::binary).empty());
}

TEST_CASE("content_to_bytes: bad hex throws", "[content]") {
  CHECK_THROWS_AS(content_to_bytes("abc", content_class::binary),
                  std::runtime_error);
  CHECK_THROWS_AS(content_to_bytes("zz", content_class::binary),
                  std::runtime_error);
}

TEST_CASE("bytes_to_content", "[content]") {
  CHECK(bytes_to_content(bytes({'t', 'e', 'x', 't', 'e'}),
                         content_class::text) == "texte");
  CHECK(bytes_to_content(bytes({'H', 'e', 'l', 'l', 'o'}),
                         content_class::binary) == "48656c6c6f");
  CHECK(bytes_to_content(bytes({0xde, 0xad, 0xbe, 0xef}),
                         content_class::binary) == "deadbeef");
}

// ---------------------------------------------------------------------------
// check_content
// ---------------------------------------------------------------------------

TEST_CASE("check_content: valid combinations", "[content]") {
  auto reg = registry::defaults();
  CHECK(check_content("text/plain", "valid content", reg).empty());
  CHECK(check_content("", "valid content", reg).empty());
  CHECK(check_content("audio/opus", "deadbeef", reg).empty());
  CHECK(check_content("audio/ogg;codecs=opus", "deadbeef", reg).empty());
  CHECK(check_content("fake/nonexistent-type", "00ff", reg).empty());
}

TEST_CASE("check_content: binary type with text description", "[content]") {
  auto reg = registry::defaults();
  auto problems = check_content("image/jpeg", "valid content", reg);
  REQUIRE(problems.size() == 1);
  CHECK(problems[0] ==
        "Error converting description to bytes: hex string has odd length");
}

TEST_CASE("check_content: rejected media type", "[content]") {
  auto reg = registry::defaults();

  SECTION("policy rejection still classifies the parsed type") {
    auto problems =
        check_content("text/plain;charset=latin1", "valid content", reg);
    REQUIRE(problems.size() == 1);
    CHECK(problems[0] == "Invalid mime type: text/plain;charset=latin1");
  }

  SECTION("unparseable type is treated as binary") {
    auto problems = check_content("not a type", "valid content", reg);
    REQUIRE(problems.size() == 2);
    CHECK(problems[0] == "Invalid mime type: not a type");
    CHECK(problems[1] ==
          "Error converting description to bytes: hex string has odd length");
  }
}

TEST_CASE("content_class names", "[content]") {
  CHECK(to_string(content_class::text) == "text");
  CHECK(to_string(content_class::binary) == "binary");
}
