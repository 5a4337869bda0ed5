#include "bundle/avro_tags.hpp"
#include "utilities/errors.hpp"
#include <gtest/gtest.h>

using namespace arloader;

TEST(AvroTags, EmptyListIsSingleZero) {
  EXPECT_EQ(encodeTags({}), Bytes{0});
  EXPECT_TRUE(decodeTags(Bytes{0}).empty());
}

TEST(AvroTags, NamesAndValuesTravelAsBase64Text) {
  std::vector<Tag> tags{Tag::fromUtf8("Content-Type", "text/plain"),
                        Tag::fromUtf8("App", "arloader")};
  Bytes expected{4,   32,  81,  50,  57,  117, 100, 71,  86,  117, 100,
                 67,  49,  85,  101, 88,  66,  108, 28,  100, 71,  86,
                 52,  100, 67,  57,  119, 98,  71,  70,  112, 98,  103,
                 8,   81,  88,  66,  119, 22,  89,  88,  74,  115, 98,
                 50,  70,  107, 90,  88,  73,  0};
  EXPECT_EQ(encodeTags(tags), expected);
  EXPECT_EQ(decodeTags(expected), tags);
}

TEST(AvroTags, RepeatedLongTagsMatchKnownLayout) {
  Tag tag{Bytes(56, 'e'), to_bytes("testvalue")};
  Bytes encoded = encodeTags({tag, tag});
  ASSERT_EQ(encoded.size(), 182u);
  EXPECT_EQ(encoded[0], 4);
  // 100 encodes as the two-byte varint 150, 1.
  EXPECT_EQ(encoded[1], 150);
  EXPECT_EQ(encoded[2], 1);
  std::string name(encoded.begin() + 3, encoded.begin() + 78);
  EXPECT_EQ(name.substr(0, 8), "ZWVlZWVl");
  EXPECT_EQ(encoded[78], 24);
  std::string value(encoded.begin() + 79, encoded.begin() + 91);
  EXPECT_EQ(value, "dGVzdHZhbHVl");
  EXPECT_EQ(encoded.back(), 0);
}

TEST(AvroTags, AcceptsSizedAndSplitBlocks) {
  // Block 1: count -1 with a byte size, block 2: count 1, then the end marker.
  Bytes bytes{1, 12, 4, 'Y', 'Q', 4, 'Y', 'g', 2, 4, 'Y', 'w', 4, 'Z', 'A', 0};
  auto tags = decodeTags(bytes);
  ASSERT_EQ(tags.size(), 2u);
  EXPECT_EQ(tags[0], Tag::fromUtf8("a", "b"));
  EXPECT_EQ(tags[1], Tag::fromUtf8("c", "d"));
}

TEST(AvroTags, RejectsMalformedInput) {
  EXPECT_THROW(decodeTags(Bytes{}), Error);
  EXPECT_THROW(decodeTags(Bytes{2, 10, 'Y'}), Error);
  EXPECT_THROW(decodeTags(Bytes{0, 0}), Error);
  EXPECT_THROW(decodeTags(Bytes{2, 4, '!', '!', 4, 'Y', 'g', 0}), Error);
  try {
    decodeTags(Bytes{0x80});
    FAIL() << "truncated varint accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidTags);
  }
}
