#include "bundle/avro_tags.hpp"
#include "bundle/data_item.hpp"
#include "test_keys.hpp"
#include "utilities/errors.hpp"
#include <gtest/gtest.h>

using namespace arloader;

namespace {

DataItem signedItem(std::vector<Tag> tags, std::string data,
                    bool withAnchor = true, bool withTarget = false) {
  DataItem item;
  item.tags = std::move(tags);
  item.data = to_bytes(data);
  if (withAnchor)
    item.anchor = Bytes(32, 0x02);
  if (withTarget)
    item.target = Bytes(32, 0x09);
  item.sign(testkeys::signer());
  return item;
}

void expectInvalid(const Bytes &bytes) {
  try {
    DataItem::deserialize(bytes);
    FAIL() << "malformed data item accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidDataItem);
  }
}

} // namespace

TEST(DataItem, DeepHashVector) {
  DataItem item;
  item.owner = Bytes(512, 0x01);
  item.anchor = Bytes(32, 0x02);
  item.tags = {Tag::fromUtf8("Content-Type", "text/plain"),
               Tag::fromUtf8("App", "arloader")};
  item.data = to_bytes("tasty");
  Sha384Digest expected = {200, 28,  160, 227, 170, 16,  66,  75,  8,   67,
                           3,   46,  176, 38,  60,  23,  138, 69,  35,  244,
                           135, 224, 140, 99,  112, 149, 243, 97,  5,   161,
                           87,  221, 16,  250, 23,  28,  117, 62,  206, 71,
                           95,  158, 54,  74,  195, 244, 206, 207};
  EXPECT_EQ(deepHash(item.toDeepHashItem()), expected);
}

TEST(DataItem, RoundTrip) {
  Tag tag{Bytes(56, 'e'), to_bytes("testvalue")};
  for (const DataItem &item :
       {signedItem({tag, tag}, "tasty"), signedItem({}, "no tags"),
        signedItem({Tag::fromUtf8("a", "b")}, "", false, true),
        signedItem({}, "", false, false)}) {
    Bytes bytes = item.serialize();
    EXPECT_EQ(bytes.size(), item.serializedSize());
    DataItem parsed = DataItem::deserialize(bytes);
    EXPECT_EQ(parsed, item);
    EXPECT_TRUE(parsed.verify());
  }
}

TEST(DataItem, LayoutOfTagHeader) {
  Tag tag{Bytes(56, 'e'), to_bytes("testvalue")};
  DataItem item = signedItem({tag, tag}, "tasty");
  Bytes bytes = item.serialize();
  // sig_type, signature, owner, target flag, anchor flag + anchor
  size_t tagHeader = 2 + 512 + 512 + 1 + 1 + 32;
  EXPECT_EQ(bytes[0], 1);
  EXPECT_EQ(bytes[1], 0);
  EXPECT_EQ(bytes[2 + 512 + 512], 0);
  EXPECT_EQ(bytes[2 + 512 + 512 + 1], 1);
  EXPECT_EQ(bytes[tagHeader], 2);
  EXPECT_EQ(bytes[tagHeader + 8], 182);
  EXPECT_EQ(bytes[tagHeader + 9], 0);
  Bytes tagBlock(bytes.begin() + tagHeader + 16,
                 bytes.begin() + tagHeader + 16 + 182);
  EXPECT_EQ(tagBlock, encodeTags(item.tags));
}

TEST(DataItem, UntaggedItemWritesZeroHeader) {
  DataItem item = signedItem({}, "x", false);
  Bytes bytes = item.serialize();
  size_t tagHeader = 2 + 512 + 512 + 1 + 1;
  for (size_t i = 0; i < 16; ++i)
    EXPECT_EQ(bytes[tagHeader + i], 0);
  EXPECT_EQ(bytes.back(), 'x');
}

TEST(DataItem, TamperedDataFailsVerification) {
  DataItem item = signedItem({Tag::fromUtf8("k", "v")}, "payload");
  item.data[0] ^= 1;
  EXPECT_FALSE(item.verify());
}

TEST(DataItem, RejectsWrongSignatureType) {
  Bytes bytes = signedItem({}, "data").serialize();
  bytes[0] = 2;
  expectInvalid(bytes);
}

TEST(DataItem, RejectsOversizedTagBlock) {
  Bytes bytes = signedItem({}, "data", false).serialize();
  size_t lenAt = 2 + 512 + 512 + 1 + 1 + 8;
  bytes[lenAt] = 0x01;
  bytes[lenAt + 1] = 0x08; // 2049
  expectInvalid(bytes);
}

TEST(DataItem, RejectsMismatchedTagCount) {
  Bytes bytes =
      signedItem({Tag::fromUtf8("a", "b"), Tag::fromUtf8("c", "d")}, "data")
          .serialize();
  size_t countAt = 2 + 512 + 512 + 1 + 1 + 32;
  bytes[countAt] = 3;
  expectInvalid(bytes);
}

TEST(DataItem, RejectsTruncatedInput) {
  Bytes bytes = signedItem({}, "data").serialize();
  bytes.resize(600);
  expectInvalid(bytes);
}

TEST(DataItem, UnsignedItemCannotBeSerialized) {
  DataItem item;
  item.data = to_bytes("data");
  try {
    item.serialize();
    FAIL() << "unsigned item serialized";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnsignedTransaction);
  }
}
