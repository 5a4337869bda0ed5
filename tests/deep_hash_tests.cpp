#include "crypto/deep_hash.hpp"
#include "crypto/signer.hpp"
#include "test_keys.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"
#include <gtest/gtest.h>
#include <openssl/evp.h>
#include <utility>

using namespace arloader;

TEST(DeepHash, BlobVector) {
  auto digest = deepHash(DeepHashItem::fromString("abc"));
  EXPECT_EQ(to_hex(digest),
            "71115a30152ebcffb6defbb643abc8ef76f01fe323f1d62340646085960f6e34"
            "7cb2d8e9a46ddee655b3012c6131d4e0");
}

TEST(DeepHash, EmptyListVector) {
  auto digest = deepHash(DeepHashItem::fromChildren({}));
  EXPECT_EQ(to_hex(digest),
            "a69e7d37fdc7f040a9ec16aae84de24fab4a653dac4de0bd247e36bab9fe45d9"
            "289c5a04a893c95285812f5cefc9707a");
}

TEST(DeepHash, ListFoldsChildrenInOrder) {
  auto a = DeepHashItem::fromString("a");
  auto b = DeepHashItem::fromString("b");
  EXPECT_NE(deepHash(DeepHashItem::fromChildren({a, b})),
            deepHash(DeepHashItem::fromChildren({b, a})));
  // A blob and a one-element list over the same bytes differ.
  EXPECT_NE(deepHash(a), deepHash(DeepHashItem::fromChildren({a})));
}

TEST(DeepHash, JsonShape) {
  auto item = DeepHashItem::fromChildren(
      {DeepHashItem::fromString("hi"), DeepHashItem::fromChildren({})});
  nlohmann::json j = item;
  EXPECT_EQ(j.dump(), R"({"List":[{"Blob":[104,105]},{"List":[]}]})");
  EXPECT_EQ(j.get<DeepHashItem>(), item);
}

TEST(DeepHash, JsonRejectsUnknownShape) {
  nlohmann::json j = {{"Tree", 1}};
  EXPECT_THROW(j.get<DeepHashItem>(), Error);
}

TEST(Signer, ModulusAndAddress) {
  const auto &signer = testkeys::signer();
  Bytes modulus = signer.publicModulus();
  ASSERT_EQ(modulus.size(), RSA_MODULUS_SIZE);
  EXPECT_EQ(signer.walletAddress(), b64_encode(sha256(modulus)));
  EXPECT_EQ(signer.walletAddress().size(), 43u);
}

TEST(Signer, SignatureVerifiesAgainstOwner) {
  const auto &signer = testkeys::signer();
  Bytes message = to_bytes("message to sign");
  Bytes signature = signer.sign(message);
  ASSERT_EQ(signature.size(), RSA_MODULUS_SIZE);
  EXPECT_TRUE(verifySignature(signer.publicModulus(), message, signature));

  Bytes tampered = signature;
  tampered[100] ^= 0x40;
  EXPECT_FALSE(verifySignature(signer.publicModulus(), message, tampered));
  EXPECT_FALSE(
      verifySignature(signer.publicModulus(), to_bytes("other"), signature));
}

TEST(Signer, JwkRejectsOtherKeyTypes) {
  nlohmann::json jwk = testkeys::jwk();
  jwk["kty"] = "EC";
  try {
    RsaSigner::fromJwk(jwk);
    FAIL() << "EC key accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::KeyRejected);
  }
}

TEST(Signer, JwkRejectsMissingFields) {
  nlohmann::json jwk = testkeys::jwk();
  jwk.erase("qi");
  EXPECT_THROW(RsaSigner::fromJwk(jwk), Error);
}

TEST(Signer, MissingKeyFileIsIoError) {
  try {
    RsaSigner::fromJwkFile("/nonexistent/arloader/wallet.json");
    FAIL() << "missing file accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Io);
  }
}

TEST(Signer, RejectsShortRsaKey) {
  RsaSigner::KeyPtr key(
      EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", static_cast<size_t>(2048)),
      &EVP_PKEY_free);
  ASSERT_TRUE(key);
  try {
    RsaSigner signer(std::move(key));
    FAIL() << "2048-bit key accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::KeyRejected);
  }
}

TEST(Signer, TakesOwnershipOfKey) {
  auto signer = RsaSigner::fromJwk(testkeys::jwk());
  EXPECT_EQ(signer->publicModulus(), testkeys::signer().publicModulus());
  EXPECT_EQ(signer->walletAddress(), testkeys::signer().walletAddress());
}
