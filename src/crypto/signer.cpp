#include "crypto/signer.hpp"
#include "utilities/encoding.hpp"
#include "utilities/errors.hpp"

#include <fstream>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/rsa.h>
#include <utility>

namespace arloader {

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ParamBldPtr = std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using ParamPtr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const uint8_t PUBLIC_EXPONENT[] = {0x01, 0x00, 0x01};

std::string opensslError() {
  unsigned long code = ERR_get_error();
  if (code == 0)
    return "unknown OpenSSL error";
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return buf;
}

BignumPtr toBignum(ByteView bytes) {
  BignumPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr),
               &BN_free);
  if (!bn)
    throwError(ErrorKind::KeyRejected, opensslError());
  return bn;
}

// Builds an RSA EVP_PKEY from named big-endian components.
EVP_PKEY *buildKey(const std::vector<std::pair<const char *, Bytes>> &parts,
                   int selection) {
  ParamBldPtr bld(OSSL_PARAM_BLD_new(), &OSSL_PARAM_BLD_free);
  if (!bld)
    throwError(ErrorKind::KeyRejected, opensslError());
  std::vector<BignumPtr> keep;
  for (const auto &[name, value] : parts) {
    keep.push_back(toBignum(value));
    if (OSSL_PARAM_BLD_push_BN(bld.get(), name, keep.back().get()) != 1)
      throwError(ErrorKind::KeyRejected, opensslError());
  }
  ParamPtr params(OSSL_PARAM_BLD_to_param(bld.get()), &OSSL_PARAM_free);
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr),
                 &EVP_PKEY_CTX_free);
  if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1)
    throwError(ErrorKind::KeyRejected, opensslError());
  EVP_PKEY *key = nullptr;
  if (EVP_PKEY_fromdata(ctx.get(), &key, selection, params.get()) != 1)
    throwError(ErrorKind::KeyRejected, opensslError());
  return key;
}

void configurePss(EVP_PKEY_CTX *pctx, int saltLen) {
  if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1 ||
      EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, saltLen) != 1) {
    throwError(ErrorKind::SigningFailed, opensslError());
  }
}

} // namespace

std::string Signer::walletAddress() const {
  return b64_encode(sha256(publicModulus()));
}

bool verifySignature(ByteView owner, ByteView message, ByteView signature) {
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
      buildKey({{OSSL_PKEY_PARAM_RSA_N, Bytes(owner.begin(), owner.end())},
                {OSSL_PKEY_PARAM_RSA_E,
                 Bytes(std::begin(PUBLIC_EXPONENT), std::end(PUBLIC_EXPONENT))}},
               EVP_PKEY_PUBLIC_KEY),
      &EVP_PKEY_free);

  MdCtxPtr md(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  EVP_PKEY_CTX *pctx = nullptr;
  if (!md || EVP_DigestVerifyInit(md.get(), &pctx, EVP_sha256(), nullptr,
                                  key.get()) != 1) {
    throwError(ErrorKind::SigningFailed, opensslError());
  }
  configurePss(pctx, RSA_PSS_SALTLEN_AUTO);
  int rc = EVP_DigestVerify(md.get(), signature.data(), signature.size(),
                            message.data(), message.size());
  ERR_clear_error();
  return rc == 1;
}

RsaSigner::RsaSigner(KeyPtr key) : key_(std::move(key)) {
  if (!key_ || EVP_PKEY_get_base_id(key_.get()) != EVP_PKEY_RSA)
    throwError(ErrorKind::KeyRejected, "not an RSA key");
  if (EVP_PKEY_get_bits(key_.get()) != static_cast<int>(RSA_MODULUS_SIZE * 8))
    throwError(ErrorKind::KeyRejected, "wallet keys must be 4096-bit RSA");
  BIGNUM *n = nullptr;
  if (EVP_PKEY_get_bn_param(key_.get(), OSSL_PKEY_PARAM_RSA_N, &n) != 1)
    throwError(ErrorKind::KeyRejected, opensslError());
  BignumPtr modulus(n, &BN_free);
  modulus_.resize(RSA_MODULUS_SIZE);
  if (BN_bn2binpad(modulus.get(), modulus_.data(),
                   static_cast<int>(modulus_.size())) < 0)
    throwError(ErrorKind::KeyRejected, opensslError());
}

RsaSigner::~RsaSigner() = default;

std::unique_ptr<RsaSigner> RsaSigner::fromJwk(const nlohmann::json &jwk) {
  try {
    if (jwk.at("kty").get<std::string>() != "RSA")
      throwError(ErrorKind::KeyRejected, "jwk kty must be RSA");
    auto field = [&](const char *name) {
      return b64_decode(jwk.at(name).get<std::string>());
    };
    KeyPtr key(
        buildKey({{OSSL_PKEY_PARAM_RSA_N, field("n")},
                  {OSSL_PKEY_PARAM_RSA_E, field("e")},
                  {OSSL_PKEY_PARAM_RSA_D, field("d")},
                  {OSSL_PKEY_PARAM_RSA_FACTOR1, field("p")},
                  {OSSL_PKEY_PARAM_RSA_FACTOR2, field("q")},
                  {OSSL_PKEY_PARAM_RSA_EXPONENT1, field("dp")},
                  {OSSL_PKEY_PARAM_RSA_EXPONENT2, field("dq")},
                  {OSSL_PKEY_PARAM_RSA_COEFFICIENT1, field("qi")}},
                 EVP_PKEY_KEYPAIR),
        &EVP_PKEY_free);
    return std::make_unique<RsaSigner>(std::move(key));
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::KeyRejected, std::string("jwk: ") + e.what());
  } catch (const Error &e) {
    if (e.kind() == ErrorKind::Base64Decode)
      throwError(ErrorKind::KeyRejected, e.what());
    throw;
  }
}

std::unique_ptr<RsaSigner>
RsaSigner::fromJwkFile(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in.is_open())
    throwError(ErrorKind::Io, "cannot open keypair file " + path.string());
  nlohmann::json jwk;
  try {
    in >> jwk;
  } catch (const nlohmann::json::exception &e) {
    throwError(ErrorKind::KeyRejected,
               path.string() + " is not a JWK file: " + e.what());
  }
  return fromJwk(jwk);
}

Bytes RsaSigner::sign(ByteView message) const {
  MdCtxPtr md(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  EVP_PKEY_CTX *pctx = nullptr;
  if (!md ||
      EVP_DigestSignInit(md.get(), &pctx, EVP_sha256(), nullptr,
                         key_.get()) != 1) {
    throwError(ErrorKind::SigningFailed, opensslError());
  }
  configurePss(pctx, RSA_PSS_SALTLEN_DIGEST);
  size_t len = 0;
  if (EVP_DigestSign(md.get(), nullptr, &len, message.data(), message.size()) !=
      1)
    throwError(ErrorKind::SigningFailed, opensslError());
  Bytes signature(len);
  if (EVP_DigestSign(md.get(), signature.data(), &len, message.data(),
                     message.size()) != 1)
    throwError(ErrorKind::SigningFailed, opensslError());
  signature.resize(len);
  return signature;
}

Bytes RsaSigner::publicModulus() const { return modulus_; }

} // namespace arloader
