#include "bumv/hash.hpp"
#include "bumv/consts.hpp"

#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>

namespace {

using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void check(int rc, const char *what) {
  if (rc != 1)
    throw std::runtime_error(std::string(what) + " failed");
}

} // namespace

namespace bumv {

digest sha1(std::string_view data) {
  MdCtx ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
  if (!ctx)
    throw std::runtime_error("EVP_MD_CTX_new failed");

  check(EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr), "EVP_DigestInit_ex(EVP_sha1)");
  if (!data.empty())
    check(EVP_DigestUpdate(ctx.get(), data.data(), data.size()), "EVP_DigestUpdate");

  digest out{};
  unsigned int len = 0;
  check(EVP_DigestFinal_ex(ctx.get(), out.data(), &len), "EVP_DigestFinal_ex");
  if (len != consts::kSha1RawLen)
    throw std::runtime_error("SHA-1 produced " + std::to_string(len) + " bytes");
  return out;
}

std::string to_hex(const digest &d) {
  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string s;
  s.reserve(consts::kSha1HexLen);
  for (const auto b : d) {
    s.push_back(kHex[b >> 4]);
    s.push_back(kHex[b & 0xF]);
  }
  return s;
}

} // namespace bumv
