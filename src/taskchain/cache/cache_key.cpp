#include "taskchain/cache/cache_key.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <iterator>
#include <stdexcept>

namespace taskchain {

namespace {

auto sha256_hex(std::string_view data) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(),
                 nullptr) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  std::string hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    std::format_to(std::back_inserter(hex), "{:02x}", digest[i]);
  }
  return hex;
}

}  // namespace

auto TaskIdentity::of(const TaskMessage& msg) -> TaskIdentity {
  return TaskIdentity{msg.task, msg.user, msg.args, msg.identity_kwargs()};
}

auto TaskIdentity::canonical() const -> std::string {
  return nlohmann::json::array({task, user.str(), args, kwargs}).dump();
}

auto make_cache_key(const TaskIdentity& identity) -> std::string {
  return sha256_hex(identity.canonical());
}

auto make_error_key(std::string_view cache_key) -> std::string {
  std::string key{cache_key};
  key.append(kErrorKeySuffix);
  return key;
}

auto derive_keys(const TaskIdentity& identity) -> CacheKeys {
  auto key = make_cache_key(identity);
  auto error = make_error_key(key);
  return CacheKeys{std::move(key), std::move(error)};
}

}  // namespace taskchain
