#include "linkmint/alphabet_permuter.h"

#include <glog/logging.h>
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "linkmint/errors.h"

namespace linkmint {
namespace token {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX *ctx) const noexcept {
    EVP_CIPHER_CTX_free(ctx);
  }
};

// Reads the ChaCha20 keystream for a 256-bit key by encrypting zero bytes.
class Keystream {
public:
  explicit Keystream(const KeyDigest &key) : ctx_(EVP_CIPHER_CTX_new()) {
    if (!ctx_) {
      throw std::runtime_error{"EVP_CIPHER_CTX_new failed"};
    }
    // 4-byte little-endian block counter followed by the 12-byte nonce
    const std::array<unsigned char, 16> iv{};
    if (EVP_EncryptInit_ex(ctx_.get(), EVP_chacha20(), nullptr, key.data(),
                           iv.data()) != 1) {
      throw std::runtime_error{"EVP_EncryptInit_ex(chacha20) failed"};
    }
  }

  auto next_u32() -> std::uint32_t {
    if (pos_ == block_.size()) {
      refill();
    }
    std::uint32_t v = static_cast<std::uint32_t>(block_[pos_]) |
                      static_cast<std::uint32_t>(block_[pos_ + 1]) << 8 |
                      static_cast<std::uint32_t>(block_[pos_ + 2]) << 16 |
                      static_cast<std::uint32_t>(block_[pos_ + 3]) << 24;
    pos_ += 4;
    return v;
  }

  // Uniform in [0, bound).
  auto next_below(std::uint32_t bound) -> std::uint32_t {
    const std::uint32_t threshold = (0u - bound) % bound;
    for (;;) {
      std::uint32_t r = next_u32();
      if (r >= threshold) {
        return r % bound;
      }
    }
  }

private:
  void refill() {
    const std::array<unsigned char, 64> zeros{};
    int out_len = 0;
    if (EVP_EncryptUpdate(ctx_.get(), block_.data(), &out_len, zeros.data(),
                          static_cast<int>(zeros.size())) != 1 ||
        out_len != static_cast<int>(block_.size())) {
      throw std::runtime_error{"EVP_EncryptUpdate(chacha20) failed"};
    }
    pos_ = 0;
  }

  std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx_;
  std::array<unsigned char, 64> block_{};
  std::size_t pos_{block_.size()};
};

auto cache_key(const KeyDigest &digest, const Alphabet &canonical)
    -> std::string {
  std::string key(reinterpret_cast<const char *>(digest.data()),
                  digest.size());
  key.append(canonical.symbols());
  return key;
}

} // namespace

auto digest_secret_key(std::string_view secret_key) -> KeyDigest {
  KeyDigest out{};
  unsigned int len = 0;
  if (EVP_Digest(secret_key.data(), secret_key.size(), out.data(), &len,
                 EVP_sha256(), nullptr) != 1 ||
      len != out.size()) {
    throw std::runtime_error{"EVP_Digest(sha256) failed"};
  }
  return out;
}

auto derive_permuted_alphabet(std::string_view secret_key,
                              const Alphabet &canonical) -> Alphabet {
  if (secret_key.empty()) {
    throw ConfigurationError{"secret key must not be empty"};
  }
  Keystream stream{digest_secret_key(secret_key)};
  std::string symbols{canonical.symbols()};
  for (std::size_t i = symbols.size() - 1; i > 0; --i) {
    auto j = stream.next_below(static_cast<std::uint32_t>(i + 1));
    std::swap(symbols[i], symbols[j]);
  }
  VLOG(1) << "derived permuted alphabet of " << symbols.size() << " symbols";
  return Alphabet::create(symbols);
}

auto PermutedAlphabetCache::get(std::string_view secret_key,
                                const Alphabet &canonical)
    -> const Alphabet & {
  if (secret_key.empty()) {
    throw ConfigurationError{"secret key must not be empty"};
  }
  auto key = cache_key(digest_secret_key(secret_key), canonical);
  {
    auto rlock = derived_.rlock();
    auto it = rlock->find(key);
    if (it != rlock->end()) {
      return it->second;
    }
  }
  auto derived = derive_permuted_alphabet(secret_key, canonical);
  auto wlock = derived_.wlock();
  auto [it, inserted] = wlock->try_emplace(std::move(key), std::move(derived));
  DLOG_IF(INFO, !inserted) << "permuted alphabet raced; kept first derivation";
  return it->second;
}

auto PermutedAlphabetCache::size() const -> std::size_t {
  return derived_.rlock()->size();
}

} // namespace token
} // namespace linkmint
