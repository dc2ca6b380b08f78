#ifndef _INCLUDE_LINKMINT_ALPHABET_PERMUTER_H
#define _INCLUDE_LINKMINT_ALPHABET_PERMUTER_H

#include <array>
#include <cstdint>
#include <folly/Synchronized.h>
#include <folly/container/F14Map.h>
#include <string>
#include <string_view>

#include "linkmint/alphabet.h"

namespace linkmint {
namespace token {

using KeyDigest = std::array<std::uint8_t, 32>;

// SHA-256 of the operator's secret key.
auto digest_secret_key(std::string_view secret_key) -> KeyDigest;

// Derives the obfuscated digit order used for tokens. The digest of
// `secret_key` keys a ChaCha20 keystream (zero nonce, zero counter) whose
// little-endian 32-bit words drive a Fisher-Yates shuffle of `canonical`.
//
// Same key and same canonical alphabet give the same permutation in every
// process on every platform; changing the key, the hash, the cipher or the
// shuffle changes the meaning of every token issued afterwards.
//
// The ordering hides the canonical digit positions from someone who does not
// know the key. That is obfuscation, not a guarantee that tokens cannot be
// guessed from a sequence of observed ones.
//
// Throws `ConfigurationError` if `secret_key` is empty.
auto derive_permuted_alphabet(std::string_view secret_key,
                              const Alphabet &canonical) -> Alphabet;

// Memoizes `derive_permuted_alphabet` so the shuffle runs once per key for
// the life of the process. References handed out stay valid until the cache
// is destroyed.
class PermutedAlphabetCache {
public:
  auto get(std::string_view secret_key, const Alphabet &canonical)
      -> const Alphabet &;

  auto size() const -> std::size_t;

private:
  // keyed by digest of the secret key + canonical symbols; the key itself is
  // not retained
  folly::Synchronized<folly::F14NodeMap<std::string, Alphabet>> derived_;
};

} // namespace token
} // namespace linkmint

#endif // _INCLUDE_LINKMINT_ALPHABET_PERMUTER_H
