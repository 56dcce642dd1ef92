#include "costtracker/pkce.hpp"

#include "costtracker/utils/base64.hpp"
#include "costtracker/utils/random.hpp"
#include "costtracker/utils/sha256.hpp"

namespace costtracker {
namespace {

// 32 bytes encode to the 43-character minimum verifier length.
constexpr std::size_t kVerifierBytes = 32;
constexpr std::size_t kStateBytes = 16;

}  // namespace

std::string pkce_challenge(const std::string& verifier) {
  return utils::encode_base64url(utils::sha256(verifier));
}

PkcePair make_pkce_pair() {
  PkcePair pair;
  pair.verifier = utils::encode_base64url(utils::random_bytes(kVerifierBytes));
  pair.challenge = pkce_challenge(pair.verifier);
  return pair;
}

std::string make_oauth_state() {
  return utils::encode_base64url(utils::random_bytes(kStateBytes));
}

}  // namespace costtracker
