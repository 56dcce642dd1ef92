#pragma once

#include <string>

namespace costtracker {

// RFC 7636 proof key: `challenge` is base64url(SHA-256(verifier)).
struct PkcePair {
  std::string verifier;
  std::string challenge;
};

PkcePair make_pkce_pair();

std::string pkce_challenge(const std::string& verifier);

/**
 * Random base64url string used as the OAuth2 `state` parameter.
 */
std::string make_oauth_state();

}  // namespace costtracker
