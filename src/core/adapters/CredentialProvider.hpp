#pragma once
#include <string>

namespace mmig {

// Supplies session tokens to adapters. Refresh is entirely its business;
// adapters only call invalidate() after the remote side rejected a token.
class CredentialProvider {
public:
  virtual ~CredentialProvider() = default;

  // Throws TransientAdapterError if no valid token can be produced right now.
  virtual std::string accessToken() = 0;
  virtual void invalidate() = 0;
};

} // namespace mmig
