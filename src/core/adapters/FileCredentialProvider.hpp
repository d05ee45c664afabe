#pragma once
#include <mutex>
#include <string>

#include "CredentialProvider.hpp"

namespace mmig {

// Reads {"access_token": "..."} from a JSON file kept fresh by an external
// authentication helper. The token is cached until invalidate().
class FileCredentialProvider : public CredentialProvider {
public:
  explicit FileCredentialProvider(std::string path);

  std::string accessToken() override;
  void invalidate() override;

private:
  std::string path_;
  std::string token_;
  std::mutex mutex_;
};

} // namespace mmig
