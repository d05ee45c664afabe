#include "FileCredentialProvider.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <utility>

#include "core/Errors.hpp"

using nlohmann::json;

namespace mmig {

FileCredentialProvider::FileCredentialProvider(std::string path) : path_(std::move(path)) {}

std::string FileCredentialProvider::accessToken() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!token_.empty()) return token_;

  std::ifstream in(path_);
  if (!in) throw TransientAdapterError("credential file " + path_ + " not readable");

  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    throw TransientAdapterError("credential file " + path_ + " is not valid JSON: " + e.what());
  }
  if (!j.contains("access_token") || !j["access_token"].is_string() ||
      j["access_token"].get<std::string>().empty())
    throw TransientAdapterError("credential file " + path_ + " has no access_token");

  token_ = j["access_token"].get<std::string>();
  spdlog::debug("loaded access token from {}", path_);
  return token_;
}

void FileCredentialProvider::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  token_.clear();
}

} // namespace mmig
