#pragma once
#include <string>
#include <string_view>

namespace mmig {

// Local staging area holding fetched content until it is delivered.
// Each put() writes a fresh file, so two attempts on the same item never
// share a content_ref.
class LocalFSBackend {
public:
  explicit LocalFSBackend(std::string stagingRoot);

  // Writes bytes under <root>/<shard of key>/<uuid>; returns the full path.
  // The file only appears under its final name once completely written.
  // Throws std::runtime_error on I/O failure.
  std::string put(const std::string& key, std::string_view bytes);

  // Reads a staged file back. Throws std::runtime_error if it is missing or unreadable.
  std::string read(const std::string& contentRef) const;

  // Removes a staged file. Returns false if it was already gone.
  // Throws std::filesystem::filesystem_error on other failures, or
  // std::invalid_argument for a path outside the staging root.
  bool remove(const std::string& contentRef);

  bool exists(const std::string& contentRef) const;

  const std::string& root() const { return stagingRoot_; }

private:
  std::string stagingRoot_;
};

} // namespace mmig
