#include "LocalFSBackend.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "Digest.hpp"
#include "core/util/Ids.hpp"

namespace mmig {

namespace fs = std::filesystem;

LocalFSBackend::LocalFSBackend(std::string stagingRoot)
  : stagingRoot_(std::move(stagingRoot)) {
  fs::create_directories(stagingRoot_);
  stagingRoot_ = fs::weakly_canonical(stagingRoot_).string();
}

std::string LocalFSBackend::put(const std::string& key, std::string_view bytes) {
  // two hex chars of the key's digest keep directories small
  fs::path dir = fs::path(stagingRoot_) / sha256_hex(key).substr(0, 2);
  fs::create_directories(dir);

  const std::string name = uuid4();
  fs::path tmp = dir / (name + ".part");
  fs::path file = dir / name;
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot create staging file " + tmp.string());
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      std::error_code ec;
      fs::remove(tmp, ec);
      throw std::runtime_error("short write to staging file " + tmp.string());
    }
  }
  fs::rename(tmp, file);
  return file.string();
}

std::string LocalFSBackend::read(const std::string& contentRef) const {
  std::ifstream in(contentRef, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open staged content " + contentRef);
  std::ostringstream buf; buf << in.rdbuf();
  if (in.bad()) throw std::runtime_error("failed reading staged content " + contentRef);
  return buf.str();
}

bool LocalFSBackend::remove(const std::string& contentRef) {
  const fs::path p = fs::weakly_canonical(contentRef);
  const std::string s = p.string();
  const std::string prefix = stagingRoot_ + "/";
  if (s.compare(0, prefix.size(), prefix) != 0)
    throw std::invalid_argument("refusing to remove " + s + " outside staging root");
  return fs::remove(p);
}

bool LocalFSBackend::exists(const std::string& contentRef) const {
  std::error_code ec;
  return fs::is_regular_file(contentRef, ec);
}

} // namespace mmig
