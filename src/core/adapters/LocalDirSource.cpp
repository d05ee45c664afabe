#include "LocalDirSource.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include "core/Errors.hpp"

namespace mmig {

namespace fs = std::filesystem;

namespace {

int64_t toUnixSeconds(fs::file_time_type t) {
  // file_clock has no portable to_sys in C++17; shift by the two clocks' "now".
  const auto sys = std::chrono::system_clock::now() +
                   std::chrono::duration_cast<std::chrono::system_clock::duration>(
                     t - fs::file_time_type::clock::now());
  return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

} // namespace

LocalDirSource::LocalDirSource(std::string root) : root_(std::move(root)) {}

void LocalDirSource::listItems(const std::function<void(const SourceItem&)>& sink) {
  std::error_code ec;
  if (!fs::is_directory(root_, ec))
    throw TransientAdapterError("source root " + root_ + " is not a readable directory");

  fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
  if (ec) throw TransientAdapterError("cannot list " + root_ + ": " + ec.message());

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) throw TransientAdapterError("listing " + root_ + " failed: " + ec.message());
    const auto& entry = *it;
    if (!entry.is_regular_file(ec)) continue;

    SourceItem item;
    item.source_id = fs::relative(entry.path(), root_).generic_string();
    item.name = entry.path().filename().string();
    item.size = static_cast<int64_t>(entry.file_size(ec));
    item.created_at = toUnixSeconds(entry.last_write_time(ec));
    sink(item);
  }
}

std::string LocalDirSource::fetch(const std::string& sourceId) {
  const fs::path p = fs::path(root_) / sourceId;
  std::error_code ec;
  if (!fs::exists(p, ec)) {
    if (ec) throw TransientAdapterError("cannot stat " + p.string() + ": " + ec.message());
    throw PermanentAdapterError("source item " + sourceId + " no longer exists");
  }

  std::ifstream in(p, std::ios::binary);
  if (!in) throw TransientAdapterError("cannot open " + p.string());
  std::ostringstream buf; buf << in.rdbuf();
  if (in.bad()) throw TransientAdapterError("read error on " + p.string());
  return buf.str();
}

} // namespace mmig
