#include "TestSupport.hpp"

#include <utility>

#include "core/Errors.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/util/Ids.hpp"

namespace mmig::test {

namespace fs = std::filesystem;

namespace {

// Decrements `budget` if positive; true when a failure was taken.
bool consumeFailure(std::atomic<int>& budget) {
  int left = budget.load();
  while (left > 0 && !budget.compare_exchange_weak(left, left - 1)) {}
  return left > 0;
}

} // namespace

TempDir::TempDir() : path_(fs::temp_directory_path() / ("mmig-test-" + uuid4())) {
  fs::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  fs::remove_all(path_, ec);
}

std::string freshStore(const TempDir& dir) {
  const std::string db = dir.sub("migration.db");
  initDatabase(db, MMIG_SCHEMA_PATH);
  return db;
}

void FakeSource::add(const std::string& id, const std::string& bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  items_[id] = bytes;
}

void FakeSource::failFetch(const std::string& id, std::function<void()> thrower) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_[id] = std::move(thrower);
}

void FakeSource::clearFailure(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_.erase(id);
}

int FakeSource::fetchCount(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = fetches_.find(id);
  return it == fetches_.end() ? 0 : it->second;
}

void FakeSource::listItems(const std::function<void(const SourceItem&)>& sink) {
  std::map<std::string, std::string> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = items_;
  }
  for (const auto& kv : snapshot) {
    SourceItem item;
    item.source_id = kv.first;
    item.name = kv.first + ".jpg";
    item.size = static_cast<int64_t>(kv.second.size());
    item.created_at = 1600000000;
    sink(item);
  }
}

std::string FakeSource::fetch(const std::string& sourceId) {
  if (onFetch) onFetch(sourceId);

  std::function<void()> failure;
  std::string bytes;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++fetches_[sourceId];
    auto f = failures_.find(sourceId);
    if (f != failures_.end()) failure = f->second;
    auto it = items_.find(sourceId);
    if (it == items_.end()) throw PermanentAdapterError("no such item " + sourceId);
    bytes = it->second;
  }
  if (failure) failure();
  return bytes;
}

std::string FakeDestination::upload(std::string_view bytes, const UploadMetadata& meta) {
  if (failUploads.load()) throw TransientAdapterError("destination unavailable");
  if (rejectUploads.load()) throw PermanentAdapterError("destination rejected " + meta.source_id);
  if (meta.collection && consumeFailure(failCollectionAdds)) throw TransientAdapterError("HTTP 503");

  std::lock_guard<std::mutex> lock(mutex_);
  ++uploads_[meta.source_id];
  const std::string id = "dest-" + std::to_string(++seq_);
  stored_[id] = std::string(bytes);
  if (meta.collection) members_[meta.collection->id].push_back(id);
  return id;
}

CollectionHandle FakeDestination::ensureCollection(const std::string& name) {
  return CollectionHandle{"album-" + name, name};
}

void FakeDestination::addToCollection(const std::string& destinationId, const CollectionHandle& collection) {
  if (consumeFailure(failCollectionAdds)) throw TransientAdapterError("HTTP 503");
  std::lock_guard<std::mutex> lock(mutex_);
  members_[collection.id].push_back(destinationId);
}

int FakeDestination::uploadCount(const std::string& sourceId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = uploads_.find(sourceId);
  return it == uploads_.end() ? 0 : it->second;
}

int FakeDestination::totalUploads() const {
  std::lock_guard<std::mutex> lock(mutex_);
  int n = 0;
  for (const auto& kv : uploads_) n += kv.second;
  return n;
}

std::string FakeDestination::content(const std::string& destinationId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = stored_.find(destinationId);
  return it == stored_.end() ? std::string() : it->second;
}

std::vector<std::string> FakeDestination::members(const std::string& collectionId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = members_.find(collectionId);
  return it == members_.end() ? std::vector<std::string>() : it->second;
}

bool isValidHistory(const std::vector<HistoryEntry>& h, std::string* why) {
  auto reject = [&](const std::string& msg) {
    if (why) *why = msg;
    return false;
  };
  if (h.empty()) return reject("empty history");
  if (h[0].kind != TransitionKind::Register || h[0].to != WorkState::Discovered)
    return reject("history does not start with registration");

  WorkState current = h[0].to;
  for (size_t i = 1; i < h.size(); ++i) {
    const auto& e = h[i];
    if (!e.from || *e.from != current)
      return reject("entry " + std::to_string(i) + " does not leave " + toString(current));
    if (!isAllowed(e.kind, *e.from, e.to))
      return reject("entry " + std::to_string(i) + " is not an allowed " + toString(e.kind) + " " +
                    toString(*e.from) + " -> " + toString(e.to));
    current = e.to;
  }
  return true;
}

} // namespace mmig::test
