#include "LocalDirDestination.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#include "core/Errors.hpp"
#include "core/util/Ids.hpp"

namespace mmig {

namespace fs = std::filesystem;

LocalDirDestination::LocalDirDestination(std::string root) : root_(std::move(root)) {}

std::string LocalDirDestination::upload(std::string_view bytes, const UploadMetadata& meta) {
  std::error_code ec;
  const fs::path dir = fs::path(root_) / "media";
  fs::create_directories(dir, ec);
  if (ec) throw TransientAdapterError("cannot create " + dir.string() + ": " + ec.message());

  const std::string id = uuid4();
  std::ofstream os(dir / id, std::ios::binary);
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.close();
  if (!os) throw TransientAdapterError("write failed for " + meta.source_id);

  // keep the original name next to the blob
  {
    std::ofstream name(dir / (id + ".name"));
    name << meta.file_name;
    if (!name) throw TransientAdapterError("write failed for " + meta.source_id);
  }

  if (meta.collection) {
    try {
      addToCollection(id, *meta.collection);
    } catch (const AdapterError&) {
      fs::remove(dir / id, ec);
      fs::remove(dir / (id + ".name"), ec);
      throw;
    }
  }
  return id;
}

CollectionHandle LocalDirDestination::ensureCollection(const std::string& name) {
  if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..")
    throw PermanentAdapterError("invalid collection name '" + name + "'");

  std::error_code ec;
  const fs::path dir = fs::path(root_) / "collections" / name;
  fs::create_directories(dir, ec);
  if (ec) throw TransientAdapterError("cannot create collection " + name + ": " + ec.message());
  return CollectionHandle{dir.string(), name};
}

void LocalDirDestination::addToCollection(const std::string& destinationId,
                                          const CollectionHandle& collection) {
  const fs::path media = fs::path(root_) / "media" / destinationId;
  std::error_code ec;
  if (!fs::exists(media, ec)) throw PermanentAdapterError("unknown media item " + destinationId);

  std::string fileName = destinationId;
  std::ifstream name(fs::path(root_) / "media" / (destinationId + ".name"));
  if (name) std::getline(name, fileName);

  // same name from a different source folder: disambiguate with the id
  fs::path target = fs::path(collection.id) / fileName;
  if (fs::exists(target, ec)) target = fs::path(collection.id) / (destinationId + "-" + fileName);

  fs::copy_file(media, target, fs::copy_options::overwrite_existing, ec);
  if (ec) throw TransientAdapterError("cannot add " + destinationId + " to " + collection.name + ": " + ec.message());
}

} // namespace mmig
