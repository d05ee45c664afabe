#pragma once
#include <string>

#include "SourceAdapter.hpp"

namespace mmig {

// A library that is a directory tree. source_id is the path relative to root.
class LocalDirSource : public SourceAdapter {
public:
  explicit LocalDirSource(std::string root);

  void listItems(const std::function<void(const SourceItem&)>& sink) override;
  std::string fetch(const std::string& sourceId) override;

private:
  std::string root_;
};

} // namespace mmig
