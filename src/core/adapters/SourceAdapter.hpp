#pragma once
#include <functional>
#include <string>

#include "core/metadata/WorkItem.hpp"

namespace mmig {

// Where assets come from. Implementations throw TransientAdapterError or
// PermanentAdapterError; anything else is treated as transient by the workers.
class SourceAdapter {
public:
  virtual ~SourceAdapter() = default;

  // Streams every asset of the library to `sink`.
  virtual void listItems(const std::function<void(const SourceItem&)>& sink) = 0;

  // Full content of one asset.
  virtual std::string fetch(const std::string& sourceId) = 0;
};

} // namespace mmig
