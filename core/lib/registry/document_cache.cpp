// oasgen/registry/document_cache.cpp - Loaded root documents
//
#include "oasgen/registry/document_cache.hpp"

#include <utility>

namespace oasgen
{

const Value * DocumentCache::find(const std::string & path) const
{
  auto it = documents_.find(path);
  if (it == documents_.end()) {
    return nullptr;
  }
  return &it->second;
}

const Value & DocumentCache::insert(std::string path, Value document)
{
  auto [it, inserted] = documents_.try_emplace(path, std::move(document));
  if (inserted) {
    paths_.push_back(std::move(path));
  }
  return it->second;
}

}  // namespace oasgen
