// oasgen/loader/content_loader.cpp - Filesystem and in-memory loaders
//
#include "oasgen/loader/content_loader.hpp"

#include <fstream>
#include <sstream>

#include "oasgen/basic/errors.hpp"
#include "oasgen/loader/document_parser.hpp"
#include "oasgen/ref/uri.hpp"

namespace oasgen
{

Value FileContentLoader::load_map(const std::string & path)
{
  const DocumentFormat format = format_for_path(path);
  // Absolute document paths ("/common.yaml") are rooted at the base directory
  const std::filesystem::path file_path =
    base_dir_ / std::filesystem::u8path(uri::percent_decode(path)).relative_path();

  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    throw LoadError(path, "cannot open file " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw LoadError(path, "failed to read file " + file_path.string());
  }

  return parse_document(buffer.str(), format, path);
}

Value InMemoryContentLoader::load_map(const std::string & path)
{
  const DocumentFormat format = format_for_path(path);

  auto it = files_.find(path);
  if (it == files_.end()) {
    throw LoadError(path, "no such document");
  }

  return parse_document(it->second, format, path);
}

}  // namespace oasgen
