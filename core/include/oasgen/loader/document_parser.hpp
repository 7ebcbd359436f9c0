// oasgen/loader/document_parser.hpp - JSON / YAML text to Value
//
#pragma once

#include <string>
#include <string_view>

#include "oasgen/basic/value.hpp"

namespace oasgen
{

enum class DocumentFormat {
  Json,
  Yaml,
};

/**
 * Select the parser for a document path by the text after its last '.'.
 *
 * @throws LoadError for anything other than json, yaml or yml
 */
[[nodiscard]] DocumentFormat format_for_path(std::string_view path);

/**
 * Parse document text. The top-level value must be a mapping.
 *
 * @param text Document contents
 * @param format Parser to use
 * @param path Document path, used in error messages only
 * @throws LoadError on syntax errors or a non-mapping top level
 */
[[nodiscard]] Value parse_document(
  std::string_view text, DocumentFormat format, const std::string & path);

}  // namespace oasgen
