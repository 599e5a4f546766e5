#pragma once

#include <algorithm>
#include <string_view>

#include "file.hpp"
#include "fxc_exception.hpp"
#include "fxc_json.hpp"
#include "fxc_log.hpp"
#include "reader.hpp"
#include "write-json.hpp"

namespace fxc {

static constexpr auto kExactJsonOptions =
    json::opts{.error_on_unknown_keys = true,  // NOLINT(readability-implicit-bool-conversion)
               .error_on_const_read = true,    // NOLINT(readability-implicit-bool-conversion)
               .raw_string = true};            // NOLINT(readability-implicit-bool-conversion)

template <json::opts opts>
void ReadJsonOrThrow(std::string_view strContent, auto &outObject) {
  if (strContent.empty()) {
    return;
  }

  auto ec = json::read<opts>(outObject, strContent);

  if (ec) {
    std::string_view prefixJsonContent = strContent.substr(0, 20);
    throw exception("Error while reading json content '{}{}': {}", prefixJsonContent,
                    prefixJsonContent.size() < strContent.size() ? "..." : "", json::format_error(ec, strContent));
  }
}

template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrThrow(std::string_view strContent) {
  T outObject;
  ReadJsonOrThrow<opts>(strContent, outObject);
  return outObject;
}

template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrThrow(const Reader &reader) {
  return ReadJsonOrThrow<T, opts>(reader.readAll());
}

/**
 * Read json content from given file, or create it with the default values of T if it does not exist.
 */
template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrCreateFile(const File &file) {
  T outObject;
  if (file.exists()) {
    ReadJsonOrThrow<opts>(file.readAll(), outObject);
  } else {
    log::info("Creating {} with default values", file.filePath());
    file.write(WritePrettyJsonOrThrow(outObject));
  }
  return outObject;
}

}  // namespace fxc
