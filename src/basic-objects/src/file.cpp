#include "file.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string_view>
#include <system_error>

#include "fxc_exception.hpp"
#include "fxc_log.hpp"
#include "fxc_string.hpp"
#include "writer.hpp"

namespace fxc {
namespace {
constexpr std::string_view SubDirectory(File::Type fileType) {
  switch (fileType) {
    case File::Type::kLog:
      return "log";
    case File::Type::kStatic:
      return "static";
  }
  return {};
}

string DataDirFilePath(std::string_view dataDir, File::Type fileType, std::string_view fileName) {
  std::filesystem::path path(dataDir);
  path /= SubDirectory(fileType);
  path /= fileName;
  return path.string();
}
}  // namespace

File::File(std::string_view filePath, IfError ifError) : _filePath(filePath), _ifError(ifError) {}

File::File(std::string_view dataDir, Type type, std::string_view name, IfError ifError)
    : _filePath(DataDirFilePath(dataDir, type, name)), _ifError(ifError) {}

string File::readAll() const {
  if (_ifError == IfError::kNoThrow && !exists()) {
    log::debug("File {} does not exist", _filePath);
    return {};
  }
  log::debug("Reading {}", _filePath);
  std::ifstream fileStream(_filePath, std::ios_base::in | std::ios_base::binary);
  if (!fileStream) {
    onError("Unable to open {} for reading");
    return {};
  }
  return {std::istreambuf_iterator<char>(fileStream), std::istreambuf_iterator<char>()};
}

int File::write(std::string_view data, Writer::Mode mode) const {
  if (data.empty()) {
    return 0;
  }
  std::filesystem::path path(_filePath);
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      log::warn("Unable to create directory {}: {}", path.parent_path().string(), ec.message());
    }
  }
  log::debug("Writing {} bytes to {}", data.size(), _filePath);
  std::ofstream fileStream(path, mode == Writer::Mode::FromStart ? std::ios_base::trunc : std::ios_base::app);
  if (!fileStream) {
    onError("Unable to open {} for writing");
    return 0;
  }
  fileStream << data << '\n';
  if (!fileStream) {
    onError("Error while writing {}");
    return 0;
  }
  return static_cast<int>(data.size()) + 1;
}

bool File::exists() const { return std::filesystem::exists(_filePath); }

void File::onError(format_string<const string &> msg) const {
  if (_ifError == IfError::kThrow) {
    throw exception(msg, _filePath);
  }
  log::error(msg, _filePath);
}

}  // namespace fxc
