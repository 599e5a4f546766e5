#pragma once

#include <cstdint>
#include <string_view>

#include "fxc_format.hpp"
#include "fxc_string.hpp"
#include "reader.hpp"
#include "writer.hpp"

namespace fxc {

/// A file of the data directory, which can be read and written.
class File : public Reader, public Writer {
 public:
  enum class Type : int8_t { kStatic, kLog };
  enum class IfError : int8_t { kThrow, kNoThrow };

  /// Creates a File directly from a file path.
  File(std::string_view filePath, IfError ifError);

  /// Creates a File from the data directory, its type and its name.
  /// Example: File("/data", File::Type::kStatic, "rates.json", ...) designates '/data/static/rates.json'
  File(std::string_view dataDir, Type type, std::string_view name, IfError ifError);

  [[nodiscard]] string readAll() const override;

  int write(std::string_view data, Writer::Mode mode = Writer::Mode::FromStart) const override;

  [[nodiscard]] bool exists() const;

  [[nodiscard]] std::string_view filePath() const { return _filePath; }

 private:
  void onError(format_string<const string &> msg) const;

  string _filePath;
  IfError _ifError;
};

}  // namespace fxc
