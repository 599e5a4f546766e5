#include "file.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "fxc_exception.hpp"
#include "writer.hpp"

namespace fxc {

class FileTest : public ::testing::Test {
 protected:
  void TearDown() override { std::filesystem::remove_all(dataDir); }

  std::string dataDir = (std::filesystem::temp_directory_path() / "fxconv_file_test").string();
};

TEST_F(FileTest, WriteThenRead) {
  File file(dataDir, File::Type::kStatic, "content.txt", File::IfError::kThrow);
  EXPECT_FALSE(file.exists());
  EXPECT_EQ(file.write("first"), 6);
  EXPECT_TRUE(file.exists());
  EXPECT_EQ(file.readAll(), "first\n");

  file.write("second", Writer::Mode::Append);
  EXPECT_EQ(file.readAll(), "first\nsecond\n");

  file.write("third");
  EXPECT_EQ(file.readAll(), "third\n");
}

TEST_F(FileTest, FilePath) {
  File file(dataDir, File::Type::kLog, "log.txt", File::IfError::kNoThrow);
  EXPECT_EQ(file.filePath(), dataDir + "/log/log.txt");
}

TEST_F(FileTest, MissingFile) {
  File noThrowFile(dataDir, File::Type::kStatic, "missing.json", File::IfError::kNoThrow);
  EXPECT_EQ(noThrowFile.readAll(), "");

  File throwFile(dataDir, File::Type::kStatic, "missing.json", File::IfError::kThrow);
  EXPECT_THROW(static_cast<void>(throwFile.readAll()), exception);
}

}  // namespace fxc
