// Shared fixtures for the replacer tests

#ifndef REPLACER_TEST_HELPERS_HPP
#define REPLACER_TEST_HELPERS_HPP

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace replacer {
namespace test {

namespace fs = std::filesystem;

inline void write_file(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

/// Lines of 50 copies of ch, each followed by '\n', until size is covered
inline std::string build_line_file(char ch, size_t size) {
  const size_t skip = 50;
  std::string out;
  out.reserve(size + size / skip + 1);
  for (size_t i = 0; i < size; i += skip) {
    out.append(skip, ch);
    out.push_back('\n');
  }
  return out;
}

/// Every entry directly inside dir whose name starts with ".": temp leftovers
inline std::vector<std::string> hidden_entries(const fs::path &dir) {
  std::vector<std::string> names;
  for (const auto &entry : fs::directory_iterator(dir)) {
    std::string name = entry.path().filename().string();
    if (!name.empty() && name[0] == '.')
      names.push_back(name);
  }
  return names;
}

/**
 * @brief Fixture owning a fresh scratch directory per test.
 */
class ScratchDirTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    root_ = fs::temp_directory_path() /
            ("replacer_test_" + std::to_string(rd()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
};

} // namespace test
} // namespace replacer

#endif // REPLACER_TEST_HELPERS_HPP
