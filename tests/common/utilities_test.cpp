#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <cmath>
#include <fstream>
#include <stdexcept>

#include "docchat_core/splitter/fingerprint.hpp"

namespace docchat_tests {

namespace {

std::string unique_suffix() {
  static std::atomic<int> counter{0};
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
  return std::to_string(timestamp) + "_" + std::to_string(counter++);
}

}  // namespace

std::filesystem::path TestUtilities::create_temp_dir(const std::string &prefix) {
  auto dir = std::filesystem::temp_directory_path() / "docchat_tests" / (prefix + "_" + unique_suffix());
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::remove_temp_dir(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

std::filesystem::path TestUtilities::create_temp_test_db() {
  auto temp_dir = std::filesystem::temp_directory_path() / "docchat_tests";
  std::filesystem::create_directories(temp_dir);
  return temp_dir / ("sessions_" + unique_suffix() + ".db");
}

void TestUtilities::cleanup_temp_db(const std::filesystem::path &db_path) {
  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  // WAL side files, if the journal mode left any
  std::filesystem::remove(db_path.string() + "-wal", ec);
  std::filesystem::remove(db_path.string() + "-shm", ec);
}

std::filesystem::path TestUtilities::write_text_file(const std::filesystem::path &path,
                                                     const std::string &contents) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to create test file: " + path.string());
  }
  out << contents;
  return path;
}

docchat_core::Chunk TestUtilities::make_chunk(const std::string &content,
                                              const std::string &source_id, int chunk_index) {
  docchat_core::Chunk chunk;
  chunk.content = content;
  chunk.source_id = source_id;
  chunk.chunk_index = chunk_index;
  chunk.fingerprint = docchat_core::compute_fingerprint(content);
  return chunk;
}

std::vector<docchat_core::Chunk> TestUtilities::make_chunks(
    const std::vector<std::string> &contents, const std::string &source_id) {
  std::vector<docchat_core::Chunk> chunks;
  for (size_t i = 0; i < contents.size(); ++i) {
    chunks.push_back(make_chunk(contents[i], source_id, static_cast<int>(i)));
  }
  return chunks;
}

std::vector<float> TestUtilities::axis_vector(size_t dimension, size_t i, size_t j, float tilt) {
  std::vector<float> vec(dimension, 0.0f);
  vec[i] = 1.0f;
  if (tilt != 0.0f) {
    vec[j] += tilt;
  }
  float norm = 0.0f;
  for (float v : vec) {
    norm += v * v;
  }
  norm = std::sqrt(norm);
  for (auto &v : vec) {
    v /= norm;
  }
  return vec;
}

}  // namespace docchat_tests
