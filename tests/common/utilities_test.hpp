#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "common/mocks_test.hpp"
#include "docchat_core/db/database_manager.hpp"
#include "docchat_core/index/vector_index_manager.hpp"
#include "docchat_core/types/chunk.hpp"

namespace docchat_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Fresh, empty directory under the system temp dir
  static std::filesystem::path create_temp_dir(const std::string &prefix = "docchat_test");
  static void remove_temp_dir(const std::filesystem::path &dir);

  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path &db_path);

  static std::filesystem::path write_text_file(const std::filesystem::path &path,
                                               const std::string &contents);

  // Chunk with its fingerprint already computed
  static docchat_core::Chunk make_chunk(const std::string &content,
                                        const std::string &source_id = "doc.txt",
                                        int chunk_index = 0);

  static std::vector<docchat_core::Chunk> make_chunks(const std::vector<std::string> &contents,
                                                      const std::string &source_id = "doc.txt");

  // Unit vector along axis `i`, optionally tilted towards axis `j`
  static std::vector<float> axis_vector(size_t dimension, size_t i, size_t j = 0,
                                        float tilt = 0.0f);
};

/**
 * Fixture with a temp index root, a deterministic embedder and an exact
 * (flat) index manager
 */
class IndexTestBase : public ::testing::Test {
 protected:
  static constexpr size_t TEST_DIMENSION = 64;

  void SetUp() override {
    index_root_ = TestUtilities::create_temp_dir("docchat_index");
    embedder_ = std::make_shared<HashingEmbeddingProvider>(TEST_DIMENSION);
    options_.dimension = TEST_DIMENSION;
    options_.type = docchat_core::IndexType::Flat;
    manager_ = std::make_shared<docchat_core::VectorIndexManager>(index_root_, embedder_, options_);
  }

  void TearDown() override {
    manager_.reset();
    TestUtilities::remove_temp_dir(index_root_);
  }

  std::filesystem::path index_root_;
  std::shared_ptr<HashingEmbeddingProvider> embedder_;
  docchat_core::IndexOptions options_;
  std::shared_ptr<docchat_core::VectorIndexManager> manager_;
};

/**
 * Fixture that points the DatabaseManager singleton at a fresh temp database
 */
class SessionDbTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    auto &mgr = docchat_core::DatabaseManager::get_instance();
    // If a previous test left the DB initialized, shut it down to re-init with a fresh temp path
    mgr.shutdown();
    mgr.initialize(temp_db_path_, /*pool_size*/ 4);
    db_manager_ = &mgr;
  }

  void TearDown() override {
    if (db_manager_) {
      db_manager_->shutdown();
    }
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  docchat_core::DatabaseManager *db_manager_ = nullptr;
};

}  // namespace docchat_tests
