#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "docchat_api/config.hpp"

using docchat_api::Config;
using docchat_core::ConfigurationError;

namespace {

std::string write_temp_file(const std::string &contents) {
  char filename_template[] = "/tmp/docchat_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5);  // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE *file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string &path) {
  std::remove(path.c_str());
}

}  // namespace

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  Config cfg = Config::from_json(nlohmann::json::object());

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:8000");
  EXPECT_EQ(cfg.index_root, "./faiss_index");
  EXPECT_EQ(cfg.upload_dir, "./data");
  EXPECT_EQ(cfg.session_store, "sqlite");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.embedding_model, "mxbai-embed-large");
  EXPECT_EQ(cfg.embedding_dimension, 1024);
  EXPECT_EQ(cfg.index_type, "hnsw");
  EXPECT_EQ(cfg.chunk_size, 1000);
  EXPECT_EQ(cfg.chunk_overlap, 200);
  EXPECT_EQ(cfg.k, 5);
  EXPECT_EQ(cfg.fetch_k, 20);
  EXPECT_DOUBLE_EQ(cfg.lambda_mult, 0.5);
  EXPECT_EQ(cfg.history_window, 6);
}

TEST(ConfigTest, LoadsOverridesFromJson) {
  nlohmann::json j = {{"api_base_url", "0.0.0.0:9000"},
                      {"session_store", "memory"},
                      {"chat_model", "mistral"},
                      {"embedding_dimension", 768},
                      {"index_type", "flat"},
                      {"chunk_size", 500},
                      {"chunk_overlap", 50},
                      {"k", 3},
                      {"fetch_k", 10},
                      {"lambda_mult", 0.25}};

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.host(), "0.0.0.0");
  EXPECT_EQ(cfg.port(), 9000);
  EXPECT_EQ(cfg.session_store, "memory");
  EXPECT_EQ(cfg.chat_model, "mistral");

  auto index_options = cfg.index_options();
  EXPECT_EQ(index_options.dimension, 768u);
  EXPECT_EQ(index_options.type, docchat_core::IndexType::Flat);

  auto splitter_options = cfg.splitter_options();
  EXPECT_EQ(splitter_options.chunk_size, 500);
  EXPECT_EQ(splitter_options.chunk_overlap, 50);

  auto chat_options = cfg.chat_options();
  EXPECT_EQ(chat_options.mmr.k, 3);
  EXPECT_EQ(chat_options.mmr.fetch_k, 10);
  EXPECT_FLOAT_EQ(chat_options.mmr.lambda_mult, 0.25f);
  EXPECT_EQ(chat_options.rag.history_window, 6u);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "index_root": "/var/lib/docchat/index",
    "chunk_size": 800,
    "chunk_overlap": 100
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.port(), 4000);
  EXPECT_EQ(cfg.index_root, "/var/lib/docchat/index");
  EXPECT_EQ(cfg.chunk_size, 800);
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({ (void)Config::from_file("/nonexistent/path/config.json"); }, ConfigurationError);
}

TEST(ConfigTest, MalformedJsonThrows) {
  std::string path = write_temp_file("{ \"k\": ");
  EXPECT_THROW({ (void)Config::from_file(path); }, ConfigurationError);
  remove_file(path);
}

TEST(ConfigTest, NonObjectAndWrongTypesThrow) {
  EXPECT_THROW({ (void)Config::from_json(nlohmann::json::array()); }, ConfigurationError);
  EXPECT_THROW({ (void)Config::from_json({{"k", "five"}}); }, ConfigurationError);
  EXPECT_THROW({ (void)Config::from_json({{"index_root", 42}}); }, ConfigurationError);
}

TEST(ConfigTest, RejectsInvalidValues) {
  const std::vector<nlohmann::json> invalid = {
      {{"api_base_url", ""}},
      {{"api_base_url", "localhost"}},
      {{"api_base_url", "localhost:http"}},
      {{"session_store", "redis"}},
      {{"db_pool_size", 0}},
      {{"embedding_dimension", 0}},
      {{"index_type", "ivf"}},
      {{"chunk_size", 100}, {"chunk_overlap", 100}},
      {{"chunk_overlap", 0}},
      {{"k", 0}},
      {{"k", 10}, {"fetch_k", 5}},
      {{"lambda_mult", 1.5}},
      {{"lambda_mult", -0.1}},
      {{"max_context_chars", 0}},
  };
  for (const auto &j : invalid) {
    EXPECT_THROW({ (void)Config::from_json(j); }, ConfigurationError) << j.dump();
  }
}

TEST(ConfigTest, ResolvesPathFromEnvironment) {
  unsetenv(Config::CONFIG_PATH_ENV);
  EXPECT_EQ(Config::resolve_config_path(), "docchatrc.json");

  setenv(Config::CONFIG_PATH_ENV, "/etc/docchat/custom.json", 1);
  EXPECT_EQ(Config::resolve_config_path(), "/etc/docchat/custom.json");

  setenv(Config::CONFIG_PATH_ENV, "", 1);
  EXPECT_EQ(Config::resolve_config_path(), "docchatrc.json");
  unsetenv(Config::CONFIG_PATH_ENV);
}
