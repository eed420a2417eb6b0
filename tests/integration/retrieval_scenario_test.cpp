#include <cctype>
#include <map>
#include <string>
#include <vector>

#include "../common/utilities_test.hpp"
#include "docchat_core/retrieval/mmr_retriever.hpp"
#include "docchat_core/services/ingestion_service.hpp"

namespace docchat_core {

using docchat_tests::TestUtilities;

/**
 * Embeds text by topic keyword. Every text also carries a shared component so
 * unrelated topics are weakly relevant to any query; two chunks on the same
 * topic differ only by a small tilt.
 */
class TopicEmbeddingProvider : public EmbeddingProvider {
 public:
  static constexpr size_t DIMENSION = 16;
  static constexpr size_t SHARED_AXIS = DIMENSION - 1;

  std::vector<float> embed(const std::string &text) override {
    return topic_vector(text, 0.5f);
  }

  std::vector<float> embed_query(const std::string &text) override {
    return topic_vector(text, 1.0f);
  }

 private:
  static std::vector<float> topic_vector(const std::string &text, float shared_weight) {
    static const std::map<std::string, std::pair<size_t, float>> keywords = {
        {"solar", {0, 1.0f}},     {"wind", {1, 1.0f}},      {"bread", {2, 1.0f}},
        {"penguins", {3, 1.0f}},  {"lighthouse", {4, 1.0f}}, {"volcano", {5, 1.0f}},
        {"rooftops", {10, 0.1f}}, {"buildings", {11, 0.1f}}};

    std::vector<float> vec(DIMENSION, 0.0f);
    vec[SHARED_AXIS] = shared_weight;
    std::string word;
    auto flush = [&]() {
      auto it = keywords.find(word);
      if (it != keywords.end()) {
        vec[it->second.first] = it->second.second;
      }
      word.clear();
    };
    for (unsigned char c : text) {
      if (std::isalnum(c)) {
        word += static_cast<char>(std::tolower(c));
      } else {
        flush();
      }
    }
    flush();
    return vec;
  }
};

class RetrievalScenarioTest : public ::testing::Test {
 protected:
  static constexpr const char *QUERY = "How do solar panels make electricity?";

  void SetUp() override {
    index_root_ = TestUtilities::create_temp_dir("docchat_scenario");
    embedder_ = std::make_shared<TopicEmbeddingProvider>();

    IndexOptions index_options;
    index_options.dimension = TopicEmbeddingProvider::DIMENSION;
    index_options.type = IndexType::Flat;
    manager_ = std::make_shared<VectorIndexManager>(index_root_, embedder_, index_options);

    SplitterOptions splitter_options;
    splitter_options.chunk_size = 200;
    splitter_options.chunk_overlap = 20;
    service_ = std::make_unique<IngestionService>(
        manager_, std::make_shared<TextSplitter>(splitter_options),
        std::make_shared<InMemorySessionStore>(), std::make_shared<SessionLockRegistry>());
  }

  void TearDown() override {
    service_.reset();
    manager_.reset();
    TestUtilities::remove_temp_dir(index_root_);
  }

  // Three documents; the first paragraph of the first two differs by one word
  static std::vector<LoadedDocument> documents() {
    return {
        {"Solar panels convert sunlight into electricity through photovoltaic cells, and most "
         "homes mount them on rooftops facing the sun.\n\n"
         "Wind turbines spin large blades that drive a generator, so steady coastal breezes make "
         "the best sites for new farms.",
         "energy.txt"},
        {"Solar panels convert sunlight into electricity through photovoltaic cells, and most "
         "homes mount them on buildings facing the sun.\n\n"
         "Bread dough rises because yeast ferments sugars and releases gas, which the gluten "
         "network traps as the loaf bakes.",
         "install.md"},
        {"Penguins huddle together through the polar winter, taking turns at the edge of the "
         "group to share warmth.\n\n"
         "The lighthouse keeper climbed the spiral stairs each evening to trim the wick and "
         "polish the great lens.\n\n"
         "A volcano erupts when pressure from molten rock and dissolved gas builds beneath the "
         "crust until it breaks open.",
         "nature.txt"},
    };
  }

  MmrRetriever retriever(const std::string &session_id, float lambda) {
    MmrParams params;
    params.k = 5;
    params.fetch_k = 20;
    params.lambda_mult = lambda;
    return MmrRetriever(manager_->load(manager_->path_for(session_id)), embedder_, params);
  }

  static int solar_count(const std::vector<RetrievalCandidate> &results) {
    int count = 0;
    for (const auto &result : results) {
      if (result.chunk.content.rfind("Solar panels", 0) == 0) {
        ++count;
      }
    }
    return count;
  }

  std::filesystem::path index_root_;
  std::shared_ptr<TopicEmbeddingProvider> embedder_;
  std::shared_ptr<VectorIndexManager> manager_;
  std::unique_ptr<IngestionService> service_;
};

TEST_F(RetrievalScenarioTest, ParagraphsBecomeChunks) {
  auto result = service_->create_session(documents());
  EXPECT_EQ(result.documents, 3u);
  EXPECT_EQ(result.chunks, 7u);
  EXPECT_EQ(result.chunks_added, 7u);
}

TEST_F(RetrievalScenarioTest, MmrKeepsOneOfNearDuplicatePair) {
  auto session_id = service_->create_session(documents()).session_id;
  auto results = retriever(session_id, 0.5f).retrieve(QUERY);

  ASSERT_EQ(results.size(), 5u);
  EXPECT_EQ(solar_count(results), 1);
  EXPECT_EQ(results.front().chunk.content.rfind("Solar panels", 0), 0u);
}

TEST_F(RetrievalScenarioTest, SimilaritySearchKeepsBothNearDuplicates) {
  auto session_id = service_->create_session(documents()).session_id;
  auto results = retriever(session_id, 0.5f).similarity_search(QUERY, 5);

  ASSERT_EQ(results.size(), 5u);
  EXPECT_EQ(solar_count(results), 2);
  EXPECT_EQ(solar_count({results[0], results[1]}), 2);
}

TEST_F(RetrievalScenarioTest, PureRelevanceMatchesSimilarityOrder) {
  auto session_id = service_->create_session(documents()).session_id;
  auto results = retriever(session_id, 1.0f).retrieve(QUERY);

  ASSERT_EQ(results.size(), 5u);
  EXPECT_EQ(solar_count({results[0], results[1]}), 2);
}

TEST_F(RetrievalScenarioTest, ReingestingSameDocumentsChangesNothing) {
  auto created = service_->create_session(documents());
  auto again = service_->add_documents(created.session_id, documents());
  EXPECT_EQ(again.chunks_added, 0u);

  auto results = retriever(created.session_id, 0.5f).retrieve(QUERY);
  EXPECT_EQ(solar_count(results), 1);
}

}  // namespace docchat_core
