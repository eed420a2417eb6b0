#include <stdexcept>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "docchat_core/chat/conversational_rag.hpp"
#include "docchat_core/errors.hpp"

namespace docchat_core {

using docchat_tests::MockEmbeddingProvider;
using docchat_tests::MockLanguageModel;
using docchat_tests::TestUtilities;
using ::testing::_;
using ::testing::AllOf;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::InSequence;
using ::testing::Not;
using ::testing::Return;
using ::testing::SaveArg;
using ::testing::Throw;

class ConversationalRagTest : public docchat_tests::IndexTestBase {
 protected:
  void SetUp() override {
    docchat_tests::IndexTestBase::SetUp();
    llm_ = std::make_shared<::testing::StrictMock<MockLanguageModel>>();
    rag_ = std::make_unique<ConversationalRag>(manager_, embedder_, llm_);

    auto index = manager_->create_or_open(SESSION);
    manager_->add_documents(
        *index, TestUtilities::make_chunks({"The lighthouse keeper lit the lamp every night.",
                                            "Penguins huddle together to survive the cold.",
                                            "Sourdough bread needs a mature starter culture."}));
  }

  static constexpr const char *SESSION = "session_rag";

  std::shared_ptr<::testing::StrictMock<MockLanguageModel>> llm_;
  std::unique_ptr<ConversationalRag> rag_;
};

TEST_F(ConversationalRagTest, Constructor_RequiresAllProviders) {
  EXPECT_THROW(ConversationalRag(nullptr, embedder_, llm_), ConfigurationError);
  EXPECT_THROW(ConversationalRag(manager_, nullptr, llm_), ConfigurationError);
  EXPECT_THROW(ConversationalRag(manager_, embedder_, nullptr), ConfigurationError);
}

TEST_F(ConversationalRagTest, Invoke_BeforeLoad_IsNotInitialized) {
  EXPECT_EQ(rag_->state(), ConversationalRag::State::Uninitialized);
  EXPECT_THROW(rag_->invoke("hello", {}), NotInitializedError);
}

TEST_F(ConversationalRagTest, LoadRetriever_MovesToLoadedState) {
  rag_->load_retriever(SESSION, 2, 3, 0.5f);
  EXPECT_EQ(rag_->state(), ConversationalRag::State::RetrieverLoaded);
  EXPECT_EQ(rag_->session_id(), SESSION);
}

TEST_F(ConversationalRagTest, LoadRetriever_UnknownSession_IsSessionNotFound) {
  try {
    rag_->load_retriever("session_missing");
    FAIL() << "Expected SessionNotFoundError";
  } catch (const SessionNotFoundError &e) {
    EXPECT_TRUE(e.cause() != nullptr);
  }
  EXPECT_THROW(rag_->load_retriever("../../etc"), SessionNotFoundError);
  EXPECT_EQ(rag_->state(), ConversationalRag::State::Uninitialized);
}

TEST_F(ConversationalRagTest, LoadRetriever_InvalidParams_Throws) {
  EXPECT_THROW(rag_->load_retriever(SESSION, 0, 20, 0.5f), InvalidParameterError);
  EXPECT_THROW(rag_->load_retriever(SESSION, 5, 4, 0.5f), InvalidParameterError);
  EXPECT_THROW(rag_->load_retriever(SESSION, 5, 20, 1.5f), InvalidParameterError);
  EXPECT_EQ(rag_->state(), ConversationalRag::State::Uninitialized);
}

TEST_F(ConversationalRagTest, LoadRetriever_CorruptIndex_Propagates) {
  std::filesystem::remove(manager_->path_for(SESSION) / VectorIndex::FAISS_FILE_NAME);
  EXPECT_THROW(rag_->load_retriever(SESSION), IndexCorruptError);
}

TEST_F(ConversationalRagTest, FailedReload_KeepsPreviousRetriever) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  EXPECT_THROW(rag_->load_retriever("session_missing"), SessionNotFoundError);
  EXPECT_EQ(rag_->state(), ConversationalRag::State::RetrieverLoaded);
  EXPECT_EQ(rag_->session_id(), SESSION);
}

TEST_F(ConversationalRagTest, Invoke_EmptyHistory_SkipsRewrite) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);

  std::string qa_prompt;
  EXPECT_CALL(*llm_, generate(_)).WillOnce(DoAll(SaveArg<0>(&qa_prompt), Return("They huddle.")));

  EXPECT_EQ(rag_->invoke("How do penguins survive the cold?", {}), "They huddle.");
  EXPECT_THAT(qa_prompt, HasSubstr("Question: How do penguins survive the cold?"));
  EXPECT_THAT(qa_prompt, HasSubstr("Penguins huddle together to survive the cold."));
  EXPECT_THAT(qa_prompt, Not(HasSubstr("lighthouse")));
}

TEST_F(ConversationalRagTest, Invoke_WithHistory_UsesStandaloneQuestion) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  std::vector<ChatMessage> history = {{MessageRole::User, "Tell me about bread."},
                                      {MessageRole::Assistant, "Sourdough is a bread."}};

  std::string qa_prompt;
  {
    InSequence seq;
    EXPECT_CALL(*llm_, generate(AllOf(HasSubstr("Standalone question:"),
                                      HasSubstr("User: Tell me about bread."),
                                      HasSubstr("Latest user query: What does it need?"))))
        .WillOnce(Return("  What does sourdough bread need?\n"));
    EXPECT_CALL(*llm_, generate(HasSubstr("Answer:")))
        .WillOnce(DoAll(SaveArg<0>(&qa_prompt), Return("A mature starter.")));
  }

  EXPECT_EQ(rag_->invoke("What does it need?", history), "A mature starter.");
  EXPECT_THAT(qa_prompt, HasSubstr("Question: What does sourdough bread need?"));
  EXPECT_THAT(qa_prompt, HasSubstr("Sourdough bread needs a mature starter culture."));
  EXPECT_THAT(qa_prompt, HasSubstr("Assistant: Sourdough is a bread."));
}

TEST_F(ConversationalRagTest, Invoke_BlankRewrite_FallsBackToMessage) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  std::vector<ChatMessage> history = {{MessageRole::User, "hi"}, {MessageRole::Assistant, "hello"}};

  std::string qa_prompt;
  {
    InSequence seq;
    EXPECT_CALL(*llm_, generate(HasSubstr("Standalone question:"))).WillOnce(Return("   \n"));
    EXPECT_CALL(*llm_, generate(HasSubstr("Answer:")))
        .WillOnce(DoAll(SaveArg<0>(&qa_prompt), Return("Every night.")));
  }

  EXPECT_EQ(rag_->invoke("When is the lighthouse lamp lit?", history), "Every night.");
  EXPECT_THAT(qa_prompt, HasSubstr("Question: When is the lighthouse lamp lit?"));
}

TEST_F(ConversationalRagTest, Invoke_HistoryWindowLimitsPrompt) {
  RagOptions options;
  options.history_window = 2;
  ConversationalRag rag(manager_, embedder_, llm_, options);
  rag.load_retriever(SESSION, 1, 3, 0.5f);

  std::vector<ChatMessage> history = {{MessageRole::User, "old question"},
                                      {MessageRole::Assistant, "old answer"},
                                      {MessageRole::User, "recent question"},
                                      {MessageRole::Assistant, "recent answer"}};
  std::string rewrite_prompt;
  EXPECT_CALL(*llm_, generate(_))
      .WillOnce(DoAll(SaveArg<0>(&rewrite_prompt), Return("standalone")))
      .WillOnce(Return("answer"));

  rag.invoke("next", history);
  EXPECT_THAT(rewrite_prompt, HasSubstr("recent question"));
  EXPECT_THAT(rewrite_prompt, Not(HasSubstr("old question")));
}

TEST_F(ConversationalRagTest, Invoke_ProviderFailure_IsGenerationError) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  EXPECT_CALL(*llm_, generate(_)).WillOnce(Throw(std::runtime_error("model offline")));

  try {
    rag_->invoke("anything", {});
    FAIL() << "Expected GenerationError";
  } catch (const GenerationError &e) {
    EXPECT_EQ(e.cause_message(), "model offline");
  }
}

TEST_F(ConversationalRagTest, Invoke_EmbeddingFailure_IsGenerationError) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  embedder_->set_failing(true);
  EXPECT_THROW(rag_->invoke("anything", {}), GenerationError);
}

TEST_F(ConversationalRagTest, Invoke_WrongQueryDimension_IsGenerationError) {
  auto embedder = std::make_shared<::testing::NiceMock<MockEmbeddingProvider>>();
  ON_CALL(*embedder, embed_query(_))
      .WillByDefault(Return(std::vector<float>(TEST_DIMENSION + 1, 1.0f)));
  ConversationalRag rag(manager_, embedder, llm_);
  rag.load_retriever(SESSION, 1, 3, 0.5f);

  try {
    rag.invoke("anything", {});
    FAIL() << "Expected GenerationError";
  } catch (const GenerationError &e) {
    EXPECT_THAT(e.cause_message(), HasSubstr("dimension"));
  }
}

TEST_F(ConversationalRagTest, Invoke_BlankAnswer_ReturnsPlaceholder) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  EXPECT_CALL(*llm_, generate(_)).WillOnce(Return(" \n\t"));
  EXPECT_EQ(rag_->invoke("anything", {}), ConversationalRag::NO_ANSWER);
}

TEST_F(ConversationalRagTest, Invoke_OverlongAnswer_IsRejected) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  EXPECT_CALL(*llm_, generate(_))
      .WillOnce(Return(std::string(4096, 'a')))
      .WillOnce(Return(std::string(4097, 'a')));

  EXPECT_EQ(rag_->invoke("first", {}).size(), 4096u);
  EXPECT_THROW(rag_->invoke("second", {}), GenerationError);
}

TEST_F(ConversationalRagTest, Invoke_AnswerLengthCountsCodePoints) {
  rag_->load_retriever(SESSION, 1, 3, 0.5f);
  std::string answer;
  for (int i = 0; i < 4096; ++i) {
    answer += "\xC3\xA9";  // é
  }
  EXPECT_CALL(*llm_, generate(_)).WillOnce(Return(answer));
  EXPECT_EQ(rag_->invoke("unicode", {}), answer);
}

class BuildContextTest : public ConversationalRagTest {
 protected:
  static RetrievalCandidate candidate(const std::string &text) {
    RetrievalCandidate c;
    c.chunk = TestUtilities::make_chunk(text);
    return c;
  }
};

TEST_F(BuildContextTest, JoinsChunksInOrder) {
  auto context = rag_->build_context({candidate("first"), candidate("second")});
  EXPECT_EQ(context, "first\n\nsecond");
  EXPECT_EQ(rag_->build_context({}), "");
}

TEST_F(BuildContextTest, StopsAtBudget) {
  RagOptions options;
  options.max_context_chars = 12;
  ConversationalRag rag(manager_, embedder_, llm_, options);
  // "aaaaa" + "\n\n" + "bbbbb" is exactly 12
  EXPECT_EQ(rag.build_context({candidate("aaaaa"), candidate("bbbbb"), candidate("c")}),
            "aaaaa\n\nbbbbb");
}

TEST_F(BuildContextTest, TruncatesOversizedFirstChunk) {
  RagOptions options;
  options.max_context_chars = 4;
  ConversationalRag rag(manager_, embedder_, llm_, options);
  EXPECT_EQ(rag.build_context({candidate("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"), candidate("x")}),
            "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9");
}

}  // namespace docchat_core
