#include <gtest/gtest.h>

#include <vector>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "finbot_core/db/chunk_repository.hpp"
#include "finbot_core/db/pooled_connection.hpp"

namespace finbot_core {

class ChunkRepositoryTest : public finbot_tests::ChunkRepositoryTestBase {
 protected:
  ChunkPtr make_chunk(int64_t id, const std::string& text, int64_t created_ms = 1700000000000) {
    auto chunk = finbot_tests::MockUtilities::create_test_chunk(
        text, finbot_tests::MockUtilities::axis_embedding(static_cast<size_t>(id)), "rates.csv",
        "Savings");
    chunk.id = id;
    chunk.created_at = ChunkRepository::from_epoch_ms(created_ms);
    return std::make_shared<const Chunk>(std::move(chunk));
  }
};

TEST_F(ChunkRepositoryTest, SaveAndLoadPreservesEveryField) {
  chunk_repository_->save_chunks({make_chunk(2, "Question: Savings rate?\nAnswer: 5%", 1700000000123),
                                  make_chunk(1, "Question: Current rate?\nAnswer: 0%")});

  auto chunks = chunk_repository_->load_all();
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].id, 1);
  EXPECT_EQ(chunks[1].id, 2);
  EXPECT_EQ(chunks[1].text, "Question: Savings rate?\nAnswer: 5%");
  EXPECT_EQ(chunks[1].content_hash, "hash_Question: Savings rate?\nAnswer: 5%");
  EXPECT_EQ(chunks[1].category, "Savings");
  EXPECT_EQ(chunks[1].source, "rates.csv");
  EXPECT_EQ(chunks[1].embedding, finbot_tests::MockUtilities::axis_embedding(2));
  EXPECT_EQ(ChunkRepository::to_epoch_ms(chunks[1].created_at), 1700000000123);
}

TEST_F(ChunkRepositoryTest, ContentIsStoredCompressed) {
  std::string text;
  for (int i = 0; i < 50; ++i) {
    text += "Answer: please visit your nearest branch. ";
  }
  chunk_repository_->save_chunks({make_chunk(1, text)});

  PooledConnection conn(*db_manager_);
  std::vector<char> stored;
  *conn << "SELECT content FROM chunks WHERE id = 1" >> stored;
  EXPECT_LT(stored.size(), text.size());
  EXPECT_EQ(chunk_repository_->load_all()[0].text, text);
}

TEST_F(ChunkRepositoryTest, SaveIsAllOrNothing) {
  chunk_repository_->save_chunks({make_chunk(1, "first")});

  // Second batch reuses id 1, so nothing from it may land
  try {
    chunk_repository_->save_chunks({make_chunk(2, "second"), make_chunk(1, "third")});
    FAIL() << "Expected ChunkRepositoryError";
  } catch (const ChunkRepositoryError &e) {
    EXPECT_NE(std::string(e.what()).find("duplicate_chunk_id"), std::string::npos) << e.what();
  }
  EXPECT_EQ(chunk_repository_->count(), 1u);
}

TEST_F(ChunkRepositoryTest, DuplicateContentHashIsRejected) {
  chunk_repository_->save_chunks({make_chunk(1, "same text")});
  try {
    chunk_repository_->save_chunks({make_chunk(2, "same text")});
    FAIL() << "Expected ChunkRepositoryError";
  } catch (const ChunkRepositoryError &e) {
    EXPECT_NE(std::string(e.what()).find("duplicate_content_hash"), std::string::npos) << e.what();
  }
}

TEST_F(ChunkRepositoryTest, RemoveChunksReportsRemovedRows) {
  chunk_repository_->save_chunks({make_chunk(1, "a"), make_chunk(2, "b"), make_chunk(3, "c")});

  EXPECT_EQ(chunk_repository_->remove_chunks({1, 3, 42}), 2u);
  EXPECT_EQ(chunk_repository_->remove_chunks({}), 0u);
  auto remaining = chunk_repository_->load_all();
  ASSERT_EQ(remaining.size(), 1u);
  EXPECT_EQ(remaining[0].id, 2);
}

TEST_F(ChunkRepositoryTest, EmptyRepository) {
  EXPECT_EQ(chunk_repository_->count(), 0u);
  EXPECT_TRUE(chunk_repository_->load_all().empty());
  EXPECT_NO_THROW(chunk_repository_->save_chunks({}));
}

TEST_F(ChunkRepositoryTest, EmbeddingBlobConversion) {
  std::vector<float> embedding = {0.25f, -1.5f, 3.0f};
  auto blob = ChunkRepository::embedding_to_blob(embedding);
  EXPECT_EQ(blob.size(), 3 * sizeof(float));
  EXPECT_EQ(ChunkRepository::blob_to_embedding(blob), embedding);
  EXPECT_THROW(ChunkRepository::blob_to_embedding(std::vector<char>(5)), ChunkRepositoryError);
}

TEST_F(ChunkRepositoryTest, CorruptContentSurfacesAsRepositoryError) {
  PooledConnection conn(*db_manager_);
  std::vector<char> garbage = {'x', 'y', 'z'};
  std::vector<char> embedding = ChunkRepository::embedding_to_blob({1.0f});
  *conn << "INSERT INTO chunks (id, content, content_hash, category, source, embedding, created_at) "
           "VALUES (?, ?, ?, ?, ?, ?, ?)"
        << 7 << garbage << std::string("h") << std::string() << std::string("s") << embedding << 0;

  EXPECT_THROW(chunk_repository_->load_all(), ChunkRepositoryError);
}

}  // namespace finbot_core
