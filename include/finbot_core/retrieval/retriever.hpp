#pragma once

#include <memory>
#include <vector>

#include "finbot_core/types/chunk.hpp"

namespace finbot_core {

class DocumentIndex;

class Retriever {
 public:
  explicit Retriever(std::shared_ptr<const DocumentIndex> document_index);

  // Top-k chunks at or above min_similarity, best first, at most one per source.
  // An empty index yields an empty list.
  std::vector<ScoredChunk> retrieve(const std::vector<float> &query_embedding,
                                    size_t k,
                                    float min_similarity) const;

 private:
  std::shared_ptr<const DocumentIndex> document_index_;
};

}  // namespace finbot_core
