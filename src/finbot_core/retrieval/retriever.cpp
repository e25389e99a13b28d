#include "finbot_core/retrieval/retriever.hpp"

#include <stdexcept>
#include <unordered_set>

#include "finbot_core/index/document_index.hpp"

namespace finbot_core {

Retriever::Retriever(std::shared_ptr<const DocumentIndex> document_index)
    : document_index_(std::move(document_index)) {
  if (!document_index_) {
    throw std::invalid_argument("Retriever requires a document index");
  }
}

std::vector<ScoredChunk> Retriever::retrieve(const std::vector<float> &query_embedding,
                                             size_t k,
                                             float min_similarity) const {
  std::vector<ScoredChunk> hits;
  try {
    hits = document_index_->search(query_embedding, k);
  } catch (const EmptyIndexError &) {
    return {};
  }

  // Hits arrive best first, so the first chunk seen per source is its best one
  std::vector<ScoredChunk> results;
  std::unordered_set<std::string> seen_sources;
  for (auto &hit : hits) {
    if (hit.score < min_similarity) {
      continue;
    }
    if (!seen_sources.insert(hit.chunk->source).second) {
      continue;
    }
    results.push_back(std::move(hit));
  }
  return results;
}

}  // namespace finbot_core
