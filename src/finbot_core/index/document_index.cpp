#include "finbot_core/index/document_index.hpp"

#include <faiss/impl/IDSelector.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_set>

#include "finbot_core/llm/embedding_provider.hpp"

namespace finbot_core {

DocumentIndex::DocumentIndex(size_t dimension,
                             std::shared_ptr<EmbeddingProvider> embedding_provider)
    : dimension_(dimension), embedding_provider_(std::move(embedding_provider)) {
  if (dimension_ == 0) {
    throw DocumentIndexError("Embedding dimension must be positive");
  }
  auto base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimension_));
  // Wrap with IDMap to keep chunk ids as faiss labels
  faiss_index_ = std::make_unique<faiss::IndexIDMap>(base_index);
  faiss_index_->own_fields = true;
}

DocumentIndex::~DocumentIndex() = default;

void DocumentIndex::prepare(Chunk &chunk) const {
  if (chunk.text.empty()) {
    throw DocumentIndexError("Cannot index a chunk without text");
  }
  if (chunk.embedding.empty()) {
    if (!embedding_provider_) {
      throw DocumentIndexError("Chunk has no embedding and no embedding provider is configured");
    }
    chunk.embedding = embedding_provider_->get_embedding(chunk.text);
  }
  validate_dimension(chunk.embedding);
  if (chunk.created_at == std::chrono::system_clock::time_point{}) {
    // Millisecond precision, the same the chunk repository stores
    chunk.created_at = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  }
}

void DocumentIndex::validate_dimension(const std::vector<float> &vector) const {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
}

std::vector<float> DocumentIndex::normalized(const std::vector<float> &vector) const {
  double norm = 0.0;
  for (float v : vector) {
    norm += static_cast<double>(v) * v;
  }
  norm = std::sqrt(norm);
  std::vector<float> result(vector.size(), 0.0f);
  // A zero vector stays zero and scores 0 against everything
  if (norm == 0.0) {
    return result;
  }
  for (size_t i = 0; i < vector.size(); ++i) {
    result[i] = static_cast<float>(vector[i] / norm);
  }
  return result;
}

ChunkPtr DocumentIndex::insert(Chunk chunk) {
  std::vector<Chunk> batch;
  batch.push_back(std::move(chunk));
  return bulk_insert(std::move(batch)).front();
}

std::vector<ChunkPtr> DocumentIndex::bulk_insert(std::vector<Chunk> chunks) {
  if (chunks.empty()) {
    return {};
  }

  for (auto &chunk : chunks) {
    prepare(chunk);
  }

  std::vector<float> flat_vectors;
  flat_vectors.reserve(chunks.size() * dimension_);
  for (const auto &chunk : chunks) {
    auto unit = normalized(chunk.embedding);
    flat_vectors.insert(flat_vectors.end(), unit.begin(), unit.end());
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);

  // Validate ids against the current contents before touching anything
  std::unordered_set<int64_t> batch_ids;
  int64_t candidate_id = next_id_;
  for (auto &chunk : chunks) {
    if (chunk.id == 0) {
      while (chunks_.count(candidate_id) || batch_ids.count(candidate_id)) {
        ++candidate_id;
      }
      chunk.id = candidate_id++;
    }
    if (chunk.id < 0) {
      throw DocumentIndexError("Chunk id must be positive, got " + std::to_string(chunk.id));
    }
    if (chunks_.count(chunk.id) || !batch_ids.insert(chunk.id).second) {
      throw DocumentIndexError("Chunk id " + std::to_string(chunk.id) + " is already indexed");
    }
  }

  std::vector<faiss::idx_t> faiss_ids;
  faiss_ids.reserve(chunks.size());
  for (const auto &chunk : chunks) {
    faiss_ids.push_back(chunk.id);
  }
  faiss_index_->add_with_ids(static_cast<faiss::idx_t>(chunks.size()), flat_vectors.data(),
                             faiss_ids.data());

  std::vector<ChunkPtr> stored;
  stored.reserve(chunks.size());
  for (auto &chunk : chunks) {
    next_id_ = std::max(next_id_, chunk.id + 1);
    auto ptr = std::make_shared<const Chunk>(std::move(chunk));
    if (!ptr->content_hash.empty()) {
      ids_by_hash_[ptr->content_hash] = ptr->id;
    }
    chunks_[ptr->id] = ptr;
    stored.push_back(std::move(ptr));
  }
  return stored;
}

size_t DocumentIndex::remove(const std::vector<int64_t> &ids) {
  std::unique_lock<std::shared_mutex> lock(mutex_);

  std::vector<faiss::idx_t> present;
  for (int64_t id : ids) {
    auto it = chunks_.find(id);
    if (it == chunks_.end()) {
      continue;
    }
    const auto &hash = it->second->content_hash;
    auto hash_it = ids_by_hash_.find(hash);
    if (hash_it != ids_by_hash_.end() && hash_it->second == id) {
      ids_by_hash_.erase(hash_it);
    }
    chunks_.erase(it);
    present.push_back(id);
  }
  if (present.empty()) {
    return 0;
  }

  faiss::IDSelectorBatch selector(present.size(), present.data());
  faiss_index_->remove_ids(selector);
  return present.size();
}

bool DocumentIndex::ranks_before(const ScoredChunk &a, const ScoredChunk &b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.chunk->created_at != b.chunk->created_at) {
    return a.chunk->created_at < b.chunk->created_at;
  }
  return a.chunk->id < b.chunk->id;
}

std::vector<ScoredChunk> DocumentIndex::search(const std::vector<float> &query_embedding,
                                               size_t k) const {
  auto query = normalized(query_embedding);

  std::shared_lock<std::shared_mutex> lock(mutex_);
  if (chunks_.empty()) {
    throw EmptyIndexError("The document index is empty");
  }
  validate_dimension(query_embedding);
  if (k == 0) {
    return {};
  }

  const size_t total = static_cast<size_t>(faiss_index_->ntotal);
  const size_t wanted = std::min(k, total);

  // Faiss does not order equal scores by our tie-break, so widen the window until the
  // score at the cut-off is no longer repeated just past it
  size_t fetch = std::min(total, wanted + 1);
  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  while (true) {
    distances.assign(fetch, 0.0f);
    labels.assign(fetch, -1);
    faiss_index_->search(1, query.data(), static_cast<faiss::idx_t>(fetch), distances.data(),
                         labels.data());
    if (fetch == total || distances[fetch - 1] != distances[wanted - 1]) {
      break;
    }
    fetch = std::min(total, fetch * 2);
  }

  std::vector<ScoredChunk> results;
  results.reserve(fetch);
  for (size_t i = 0; i < fetch; ++i) {
    if (labels[i] == -1) {
      continue;
    }
    auto it = chunks_.find(labels[i]);
    if (it == chunks_.end()) {
      continue;
    }
    results.push_back(ScoredChunk{it->second, distances[i]});
  }

  std::stable_sort(results.begin(), results.end(), ranks_before);
  if (results.size() > wanted) {
    results.resize(wanted);
  }
  return results;
}

ChunkPtr DocumentIndex::get(int64_t id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = chunks_.find(id);
  return it == chunks_.end() ? nullptr : it->second;
}

bool DocumentIndex::contains_content_hash(const std::string &content_hash) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return ids_by_hash_.count(content_hash) > 0;
}

size_t DocumentIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chunks_.size();
}

bool DocumentIndex::empty() const {
  return size() == 0;
}

float DocumentIndex::cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw DimensionMismatchError(a.size(), b.size());
  }
  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

}  // namespace finbot_core
