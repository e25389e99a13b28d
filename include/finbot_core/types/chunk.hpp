#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace finbot_core {

// One indexed unit of knowledge. Immutable once it is owned by the DocumentIndex;
// updates are a remove followed by an insert.
struct Chunk {
  int64_t id = 0;  // 0 means "not assigned yet"
  std::string text;
  std::vector<float> embedding;
  std::string category;
  std::string source;
  std::chrono::system_clock::time_point created_at;
  std::string content_hash;
};

using ChunkPtr = std::shared_ptr<const Chunk>;

struct ScoredChunk {
  ChunkPtr chunk;
  float score = 0.0f;
};

}  // namespace finbot_core
