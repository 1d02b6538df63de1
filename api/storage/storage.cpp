#include "storage.h"

#include <algorithm>

namespace storage {

void RankScores(std::vector<ScoreEntry>& entries, size_t limit) {
  std::stable_sort(entries.begin(), entries.end(), [](const ScoreEntry& a, const ScoreEntry& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.created_at < b.created_at;
  });
  if (entries.size() > limit) entries.resize(limit);
  for (size_t i = 0; i < entries.size(); ++i) {
    entries[i].rank = static_cast<int>(i) + 1;
  }
}

}  // namespace storage
