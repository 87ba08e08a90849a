#include "history.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>

History::History(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void History::drop_draft() {
  if (draft_ && !entries_.empty()) entries_.pop_back();
  draft_ = false;
}

// write-backs are only meant to last while recalling; once it ends, empty
// entries go and only the newest copy of each line stays
void History::compact() {
  std::deque<std::string> kept;
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (it->empty()) continue;
    if (std::find(kept.begin(), kept.end(), *it) != kept.end()) continue;
    kept.push_front(std::move(*it));
  }
  entries_.swap(kept);
}

void History::accept(const std::string& text) {
  drop_draft();
  std::string line = text;
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.pop_back();
  entries_.erase(std::remove(entries_.begin(), entries_.end(), line), entries_.end());
  compact();
  if (!line.empty()) entries_.push_back(std::move(line));
  while (entries_.size() > capacity_) entries_.pop_front();
  hindex_ = entries_.size();
  ML_LOG("history accept, %zu entries", entries_.size());
}

void History::reset() {
  drop_draft();
  compact();
  hindex_ = entries_.size();
}

void History::write_back(const std::string& current) {
  if (hindex_ < entries_.size()) {
    entries_[hindex_] = current;
    return;
  }
  entries_.push_back(current);
  draft_ = true;
}

std::optional<std::string> History::recall_previous(const std::string& current) {
  if (!can_recall_previous()) return std::nullopt;
  write_back(current);
  hindex_--;
  ML_LOG("recall previous -> %zu/%zu", hindex_, entries_.size());
  return entries_[hindex_];
}

std::optional<std::string> History::recall_next(const std::string& current) {
  if (!can_recall_next()) return std::nullopt;
  write_back(current);
  hindex_++;
  ML_LOG("recall next -> %zu/%zu", hindex_, entries_.size());
  return entries_[hindex_];
}
