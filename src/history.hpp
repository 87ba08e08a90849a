#pragma once
/*
 * History
 *
 * Purpose: bounded, deduplicated list of accepted lines with a recall cursor.
 * Index: hindex in [0, size()]; hindex == size() means a fresh line is being edited.
 * Recall: the live buffer is written back into the current slot before moving, so edits
 *         made to a recalled line survive navigation. A fresh line is parked as a draft
 *         slot at the end and dropped again on accept()/reset(). Leaving recall also
 *         collapses write-backs that emptied a slot or copied another entry.
 */
#include <deque>
#include <string>
#include <optional>
#include "config.hpp"

class History {
public:
  explicit History(size_t capacity = ML_HISTORY_CAPACITY);

  void accept(const std::string& text);
  // leave recall without recording anything
  void reset();

  bool can_recall_previous() const { return hindex_ > 0; }
  bool can_recall_next() const { return hindex_ + 1 < entries_.size(); }
  // both return the entry to restore, or nullopt when navigation is not possible
  std::optional<std::string> recall_previous(const std::string& current);
  std::optional<std::string> recall_next(const std::string& current);

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  size_t capacity() const { return capacity_; }
  size_t index() const { return hindex_; }
  bool recalling() const { return hindex_ < entries_.size(); }
  const std::string& at(size_t i) const { return entries_[i]; }
  const std::deque<std::string>& entries() const { return entries_; }

private:
  void write_back(const std::string& current);
  void drop_draft();
  void compact();
  std::deque<std::string> entries_;
  size_t capacity_;
  size_t hindex_ = 0;
  bool draft_ = false;
};
