#pragma once
/*
 * PathSuggestionSource
 *
 * Purpose: omnibox suggestions from recently opened locations plus the
 * entries of the directory the query points into.
 * Ranking: substring match weighted by position, falling back to an in-order
 * subsequence match; recent entries get a bonus.
 * Threading: query() runs on the background worker; add_recent() on the UI
 * loop. The recent list is guarded by a mutex.
 */
#include "omnibox.hpp"
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

// 0 when candidate does not match; higher is better. Case-insensitive.
int fuzzy_score(const std::string& pattern, const std::string& candidate);

class PathSuggestionSource : public SuggestionSource {
public:
  explicit PathSuggestionSource(std::filesystem::path base_dir, size_t max_recent = 50);

  std::vector<Suggestion> query(const std::string& text, size_t max_results) override;
  void add_recent(const std::string& uri);
  std::vector<std::string> recent() const;

private:
  void collect_directory(const std::string& text, std::vector<Suggestion>& out) const;

  std::filesystem::path base_dir_;
  size_t max_recent_;
  mutable std::mutex mu_;
  std::deque<std::string> recent_;
};
