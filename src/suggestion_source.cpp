#include "suggestion_source.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>

static std::string lower(const std::string& s) {
  std::string r = s;
  for (char& c : r) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return r;
}

int fuzzy_score(const std::string& pattern, const std::string& candidate) {
  if (pattern.empty()) return 1;
  if (candidate.empty()) return 0;
  std::string p = lower(pattern), c = lower(candidate);
  size_t at = c.find(p);
  if (at != std::string::npos) {
    int base = static_cast<int>(1000 * p.size() / c.size());
    if (at == 0) return 1000 + base * 3 / 2;
    // match right after a separator counts almost like a prefix
    char before = c[at - 1];
    if (before == '/' || before == '.' || before == '-' || before == '_' || before == ' ') return 700 + base;
    if (at < c.size() / 3) return 500 + base * 6 / 5;
    return 500 + base;
  }
  // subsequence: every pattern char in order; gaps cost
  size_t j = 0;
  int gaps = 0;
  size_t last = 0;
  for (size_t i = 0; i < c.size() && j < p.size(); ++i) {
    if (c[i] == p[j]) {
      if (j > 0 && i > last + 1) gaps++;
      last = i;
      j++;
    }
  }
  if (j < p.size()) return 0;
  return std::max(1, 300 - 20 * gaps - static_cast<int>(c.size() - p.size()));
}

PathSuggestionSource::PathSuggestionSource(std::filesystem::path base_dir, size_t max_recent)
  : base_dir_(std::move(base_dir)), max_recent_(max_recent) {}

void PathSuggestionSource::add_recent(const std::string& uri) {
  if (uri.empty()) return;
  std::lock_guard<std::mutex> lk(mu_);
  recent_.erase(std::remove(recent_.begin(), recent_.end(), uri), recent_.end());
  recent_.push_front(uri);
  while (recent_.size() > max_recent_) recent_.pop_back();
}

std::vector<std::string> PathSuggestionSource::recent() const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::vector<std::string>(recent_.begin(), recent_.end());
}

void PathSuggestionSource::collect_directory(const std::string& text, std::vector<Suggestion>& out) const {
  // "src/wi" lists src/ and matches "wi"; "wi" lists the base directory
  std::filesystem::path dir = base_dir_;
  std::string prefix;
  std::string needle = text;
  size_t slash = text.rfind('/');
  if (slash != std::string::npos) {
    prefix = text.substr(0, slash + 1);
    needle = text.substr(slash + 1);
    std::filesystem::path p(prefix);
    dir = p.is_absolute() ? p : base_dir_ / p;
  }
  std::vector<std::string> entries;
  std::string msg;
  if (!list_directory(dir, entries, msg)) return;
  for (const auto& e : entries) {
    int score = fuzzy_score(needle, e);
    if (score <= 0) continue;
    out.push_back(Suggestion{e, prefix + e, score});
  }
}

std::vector<Suggestion> PathSuggestionSource::query(const std::string& text, size_t max_results) {
  std::vector<Suggestion> out;
  for (const auto& r : recent()) {
    int score = fuzzy_score(text, r);
    if (score > 0) out.push_back(Suggestion{r, r, score + 200});
  }
  collect_directory(text, out);
  std::stable_sort(out.begin(), out.end(), [](const Suggestion& a, const Suggestion& b){ return a.score > b.score; });
  // a recent entry wins over the same path found in the listing
  std::vector<Suggestion> unique;
  for (auto& s : out) {
    bool dup = std::any_of(unique.begin(), unique.end(), [&](const Suggestion& u){ return u.uri == s.uri; });
    if (!dup) unique.push_back(std::move(s));
    if (unique.size() >= max_results) break;
  }
  return unique;
}
