#include "document_content.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

static std::vector<int> kmp_build(const std::string& pat) {
  std::vector<int> pi(pat.size(), 0);
  for (size_t i = 1, j = 0; i < pat.size(); ++i) {
    while (j > 0 && pat[i] != pat[j]) j = pi[j - 1];
    if (pat[i] == pat[j]) ++j;
    pi[i] = (int)j;
  }
  return pi;
}

// non-overlapping matches, left to right
static void kmp_find_all(const std::string& s, const std::string& pat, const std::vector<int>& pi, std::vector<int>& out) {
  out.clear();
  if (pat.empty()) return;
  size_t j = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) { out.push_back((int)(i + 1 - pat.size())); j = 0; }
  }
}

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

void find_matches(const std::vector<std::string>& lines, const std::string& pattern,
                  std::vector<TermTextView::Highlight>& out) {
  out.clear();
  if (pattern.empty()) return;
  bool fold = std::none_of(pattern.begin(), pattern.end(), [](unsigned char c){ return std::isupper(c) != 0; });
  std::string pat = fold ? to_lower(pattern) : pattern;
  auto pi = kmp_build(pat);
  std::vector<int> pos;
  for (int r = 0; r < static_cast<int>(lines.size()); ++r) {
    kmp_find_all(fold ? to_lower(lines[r]) : lines[r], pat, pi, pos);
    for (int p : pos) out.push_back({r, p, static_cast<int>(pat.size())});
  }
}

void DocFindController::search(const std::string& text) {
  pattern_ = text;
  hits_.clear();
  current_ = -1;
  auto view = view_.lock();
  if (view && !text.empty()) find_matches(view->lines(), text, hits_);
  if (hits_.empty()) {
    if (view) view->clear_highlights();
    if (on_result_) on_result_(0, 0);
    return;
  }
  // first match at or below the top of the view
  int first = 0;
  if (view) {
    for (int i = 0; i < static_cast<int>(hits_.size()); ++i) {
      if (hits_[i].row >= view->top_line()) { first = i; break; }
    }
  }
  select(first);
}

void DocFindController::search_next() {
  if (hits_.empty()) { if (on_result_) on_result_(0, 0); return; }
  select((current_ + 1) % static_cast<int>(hits_.size()));
}

void DocFindController::search_previous() {
  if (hits_.empty()) { if (on_result_) on_result_(0, 0); return; }
  int n = static_cast<int>(hits_.size());
  select((current_ - 1 + n) % n);
}

void DocFindController::finish() {
  hits_.clear();
  current_ = -1;
  pattern_.clear();
  if (auto view = view_.lock()) view->clear_highlights();
}

void DocFindController::select(int index) {
  current_ = index;
  if (auto view = view_.lock()) view->set_highlights(hits_, current_);
  if (on_result_) on_result_(current_ + 1, static_cast<int>(hits_.size()));
}

DocumentContent::DocumentContent(TermWidgetFactory& factory, StatusLog* log)
  : factory_(factory), log_(log) {}

std::vector<std::string> DocumentContent::welcome_lines() {
  return {
    "",
    "MM   MM  TTTTTTT  III  L       EEEEE",
    "M M M M     T      I   L       E",
    "M  M  M     T      I   L       EEE",
    "M     M     T      I   L       E",
    "M     M     T     III  LLLLLL  EEEEE",
    "",
    "Ctrl-W v/s split   Ctrl-W t stack   Ctrl-W hjkl focus",
    "o open   / find   :q quit",
  };
}

bool DocumentContent::load_lines(const std::string& uri, std::vector<std::string>& out, std::string& msg) {
  out.clear();
  if (uri.empty()) { out = welcome_lines(); return true; }
  std::filesystem::path p(uri);
  std::error_code ec;
  if (std::filesystem::is_directory(p, ec)) {
    std::vector<std::string> entries;
    if (!list_directory(p, entries, msg)) return false;
    out.push_back(p.string() + ":");
    for (auto& e : entries) out.push_back("  " + e);
    return true;
  }
  return mmap_readlines(p, out, msg);
}

void DocumentContent::fill(Doc& doc) {
  std::vector<std::string> lines;
  std::string msg;
  if (!load_lines(doc.uri, lines, msg)) {
    if (log_) log_->error(doc.uri + ": " + msg);
    lines = {"[" + msg + "] " + doc.uri};
  }
  doc.view->set_lines(std::move(lines));
}

WidgetPtr DocumentContent::create_content(const Pane& pane) {
  auto it = docs_.find(pane.id);
  if (it != docs_.end()) {
    if (it->second.uri != pane.uri) {
      it->second.uri = pane.uri;
      it->second.find->finish();
      fill(it->second);
    }
    return it->second.view;
  }
  Doc doc;
  doc.uri = pane.uri;
  doc.view = factory_.new_text_view();
  doc.find = std::make_unique<DocFindController>(doc.view);
  fill(doc);
  WidgetPtr w = doc.view;
  docs_.emplace(pane.id, std::move(doc));
  return w;
}

bool DocumentContent::reload(const Pane& pane) {
  auto it = docs_.find(pane.id);
  if (it == docs_.end()) return false;
  it->second.uri = pane.uri;
  it->second.find->finish();
  fill(it->second);
  return true;
}

void DocumentContent::release(const std::string& pane_id) {
  auto it = docs_.find(pane_id);
  if (it == docs_.end()) return;
  WidgetPtr w = it->second.view;
  if (w->parent()) w->unparent();
  docs_.erase(it);
}

FindController* DocumentContent::find_controller(const std::string& pane_id) {
  auto it = docs_.find(pane_id);
  return it == docs_.end() ? nullptr : it->second.find.get();
}

std::shared_ptr<TermTextView> DocumentContent::text_view(const std::string& pane_id) const {
  auto it = docs_.find(pane_id);
  return it == docs_.end() ? nullptr : it->second.view;
}
