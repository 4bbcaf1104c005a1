#pragma once
/*
 * DocumentContent
 *
 * Purpose: the app's ContentFactory. A pane's uri names a file or directory;
 * files are read with mmap_readlines, directories listed, an empty uri shows
 * the welcome screen. Each pane gets one TermTextView, cached by pane id so a
 * layout rebuild reattaches the same view instead of reloading.
 * Find: every document exposes a FindController over its lines.
 */
#include "find_bar.hpp"
#include "status_log.hpp"
#include "term_widgets.hpp"
#include "workspace_view.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// case-insensitive when the pattern has no uppercase letter
void find_matches(const std::vector<std::string>& lines, const std::string& pattern,
                  std::vector<TermTextView::Highlight>& out);

class DocFindController : public FindController {
public:
  explicit DocFindController(std::shared_ptr<TermTextView> view) : view_(std::move(view)) {}
  void search(const std::string& text) override;
  void search_next() override;
  void search_previous() override;
  void finish() override;
  void set_result_callback(ResultFn fn) override { on_result_ = std::move(fn); }
  const std::string& pattern() const { return pattern_; }

private:
  void select(int index);
  std::weak_ptr<TermTextView> view_;
  std::string pattern_;
  std::vector<TermTextView::Highlight> hits_;
  int current_ = -1;
  ResultFn on_result_;
};

class DocumentContent : public ContentFactory {
public:
  DocumentContent(TermWidgetFactory& factory, StatusLog* log);

  WidgetPtr create_content(const Pane& pane) override;
  // re-reads the pane's uri into its existing view
  bool reload(const Pane& pane);
  void release(const std::string& pane_id);
  FindController* find_controller(const std::string& pane_id);
  std::shared_ptr<TermTextView> text_view(const std::string& pane_id) const;
  int document_count() const { return static_cast<int>(docs_.size()); }

  static std::vector<std::string> welcome_lines();
  static bool load_lines(const std::string& uri, std::vector<std::string>& out, std::string& msg);

private:
  struct Doc {
    std::string uri;
    std::shared_ptr<TermTextView> view;
    std::unique_ptr<DocFindController> find;
  };
  void fill(Doc& doc);

  TermWidgetFactory& factory_;
  StatusLog* log_;
  std::unordered_map<std::string, Doc> docs_;
};
