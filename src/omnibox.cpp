#include "omnibox.hpp"

bool looks_like_location(const std::string& text) {
  if (text.empty()) return false;
  if (text.find("://") != std::string::npos) return true;
  char c = text[0];
  return c == '/' || c == '~' || c == '.' || text.find('/') != std::string::npos;
}

Omnibox::Omnibox(WidgetFactory& factory, Scheduler& sched, BackgroundWorker& worker,
                 std::shared_ptr<SuggestionSource> source, OmniboxOptions opts)
  : factory_(factory), sched_(sched), worker_(worker), source_(std::move(source)), opts_(opts),
    root_(factory.new_box(Orientation::Vertical, 0)),
    entry_row_(factory.new_box(Orientation::Horizontal, 1)),
    entry_(factory.new_label("> ")), spinner_(factory.new_spinner()),
    list_(factory.new_box(Orientation::Vertical, 0)),
    debounce_(sched, opts.debounce) {
  root_->add_css_class("omnibox");
  root_->set_halign(Align::Center);
  root_->set_valign(Align::Start);
  root_->set_size_request(opts_.width, -1);
  entry_->set_hexpand(true);
  entry_->set_xalign(0.0f);
  entry_->set_ellipsize(Ellipsize::Start);
  entry_->add_css_class("active");
  spinner_->set_visible(false);
  entry_row_->append(entry_);
  entry_row_->append(spinner_);
  root_->append(entry_row_);
  root_->append(list_);
  root_->set_visible(false);
}

Omnibox::~Omnibox() { debounce_.cancel(); }

void Omnibox::show(const std::string& query) {
  if (visible_) {
    if (query != query_) set_query(query);
    return;
  }
  visible_ = true;
  version_.bump();
  last_searched_.clear();
  query_ = query;
  selected_ = -1;
  results_.clear();
  rebuild_list();
  refresh_entry();
  root_->set_visible(true);
  if (!query_.empty()) debounce_.schedule([this]{ start_search(); });
}

void Omnibox::hide() {
  if (!visible_) return;
  visible_ = false;
  version_.bump();
  debounce_.cancel();
  searching_ = false;
  spinner_->stop();
  spinner_->set_visible(false);
  last_searched_.clear();
  root_->set_visible(false);
}

void Omnibox::toggle() {
  if (visible_) hide(); else show(query_);
}

void Omnibox::set_query(const std::string& query) {
  if (query == query_) return;
  query_ = query;
  query_changed();
}

void Omnibox::append_char(char c) {
  query_.push_back(c);
  query_changed();
}

void Omnibox::backspace() {
  if (query_.empty()) return;
  query_.pop_back();
  query_changed();
}

void Omnibox::query_changed() {
  version_.bump();
  selected_ = -1;
  refresh_entry();
  if (query_.empty()) {
    debounce_.cancel();
    results_.clear();
    last_searched_.clear();
    searching_ = false;
    spinner_->stop();
    spinner_->set_visible(false);
    rebuild_list();
    return;
  }
  debounce_.schedule([this]{ start_search(); });
}

void Omnibox::start_search() {
  if (!visible_ || !source_ || query_.empty()) return;
  if (query_ == last_searched_) return;
  last_searched_ = query_;
  searching_ = true;
  spinner_->set_visible(true);
  spinner_->start();
  StateVersion::Token token = version_.current();
  std::weak_ptr<Omnibox> weak = weak_from_this();
  auto source = source_;
  Scheduler* sched = &sched_;
  std::string q = query_;
  size_t max = opts_.max_results;
  worker_.submit([weak, source, sched, q, max, token]{
    auto results = source->query(q, max);
    sched->post([weak, q, token, results = std::move(results)]() mutable {
      if (auto self = weak.lock()) self->apply_results(token, q, std::move(results));
    });
  });
}

void Omnibox::apply_results(StateVersion::Token token, const std::string& query,
                            std::vector<Suggestion> results) {
  if (!version_.is_current(token) || query != query_) return;
  searching_ = false;
  spinner_->stop();
  spinner_->set_visible(false);
  results_ = std::move(results);
  if (results_.size() > opts_.max_results) results_.resize(opts_.max_results);
  selected_ = -1;
  rebuild_list();
}

void Omnibox::select_next() {
  if (results_.empty()) return;
  int n = static_cast<int>(results_.size());
  selected_ = (selected_ + 1) % n;
  rebuild_list();
}

void Omnibox::select_previous() {
  if (results_.empty()) return;
  int n = static_cast<int>(results_.size());
  selected_ = selected_ <= 0 ? n - 1 : selected_ - 1;
  rebuild_list();
}

bool Omnibox::activate() {
  std::string target;
  if (selected_ >= 0 && selected_ < static_cast<int>(results_.size()) && !looks_like_location(query_)) {
    target = results_[selected_].uri;
  } else {
    target = query_;
  }
  if (target.empty()) return false;
  NavigateFn fn = on_navigate_;
  hide();
  if (fn) fn(target);
  return true;
}

void Omnibox::refresh_entry() { entry_->set_text("> " + query_); }

void Omnibox::rebuild_list() {
  list_->remove_all();
  for (int i = 0; i < static_cast<int>(results_.size()); ++i) {
    const auto& s = results_[i];
    auto row = factory_.new_label(s.title.empty() ? s.uri : s.title + "  " + s.uri);
    row->set_xalign(0.0f);
    row->set_ellipsize(Ellipsize::Middle);
    if (i == selected_) row->add_css_class("selected");
    list_->append(row);
  }
}
