#include "find_bar.hpp"

FindBar::FindBar(WidgetFactory& factory, Scheduler& sched, std::chrono::milliseconds debounce)
  : root_(factory.new_box(Orientation::Horizontal, 1)),
    entry_(factory.new_label("/")), counter_(factory.new_label("")),
    debounce_(sched, debounce) {
  root_->add_css_class("find-bar");
  root_->set_halign(Align::End);
  root_->set_valign(Align::End);
  root_->set_size_request(40, 1);
  entry_->set_hexpand(true);
  entry_->set_xalign(0.0f);
  entry_->set_ellipsize(Ellipsize::Start);
  entry_->add_css_class("active");
  counter_->add_css_class("active");
  root_->append(entry_);
  root_->append(counter_);
  root_->set_visible(false);
}

FindBar::~FindBar() { unbind(); }

void FindBar::bind(FindController* controller) {
  if (controller == controller_) return;
  unbind();
  controller_ = controller;
  if (controller_) controller_->set_result_callback([this](int c, int t){ on_result(c, t); });
}

void FindBar::unbind() {
  debounce_.cancel();
  if (controller_) controller_->set_result_callback(nullptr);
  controller_ = nullptr;
  searched_.clear();
  current_ = 0;
  total_ = 0;
}

void FindBar::show() {
  visible_ = true;
  root_->set_visible(true);
  refresh();
  if (!query_.empty()) schedule_search();
}

void FindBar::hide() {
  if (!visible_) return;
  visible_ = false;
  debounce_.cancel();
  if (controller_) controller_->finish();
  unbind();
  root_->set_visible(false);
}

void FindBar::set_query(const std::string& query) {
  if (query == query_) return;
  query_ = query;
  schedule_search();
  refresh();
}

void FindBar::append_char(char c) {
  query_.push_back(c);
  schedule_search();
  refresh();
}

void FindBar::backspace() {
  if (query_.empty()) return;
  query_.pop_back();
  schedule_search();
  refresh();
}

void FindBar::schedule_search() {
  debounce_.schedule([this]{ run_search(); });
}

void FindBar::run_search() {
  if (!controller_) return;
  searched_ = query_;
  if (query_.empty()) {
    controller_->finish();
    on_result(0, 0);
    return;
  }
  controller_->search(query_);
}

void FindBar::next() {
  if (!controller_ || query_.empty()) return;
  if (debounce_.pending() || total_ == 0 || searched_ != query_) {
    debounce_.cancel();
    run_search();
    return;
  }
  controller_->search_next();
}

void FindBar::previous() {
  if (!controller_ || query_.empty()) return;
  if (debounce_.pending() || total_ == 0 || searched_ != query_) {
    debounce_.cancel();
    run_search();
    return;
  }
  controller_->search_previous();
}

void FindBar::on_result(int current, int total) {
  current_ = current;
  total_ = total;
  refresh();
}

std::string FindBar::counter_text() const {
  if (query_.empty()) return std::string();
  return std::to_string(current_) + "/" + std::to_string(total_);
}

void FindBar::refresh() {
  entry_->set_text("/" + query_);
  counter_->set_text(counter_text());
}
