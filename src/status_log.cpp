#include "status_log.hpp"

StatusLog::StatusLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void StatusLog::info(const std::string& msg) {
  current_ = msg;
  push(msg);
}

void StatusLog::error(const std::string& msg) {
  errors_++;
  current_ = "E: " + msg;
  push(current_);
}

void StatusLog::push(std::string line) {
  history_.push_back(std::move(line));
  while (history_.size() > capacity_) history_.pop_front();
}

std::vector<std::string> StatusLog::history() const {
  return std::vector<std::string>(history_.begin(), history_.end());
}
