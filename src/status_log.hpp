#pragma once
/*
 * StatusLog
 *
 * Purpose: the status-line message plus a bounded history (:messages).
 * Usage: components report best-effort failures here instead of aborting.
 */
#include <deque>
#include <string>
#include <vector>

class StatusLog {
public:
  explicit StatusLog(size_t capacity = 100);
  void info(const std::string& msg);
  void error(const std::string& msg);
  const std::string& current() const { return current_; }
  void clear_current() { current_.clear(); }
  std::vector<std::string> history() const;
  size_t size() const { return history_.size(); }
  size_t error_count() const { return errors_; }
private:
  void push(std::string line);
  size_t capacity_;
  std::string current_;
  std::deque<std::string> history_;
  size_t errors_ = 0;
};
