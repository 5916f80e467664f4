#pragma once
/**
 * @file fakes.hpp
 * @brief Host-side stand-ins for the serial transport and the wall clock.
 */

#include <chrono>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "clock.hpp"
#include "line_source.hpp"

/**
 * @brief Hands out a fixed list of lines, then reports "nothing ready" forever.
 *
 * A line pushed with `silent_polls` > 0 only shows up after that many empty polls.
 */
class ScriptedLineSource : public LineSource {
 public:
  ScriptedLineSource() = default;
  explicit ScriptedLineSource(const std::vector<std::string>& lines) {
    for (const auto& l : lines) Push(l);
  }

  void Push(const std::string& line, int silent_polls = 0) {
    lines_.push_back({silent_polls, line});
  }

  std::optional<std::string> poll_line() override {
    polls_++;
    if (lines_.empty()) return std::nullopt;
    if (lines_.front().first > 0) {
      lines_.front().first--;
      return std::nullopt;
    }
    std::string l = lines_.front().second;
    lines_.pop_front();
    return l;
  }

  size_t remaining() const { return lines_.size(); }
  size_t polls() const { return polls_; }

 private:
  std::deque<std::pair<int, std::string>> lines_;
  size_t polls_ = 0;
};

/**
 * @brief Manual clock: time only moves when the code under test sleeps.
 */
class FakeClock : public Clock {
 public:
  time_point now() override { return now_; }
  void sleep_for(duration d) override {
    now_ += d;
    slept_ += d;
  }

  void Advance(duration d) { now_ += d; }
  duration slept() const { return slept_; }

 private:
  time_point now_{};
  duration slept_{};
};
