#pragma once

#include <memory>
#include <string>
#include <vector>

#include "line_reader.hpp"
#include "listing_provider.hpp"
#include "log.hpp"

enum class NavigationMode {
  SinglePath,    // the result is one directory
  MultiSelect    // the result is the current directory or a set of entries in it
};

struct NavigationResult {
  enum class State { Browsing, Confirmed, Aborted };

  State state = State::Aborted;
  std::string path;               // directory being shown when the user confirmed
  std::vector<Entry> selection;   // entries picked in multi-select, empty for '.'

  bool confirmed() const { return state == State::Confirmed; }

  // Selected entry paths, or the confirmed directory itself.
  std::vector<std::string> paths() const;
};

// Interactive directory browser over a ListingProvider. run() drives the whole
// loop through the LineReader; begin()/step() expose it one input at a time.
class Navigator {
public:
  using State = NavigationResult::State;

  Navigator(ListingProvider& provider,
            LineReader& reader,
            std::shared_ptr<Logger> logger,
            NavigationMode mode = NavigationMode::SinglePath);

  NavigationResult run(const std::string& start);

  // Lists start. Aborts (and returns false) when that first listing fails.
  bool begin(const std::string& start);
  State step(const std::string& input);

  State state() const { return state_; }
  const std::string& current_path() const { return current_; }
  const std::vector<Entry>& entries() const { return entries_; }
  NavigationResult result() const;

  void display() const;

private:
  bool change_to(const std::string& path);
  void select(const std::vector<std::size_t>& indices);

  ListingProvider& provider_;
  LineReader& reader_;
  std::shared_ptr<Logger> logger_;
  NavigationMode mode_;

  State state_ = State::Browsing;
  std::string current_;
  std::vector<Entry> entries_;
  std::vector<Entry> selection_;
};
