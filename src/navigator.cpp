#include "navigator.hpp"

#include <algorithm>

#include "selection_parser.hpp"
#include "settings_manager.hpp"

std::vector<std::string> NavigationResult::paths() const {
  std::vector<std::string> out;
  if(selection.empty()) {
    if(!path.empty()) out.push_back(path);
    return out;
  }
  out.reserve(selection.size());
  for(const auto& entry : selection) {
    out.push_back(entry.path);
  }
  return out;
}

Navigator::Navigator(ListingProvider& provider,
                     LineReader& reader,
                     std::shared_ptr<Logger> logger,
                     NavigationMode mode)
  : provider_(provider),
    reader_(reader),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("navigator")),
    mode_(mode) {}

bool Navigator::change_to(const std::string& path) {
  std::vector<Entry> listed;
  try {
    listed = provider_.list(path);
  } catch(const ListingError& e) {
    logger_->print_err("Unable to list {}: {}", path, e.what());
    return false;
  }
  std::stable_partition(listed.begin(), listed.end(),
                        [](const Entry& entry) { return entry.is_directory(); });
  current_ = path;
  entries_ = std::move(listed);
  return true;
}

bool Navigator::begin(const std::string& start) {
  state_ = State::Browsing;
  selection_.clear();
  current_.clear();
  entries_.clear();
  if(!change_to(start)) {
    state_ = State::Aborted;
    return false;
  }
  return true;
}

NavigationResult Navigator::run(const std::string& start) {
  if(!begin(start)) return result();
  while(state_ == State::Browsing) {
    display();
    auto line = reader_.read_line("> ");
    if(!line) {
      state_ = State::Aborted;
      break;
    }
    step(*line);
  }
  return result();
}

Navigator::State Navigator::step(const std::string& input) {
  if(state_ != State::Browsing) return state_;

  const std::string command = SettingsManager::trim_copy(input);
  if(command.empty() || command == "q" || command == "Q") {
    state_ = State::Aborted;
    return state_;
  }

  Selection selection;
  try {
    selection = parse_selection(command, entries_.size());
  } catch(const InvalidSelection& e) {
    logger_->print_err("{}", e.what());
    return state_;
  }

  switch(selection.kind) {
    case Selection::Kind::ParentNav:
      if(provider_.is_root(current_)) {
        logger_->warn("Already at the top of {}", provider_.backend().display_name());
      } else {
        change_to(provider_.parent(current_));
      }
      break;
    case Selection::Kind::ConfirmCurrent:
      selection_.clear();
      state_ = State::Confirmed;
      break;
    case Selection::Kind::Indices:
      select(selection.indices);
      break;
  }
  return state_;
}

void Navigator::select(const std::vector<std::size_t>& indices) {
  if(indices.size() == 1 && entries_[indices.front() - 1].is_directory()) {
    change_to(entries_[indices.front() - 1].path);
    return;
  }
  if(mode_ == NavigationMode::SinglePath) {
    logger_->print_err("Pick a single directory, or '.' to use {}", current_);
    return;
  }
  selection_.clear();
  for(auto index : indices) {
    selection_.push_back(entries_[index - 1]);
  }
  state_ = State::Confirmed;
}

NavigationResult Navigator::result() const {
  NavigationResult out;
  out.state = state_;
  if(state_ == State::Confirmed) {
    out.path = current_;
    out.selection = selection_;
  }
  return out;
}

void Navigator::display() const {
  logger_->print("");
  logger_->print("[{}] {}", provider_.backend().display_name(), current_);
  if(entries_.empty()) {
    logger_->print("  (empty)");
  }
  for(std::size_t i = 0; i < entries_.size(); ++i) {
    const auto& entry = entries_[i];
    logger_->print("  {:>3}. {}{}", i + 1, entry.name, entry.is_directory() ? "/" : "");
  }
  if(mode_ == NavigationMode::MultiSelect) {
    logger_->print("Enter numbers or ranges (1,3-5) to select, a directory number to open it,");
    logger_->print("'..' to go up, '.' to select this directory, 'q' to cancel.");
  } else {
    logger_->print("Enter a directory number to open it, '..' to go up,");
    logger_->print("'.' to choose this directory, 'q' to cancel.");
  }
}
