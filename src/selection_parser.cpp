#include "selection_parser.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_set>

#include "settings_manager.hpp"

namespace {

std::size_t parse_index(const std::string& text, const std::string& token) {
  if(text.empty()) {
    throw InvalidSelection("Invalid selection '" + token + "'");
  }
  std::size_t value = 0;
  for(char c : text) {
    if(!std::isdigit(static_cast<unsigned char>(c))) {
      throw InvalidSelection("Invalid selection '" + token + "'");
    }
    const std::size_t digit = static_cast<std::size_t>(c - '0');
    if(value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
      throw InvalidSelection("Selection '" + token + "' is out of range");
    }
    value = value * 10 + digit;
  }
  if(value == 0) {
    throw InvalidSelection("Selection numbers start at 1");
  }
  return value;
}

std::vector<std::string> split_tokens(const std::string& input) {
  std::vector<std::string> parts;
  std::string current;
  for(char c : input) {
    if(c == ',') {
      parts.push_back(SettingsManager::trim_copy(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(SettingsManager::trim_copy(current));
  return parts;
}

} // namespace

std::vector<SelectionToken> tokenize_selection(const std::string& input) {
  if(SettingsManager::trim_copy(input).empty()) {
    throw InvalidSelection("Empty selection");
  }

  std::vector<SelectionToken> tokens;
  for(const auto& part : split_tokens(input)) {
    if(part.empty()) {
      throw InvalidSelection("Empty entry in selection '" + input + "'");
    }
    SelectionToken token;
    if(part == "..") {
      token.kind = SelectionToken::Kind::ParentNav;
    } else if(part == "." || part == "d" || part == "D") {
      token.kind = SelectionToken::Kind::ConfirmCurrent;
    } else {
      auto dash = part.find('-');
      if(dash == std::string::npos) {
        token.kind = SelectionToken::Kind::Index;
        token.lo = token.hi = parse_index(part, part);
      } else {
        token.kind = SelectionToken::Kind::Range;
        token.lo = parse_index(SettingsManager::trim_copy(part.substr(0, dash)), part);
        token.hi = parse_index(SettingsManager::trim_copy(part.substr(dash + 1)), part);
        if(token.lo > token.hi) {
          throw InvalidSelection("Range '" + part + "' runs backwards");
        }
      }
    }
    tokens.push_back(token);
  }

  if(tokens.size() > 1) {
    for(const auto& token : tokens) {
      if(token.kind == SelectionToken::Kind::ParentNav ||
         token.kind == SelectionToken::Kind::ConfirmCurrent) {
        throw InvalidSelection("'..', '.' and 'd' must be used on their own");
      }
    }
  }
  return tokens;
}

Selection parse_selection(const std::string& input, std::size_t n) {
  auto tokens = tokenize_selection(input);

  Selection selection;
  if(tokens.front().kind == SelectionToken::Kind::ParentNav) {
    selection.kind = Selection::Kind::ParentNav;
    return selection;
  }
  if(tokens.front().kind == SelectionToken::Kind::ConfirmCurrent) {
    selection.kind = Selection::Kind::ConfirmCurrent;
    return selection;
  }

  // validate everything before expanding so a bad token leaves no partial result
  for(const auto& token : tokens) {
    if(token.hi > n) {
      throw InvalidSelection("Selection " + std::to_string(token.hi) +
                             " is out of range (1-" + std::to_string(n) + ")");
    }
  }

  std::unordered_set<std::size_t> seen;
  for(const auto& token : tokens) {
    for(std::size_t i = token.lo; i <= token.hi; ++i) {
      if(seen.insert(i).second) selection.indices.push_back(i);
    }
  }
  return selection;
}
