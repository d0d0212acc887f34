#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

class InvalidSelection : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct SelectionToken {
  enum class Kind { Index, Range, ParentNav, ConfirmCurrent };

  Kind kind = Kind::Index;
  std::size_t lo = 0;   // 1-based; equals hi for Index
  std::size_t hi = 0;
};

struct Selection {
  enum class Kind { Indices, ParentNav, ConfirmCurrent };

  Kind kind = Kind::Indices;
  std::vector<std::size_t> indices;   // 1-based, first-appearance order, no repeats
};

// Splits "1,3-5" / ".." / "." / "d" into tokens without looking at the entry
// count. Throws InvalidSelection on malformed input.
std::vector<SelectionToken> tokenize_selection(const std::string& input);

// Resolves input against n entries. All-or-nothing: any out of range index
// rejects the whole input.
Selection parse_selection(const std::string& input, std::size_t n);
