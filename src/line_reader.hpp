#pragma once

#include <optional>
#include <string>

class LineReader {
public:
  virtual ~LineReader() = default;

  // std::nullopt on end of input.
  virtual std::optional<std::string> read_line(const std::string& prompt) = 0;
};

// readline with history when built with HAVE_READLINE, std::getline otherwise.
class ConsoleLineReader : public LineReader {
public:
  std::optional<std::string> read_line(const std::string& prompt) override;
};
