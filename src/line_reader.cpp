#include "line_reader.hpp"

#include <cstdlib>
#include <iostream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

std::optional<std::string> ConsoleLineReader::read_line(const std::string& prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt.c_str());
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  if(!line.empty() && line.back() == '\r') line.pop_back();
  return line;
#endif
}
