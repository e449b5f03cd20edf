#include "utils.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace Utils {

std::vector<std::string_view> split_string_view(std::string_view str,
                                                char delimiter) {
  std::vector<std::string_view> result;
  size_t start = 0;
  size_t end = str.find(delimiter);
  while (end != std::string_view::npos) {
    result.push_back(str.substr(start, end - start));
    start = end + 1;
    end = str.find(delimiter, start);
  }
  result.push_back(str.substr(start));
  return result;
}

std::vector<std::string> split_list(const std::string &text, char delimiter) {
  std::vector<std::string> items;
  for (auto token : split_string_view(text, delimiter)) {
    std::string item = trim_copy(token);
    if (!item.empty())
      items.push_back(std::move(item));
  }
  return items;
}

std::optional<std::string> read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    return std::nullopt;

  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

bool write_file(const std::string &path, const std::string &contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    return false;

  out << contents;
  return static_cast<bool>(out);
}

} // namespace Utils
