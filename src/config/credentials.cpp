#include "config/credentials.hpp"
#include <cctype>
#include <fstream>

std::vector<std::string> ParseCredentialLines(std::istream& in) {
  std::vector<std::string> keys;
  std::string line;
  while (std::getline(in, line)) {
    size_t start = 0, end = line.size();
    while (start < end && std::isspace(static_cast<unsigned char>(line[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(line[end - 1]))) --end;
    std::string key = line.substr(start, end - start);
    if (key.empty() || key[0] == '#' || key.rfind("//", 0) == 0) continue;
    keys.push_back(key);
  }
  return keys;
}

std::vector<std::string> LoadCredentials(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) return {};
  return ParseCredentialLines(file);
}
