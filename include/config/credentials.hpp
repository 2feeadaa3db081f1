#pragma once
#include <istream>
#include <string>
#include <vector>

// One signing key per line. Blank lines and lines starting with '#' or '//'
// are skipped; surrounding whitespace is trimmed.
std::vector<std::string> ParseCredentialLines(std::istream& in);
// Empty when the file cannot be opened or holds no usable line.
std::vector<std::string> LoadCredentials(const std::string& path);
