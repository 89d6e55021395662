#ifndef STRINGUTILS_H
#define STRINGUTILS_H

#include <string>
#include <vector>

namespace stringutils
{
  // Split on any run of blanks (space, tab, CR, LF...)
  std::vector<std::string> split_whitespace(const std::string& s);
  std::string join(const std::vector<std::string>& v, const std::string& delim);
  std::string trim_whitespace(const std::string& s);
  std::string lower(const std::string& s);
  bool ends_with(const std::string& s, const std::string& suffix);
  void splitPath(const std::string& path, std::string& dirname, std::string& filename);
}

#endif
