#include "stringutils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace stringutils
{
  std::vector<std::string> split_whitespace(const std::string& s)
  {
    std::vector<std::string> elems;
    std::istringstream ss(s);
    std::string item;
    while (ss >> item) {
      elems.push_back(item);
    }
    return elems;
  }

  std::string join(const std::vector<std::string>& v, const std::string& delim)
  {
    std::string result;
    for (size_t i = 0; i < v.size(); i++) {
      if (i > 0) result += delim;
      result += v[i];
    }
    return result;
  }

  std::string trim_whitespace(const std::string& s)
  {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
  }

  std::string lower(const std::string& s)
  {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
  }

  bool ends_with(const std::string& s, const std::string& suffix)
  {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  void splitPath(const std::string& path, std::string& dirname, std::string& filename)
  {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
      dirname = "";
      filename = path;
    } else {
      dirname = path.substr(0, pos);
      filename = path.substr(pos + 1);
    }
  }
}
