#ifndef PATCHSET_STR_UTIL_HH
#define PATCHSET_STR_UTIL_HH

#include <cctype>
#include <sstream>
#include <string>
#include <vector>

namespace patchset {

using std::string;
using std::vector;

inline vector<string> split(const string& s, char delim) {
  vector<string> elems;
  std::stringstream stream;
  stream.str(s);
  string elem_buf;
  while (std::getline(stream, elem_buf, delim)) {
    elems.push_back(elem_buf);
  }
  return elems;
}

inline string to_lower(string s) {
  for (size_t i = 0; i < s.size(); ++i) {
    s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
  }
  return s;
}

inline string join_path(const string& dir, const string& name) {
  if (dir.empty()) {
    return name;
  }
  if ('/' == dir.back()) {
    return dir + name;
  }
  return dir + "/" + name;
}

inline string base_name(const string& path) {
  size_t slash = path.find_last_of('/');
  if (string::npos == slash) {
    return path;
  }
  return path.substr(slash + 1);
}

// Wraps `s` in single quotes for /bin/sh.
inline string shell_quote(const string& s) {
  string quoted = "'";
  for (size_t i = 0; i < s.size(); ++i) {
    if ('\'' == s[i]) {
      quoted += "'\\''";
    } else {
      quoted += s[i];
    }
  }
  quoted += "'";
  return quoted;
}

} // namespace patchset

#endif
