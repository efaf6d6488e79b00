#include <version/version.h>
#include <algorithm>
#include <sstream>

namespace version {

void t::print(std::ostream &os) const {
  bool dot = false;
  for (int b : branch) {
    if (dot)os << '.';
    dot = true;
    os << b;
  }
  for (const std::string &tag : tags)os << '-' << tag;
}

std::string t::to_string() const {
  std::stringstream ss;
  print(ss);
  return ss.str();
}

bool t::operator==(const t &o) const {
  if (branch != o.branch)return false;
  if (tags.size() != o.tags.size())return false;
  std::vector<std::string> a = tags, b = o.tags;
  std::sort(a.begin(), a.end());
  std::sort(b.begin(), b.end());
  return a == b;
}

std::ostream &operator<<(std::ostream &os, const t &v) {
  v.print(os);
  return os;
}

}
