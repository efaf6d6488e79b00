#ifndef STACKLESS_TRAMP_LIB_VERSION_VERSION_H_
#define STACKLESS_TRAMP_LIB_VERSION_VERSION_H_

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace version {

// Version of a piece of software. Two versions are equal if they have the same branch components, in the same order,
// and the same tags in any order.
struct t {
  std::vector<int> branch;
  std::vector<std::string> tags;
  t(std::vector<int> branch, std::vector<std::string> tags = {}) : branch(std::move(branch)), tags(std::move(tags)) {}
  void print(std::ostream &os) const;
  std::string to_string() const;
  bool operator==(const t &o) const;
  bool operator!=(const t &o) const { return !(*this == o); }
};

std::ostream &operator<<(std::ostream &os, const t &v);

}

#endif //STACKLESS_TRAMP_LIB_VERSION_VERSION_H_
