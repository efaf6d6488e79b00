#include <util/util.h>
#include <algorithm>
#include <cstring>

namespace util {

std::string_view get_arg(int argc, const char *argv[], std::string_view argname, std::string_view on_fail) {
  auto it = std::find_if(argv, argv + argc, [argname](const char *p) { return argname == p; });
  if (it == argv + argc)return on_fail;
  if (it == argv + argc - 1)return on_fail;
  return it[1];
}

bool has_flag(int argc, const char *argv[], std::string_view flagname) {
  return std::any_of(argv, argv + argc, [flagname](const char *p) { return flagname == p; });
}

internal_error::internal_error(std::string_view where)
    : std::runtime_error(std::string(where).append(": internal_error")) {}

}
