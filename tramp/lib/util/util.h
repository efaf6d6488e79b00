#ifndef STACKLESS_TRAMP_LIB_UTIL_UTIL_H_
#define STACKLESS_TRAMP_LIB_UTIL_UTIL_H_

#include <string>
#include <string_view>
#include <stdexcept>
#include <array>
#include <type_traits>
#include <utility>

namespace util {

template<typename... T>
constexpr auto make_array(T &&... values) ->
std::array<
    typename std::decay<
        typename std::common_type<T...>::type>::type,
    sizeof...(T)> {
  return std::array<
      typename std::decay<
          typename std::common_type<T...>::type>::type,
      sizeof...(T)>{std::forward<T>(values)...};
}

template<class... Ts>
struct overloaded : Ts ... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// value following `argname` on the command line, `on_fail` when absent
std::string_view get_arg(int argc, const char *argv[], std::string_view argname, std::string_view on_fail);
bool has_flag(int argc, const char *argv[], std::string_view flagname);

// raised when a structure built only through the public API turns out to be malformed
class internal_error : public std::runtime_error {
 public:
  explicit internal_error(std::string_view where);
};

}

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#define AT __FILE__ ":" TOSTRING(__LINE__)
#define THROW_INTERNAL_ERROR throw ::util::internal_error( AT );

#endif //STACKLESS_TRAMP_LIB_UTIL_UTIL_H_
