#ifndef STACKLESS_TRAMP_LIB_UTIL_MESSAGE_H_
#define STACKLESS_TRAMP_LIB_UTIL_MESSAGE_H_
#include <string>
#include <string_view>
#include <iostream>
#include <vector>
#include <memory>
#include <util/util.h>
namespace util::message {

struct base {
  virtual void print(std::ostream &) const = 0;
  virtual ~base() = default;
};

struct vector : public virtual base, public std::vector<std::unique_ptr<base>> {
  typedef std::vector<std::unique_ptr<base>> vec_t;
  using vec_t::vec_t;
  void print(std::ostream &os) const final;
};

struct string : public virtual base {
  std::string what;
  string(std::string_view what) : what(what) {}
  void print(std::ostream &os) const final;
};

// "[ what ]" line, the way applications report their progress
struct progress : public virtual base {
  std::string what;
  progress(std::string_view what) : what(what) {}
  void print(std::ostream &os) const final;
};

namespace style {

static constexpr std::string_view bold = "\e[1m";
static constexpr std::string_view clear = "\e[0m";

struct none {
  static constexpr std::string_view name = "";
  static constexpr std::string_view escape = "\e[0m";
};

struct error {
  static constexpr std::string_view name = "error";
  static constexpr std::string_view escape = "\e[31m";
};

struct note {
  static constexpr std::string_view name = "note";
  static constexpr std::string_view escape = "\e[36m";
};

struct warning {
  static constexpr std::string_view name = "warning";
  static constexpr std::string_view escape = "\e[35m";
};

}

template<typename Style>
struct styled_string : public virtual base {
  std::string what;
  styled_string(std::string_view what) : what(what) {}
  void print(std::ostream &os) const final {
    os << style::bold << Style::escape << Style::name << ": " << style::clear << what << std::endl;
  }
};
typedef styled_string<style::error> error_string;
typedef styled_string<style::warning> warning_string;
typedef styled_string<style::note> note_string;

void emit(const base &msg, std::ostream &os = std::cerr);

}
#endif //STACKLESS_TRAMP_LIB_UTIL_MESSAGE_H_
