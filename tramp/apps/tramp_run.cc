#include <trampoline/combinators.h>
#include <util/message.h>
#include <util/subprocess.h>
#include <util/util.h>
#include <algorithm>
#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

using tramp::computation;
using tramp::now;
using tramp::later;

constexpr auto modes = util::make_array("left", "right", "suspend", "sequence", "loop");

std::optional<long> parse_number(std::string_view s) {
  long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size() || v < 0)return std::nullopt;
  return v;
}

computation<long> left_chain(long n) {
  computation<long> c = now(0L);
  for (long i = 0; i < n; ++i)c = c.bind([](long x) { return now(x + 1); });
  return c;
}

computation<long> right_chain(long x, long n) {
  if (x == n)return now(x);
  return tramp::bind(now(x), [n](long y) { return right_chain(y + 1, n); });
}

computation<long> countdown(long n, long acc) {
  if (n == 0)return now(acc);
  return later([n, acc] { return countdown(n - 1, acc + 1); });
}

computation<long> summed(long n) {
  std::vector<long> xs(n);
  for (long i = 0; i < n; ++i)xs[i] = i + 1;
  auto all = tramp::map_m([](long x) { return later([x] { return now(x); }); }, std::move(xs));
  return tramp::fmap(all, [](const std::vector<long> &v) {
    long s = 0;
    for (long x : v)s += x;
    return s;
  });
}

computation<long> forever() {
  return later([] { return forever(); });
}

computation<long> build(std::string_view mode, long n) {
  if (mode == "left")return left_chain(n);
  if (mode == "right")return right_chain(0, n);
  if (mode == "suspend")return countdown(n, 0);
  if (mode == "sequence")return summed(n);
  return forever();
}

void report(const computation<long> &c, bool with_stats) {
  tramp::run_stats stats;
  long value = tramp::run(c, stats);
  std::cout << value << std::endl;
  if (with_stats) {
    std::stringstream ss;
    ss << stats;
    util::message::emit(util::message::note_string(ss.str()));
  }
}

}

int main(int argc, const char *argv[]) {
  std::string_view mode = util::get_arg(argc, argv, "-mode", "left");
  std::optional<long> n = parse_number(util::get_arg(argc, argv, "-n", "1000000"));
  std::optional<long> timeout = parse_number(util::get_arg(argc, argv, "-timeout", "1000"));
  bool with_stats = util::has_flag(argc, argv, "-stats");

  if (std::find(modes.begin(), modes.end(), mode) == modes.end()) {
    util::message::emit(util::message::error_string("unknown mode '" + std::string(mode)
                                                         + "', expected one of left, right, suspend, sequence, loop"));
    return 1;
  }
  if (!n.has_value() || !timeout.has_value()) {
    util::message::emit(util::message::error_string("-n and -timeout expect non-negative integers"));
    return 1;
  }

  util::message::emit(util::message::progress("Building " + std::string(mode) + " computation of " + std::to_string(*n) + " steps"));
  computation<long> c = build(mode, *n);

  try {
    if (mode == "loop") {
      util::message::emit(util::message::progress("Running under a " + std::to_string(*timeout) + "ms watchdog"));
      util::subprocess child([&c, with_stats] { report(c, with_stats); });
      if (!child.wait_for(std::chrono::milliseconds(*timeout))) {
        child.kill();
        util::message::emit(util::message::warning_string("computation did not finish within the time limit"));
        return 2;
      }
      return child.exit_code();
    }
    util::message::emit(util::message::progress("Running"));
    report(c, with_stats);
  } catch (const std::exception &e) {
    util::message::emit(util::message::error_string(e.what()));
    return 1;
  }
  util::message::emit(util::message::progress("Done"));
  return 0;
}
