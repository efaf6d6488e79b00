#ifndef STACKLESS_TRAMP_LIB_TRAMPOLINE_TRAMPOLINE_H_
#define STACKLESS_TRAMP_LIB_TRAMPOLINE_TRAMPOLINE_H_

#include <functional>
#include <type_traits>
#include <utility>
#include <trampoline/box.h>
#include <trampoline/node.h>

/*
 A computation either produces a value (now) or defers to another computation (later), and computations chain
 with bind. Evaluation by run() is a flat loop over a heap-resident graph: arbitrarily long bind chains, in either
 association, run in constant stack space.

 Based on "Stackless Scala With Free Monads" by Runar Oli Bjarnason, http://blog.higher-order.com/assets/trampolines.pdf
*/
namespace tramp {

struct unit {
  bool operator==(const unit &) const { return true; }
};

template<typename T>
class computation;

template<typename C>
struct is_computation : std::false_type {};
template<typename T>
struct is_computation<computation<T>> : std::true_type {};
template<typename C>
inline constexpr bool is_computation_v = is_computation<std::decay_t<C>>::value;

// result type of applying a continuation F to a T
template<typename F, typename T>
using continuation_result_t = std::decay_t<std::invoke_result_t<const std::decay_t<F> &, const T &>>;

namespace node {
// Builds the graphs behind computations. Only these three builders are public: code outside them never sees a
// computation's node.
class access {
 public:
  template<typename T>
  static computation<std::decay_t<T>> now(T &&value);
  template<typename F>
  static auto later(F &&f);
  template<typename T, typename F>
  static auto bind(const computation<T> &c, F &&f);

 private:
  template<typename T>
  static const ptr &of(const computation<T> &c) { return c.n_; }
  template<typename T>
  static computation<T> wrap(ptr n) { return computation<T>(std::move(n)); }
};
}

template<typename T>
class computation {
  static_assert(std::is_object_v<T>, "computations carry values; use std::reference_wrapper for references");
  static_assert(std::is_copy_constructible_v<T>, "the value of a computation is copied out of its graph");
 public:
  typedef T value_type;

  computation(const computation &) = default;
  computation(computation &&) noexcept = default;
  computation &operator=(const computation &) = default;
  computation &operator=(computation &&) noexcept = default;

  template<typename F>
  auto bind(F &&f) const;

  T run(run_stats *stats = nullptr) const {
    return node::run(n_, stats).template get<T>();
  }

 private:
  explicit computation(node::ptr n) : n_(std::move(n)) {}
  node::ptr n_;
  friend class node::access;
};

namespace node {

template<typename T>
computation<std::decay_t<T>> access::now(T &&value) {
  return wrap<std::decay_t<T>>(make_done(box::of(std::forward<T>(value))));
}

template<typename F>
auto access::later(F &&f) {
  typedef std::decay_t<std::invoke_result_t<const std::decay_t<F> &>> C;
  static_assert(is_computation_v<C>, "later() expects a thunk returning a computation");
  return wrap<typename C::value_type>(make_suspended([f = std::forward<F>(f)]() -> ptr { return of(f()); }));
}

template<typename T, typename F>
auto access::bind(const computation<T> &c, F &&f) {
  typedef continuation_result_t<F, T> C;
  static_assert(is_computation_v<C>, "bind() expects a continuation returning a computation");
  return wrap<typename C::value_type>(make_bound(
      of(c),
      make_continuation([f = std::forward<F>(f)](const box &x) -> ptr { return of(f(x.get<T>())); })));
}

}

// Lifts a value into a computation: a leaf of the computation tree.
template<typename T>
computation<std::decay_t<T>> now(T &&value) {
  return node::access::now(std::forward<T>(value));
}

template<typename T>
computation<std::decay_t<T>> pure(T &&value) {
  return now(std::forward<T>(value));
}

// Defers a sub-computation: a branch of the computation tree.
// `f` is only called when run() reaches this node, once for every time it is reached.
template<typename F>
auto later(F &&f) {
  return node::access::later(std::forward<F>(f));
}

template<typename F>
auto suspend(F &&f) {
  return later(std::forward<F>(f));
}

// Builds, without evaluating anything, the computation feeding the value of `c` to `f`.
template<typename T, typename F>
auto bind(const computation<T> &c, F &&f) {
  return node::access::bind(c, std::forward<F>(f));
}

template<typename T>
template<typename F>
auto computation<T>::bind(F &&f) const {
  return tramp::bind(*this, std::forward<F>(f));
}

template<typename T>
T run(const computation<T> &c) {
  return c.run();
}

template<typename T>
T run(const computation<T> &c, run_stats &stats) {
  return c.run(&stats);
}

}

#endif //STACKLESS_TRAMP_LIB_TRAMPOLINE_TRAMPOLINE_H_
