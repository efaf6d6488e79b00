#ifndef STACKLESS_TRAMP_LIB_TRAMPOLINE_COMBINATORS_H_
#define STACKLESS_TRAMP_LIB_TRAMPOLINE_COMBINATORS_H_

#include <cstddef>
#include <memory>
#include <vector>
#include <trampoline/trampoline.h>

// Everything here is sugar over tramp::bind; calls are qualified so that std::bind never joins overload resolution.
namespace tramp {

template<typename T, typename F>
auto fmap(const computation<T> &c, F &&f) {
  typedef continuation_result_t<F, T> U;
  return tramp::bind(c, [f = std::forward<F>(f)](const T &x) { return tramp::now(U(f(x))); });
}

// <*>
template<typename F, typename A>
auto ap(const computation<F> &cf, const computation<A> &ca) {
  typedef continuation_result_t<F, A> B;
  return tramp::bind(cf, [ca](const F &f) {
    return tramp::bind(ca, [f](const A &a) { return tramp::now(B(f(a))); });
  });
}

template<typename F, typename A, typename B>
auto lift2(F &&f, const computation<A> &ca, const computation<B> &cb) {
  typedef std::decay_t<std::invoke_result_t<const std::decay_t<F> &, const A &, const B &>> C;
  return tramp::bind(ca, [f = std::forward<F>(f), cb](const A &a) {
    return tramp::bind(cb, [f, a](const B &b) { return tramp::now(C(f(a, b))); });
  });
}

// *> : runs a, then b, keeps b's value
template<typename A, typename B>
computation<B> then(const computation<A> &a, const computation<B> &b) {
  return tramp::bind(a, [b](const A &) { return b; });
}

// <* : runs a, then b, keeps a's value
template<typename A, typename B>
computation<A> discard_then(const computation<A> &a, const computation<B> &b) {
  return tramp::bind(a, [b](const A &x) {
    return tramp::bind(b, [x](const B &) { return tramp::now(x); });
  });
}

// <% : runs c, yields value
template<typename A, typename B>
computation<A> replace(const A &value, const computation<B> &c) {
  return tramp::bind(c, [value](const B &) { return tramp::now(value); });
}

template<typename A, typename B>
computation<B> operator>>(const computation<A> &a, const computation<B> &b) {
  return tramp::then(a, b);
}

namespace __internal {

// produces the i-th computation of a list on demand
template<typename Get>
struct producer {
  Get get;
  std::size_t n;
};

template<typename T, typename Get>
computation<std::vector<T>> collect_from(std::shared_ptr<const producer<Get>> p, std::size_t i,
                                         std::shared_ptr<std::vector<T>> acc) {
  if (i == p->n)return tramp::now(std::move(*acc));
  return tramp::bind(p->get(i), [p, i, acc](const T &x) {
    acc->push_back(x);
    return collect_from<T>(p, i + 1, acc);
  });
}

template<typename T, typename Get>
computation<unit> drain_from(std::shared_ptr<const producer<Get>> p, std::size_t i) {
  if (i == p->n)return tramp::now(unit{});
  return tramp::bind(p->get(i), [p, i](const T &) { return drain_from<T>(p, i + 1); });
}

// Elements are produced and bound one at a time as the driver reaches them, and every run collects into its own
// accumulator, so neither building nor running depends on the length of the list.
template<typename T, typename Get>
computation<std::vector<T>> collect(std::size_t n, Get get) {
  auto p = std::make_shared<const producer<Get>>(producer<Get>{.get = std::move(get), .n = n});
  return tramp::later([p] {
    auto acc = std::make_shared<std::vector<T>>();
    acc->reserve(p->n);
    return collect_from<T>(p, 0, acc);
  });
}

template<typename T, typename Get>
computation<unit> drain(std::size_t n, Get get) {
  auto p = std::make_shared<const producer<Get>>(producer<Get>{.get = std::move(get), .n = n});
  return tramp::later([p] { return drain_from<T>(p, 0); });
}

}

template<typename T>
computation<std::vector<T>> sequence(std::vector<computation<T>> ts) {
  const std::size_t n = ts.size();
  return __internal::collect<T>(n, [ts = std::move(ts)](std::size_t i) { return ts[i]; });
}

template<typename T>
computation<unit> sequence_(std::vector<computation<T>> ts) {
  const std::size_t n = ts.size();
  return __internal::drain<T>(n, [ts = std::move(ts)](std::size_t i) { return ts[i]; });
}

// f is applied to each element only when the driver reaches it, in order
template<typename F, typename A>
auto map_m(F &&f, std::vector<A> xs) {
  typedef continuation_result_t<F, A> C;
  static_assert(is_computation_v<C>, "map_m() expects a function returning a computation");
  const std::size_t n = xs.size();
  return __internal::collect<typename C::value_type>(
      n, [f = std::forward<F>(f), xs = std::move(xs)](std::size_t i) { return f(xs[i]); });
}

template<typename A, typename F>
auto for_m(std::vector<A> xs, F &&f) {
  return tramp::map_m(std::forward<F>(f), std::move(xs));
}

template<typename F, typename A>
computation<unit> map_m_(F &&f, std::vector<A> xs) {
  typedef continuation_result_t<F, A> C;
  static_assert(is_computation_v<C>, "map_m_() expects a function returning a computation");
  const std::size_t n = xs.size();
  return __internal::drain<typename C::value_type>(
      n, [f = std::forward<F>(f), xs = std::move(xs)](std::size_t i) { return f(xs[i]); });
}

template<typename A, typename F>
computation<unit> for_m_(std::vector<A> xs, F &&f) {
  return tramp::map_m_(std::forward<F>(f), std::move(xs));
}

}

#endif //STACKLESS_TRAMP_LIB_TRAMPOLINE_COMBINATORS_H_
