#ifndef STACKLESS_TRAMP_LIB_TRAMPOLINE_NODE_H_
#define STACKLESS_TRAMP_LIB_TRAMPOLINE_NODE_H_

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <variant>
#include <trampoline/box.h>

namespace tramp {

// counters filled by the driver loop when asked to
struct run_stats {
  std::size_t steps = 0;         // resumes issued by the driver
  std::size_t rewrites = 0;      // bound-over-bound re-associations
  std::size_t suspensions = 0;   // suspended thunks handed to the driver
  std::size_t continuations = 0; // continuation steps handed to the driver
};
std::ostream &operator<<(std::ostream &os, const run_stats &s);

/*
 The node graph behind a computation. Values travel as boxes, so a single node type serves every result type; the
 typed layer (trampoline.h) is the only place where nodes are built, and it guarantees that a continuation is only
 ever applied to the box its sub node produces.
 Nodes are immutable once built: resume() and run() never modify the graph they walk, they build new nodes instead.
*/
namespace node {

struct t;
typedef std::shared_ptr<const t> ptr;
typedef std::function<ptr()> thunk;
typedef std::function<ptr(const box &)> step_fn;

struct continuation;
typedef std::shared_ptr<const continuation> kptr;

// x -> step(x) when it is the last link, x -> bound{step(x), rest} otherwise
struct continuation {
  std::shared_ptr<const step_fn> step;
  kptr rest;
  continuation(std::shared_ptr<const step_fn> step, kptr rest) : step(std::move(step)), rest(std::move(rest)) {}
  continuation(const continuation &) = delete;
  continuation &operator=(const continuation &) = delete;
  ~continuation();
  ptr apply(const box &x) const;
};

struct done {
  box value;
};

struct suspended {
  thunk next;
};

struct bound {
  ptr sub;
  kptr k;
};

struct t {
  std::variant<done, suspended, bound> v;
  explicit t(done d) : v(std::move(d)) {}
  explicit t(suspended s) : v(std::move(s)) {}
  explicit t(bound b) : v(std::move(b)) {}
  t(const t &) = delete;
  t &operator=(const t &) = delete;
  ~t();
};

// either more work (a thunk producing the next node) or the final value
typedef std::variant<thunk, box> outcome;

ptr make_done(box value);
ptr make_suspended(thunk next);
ptr make_bound(ptr sub, kptr k);
kptr make_continuation(step_fn step);

// continuation applying `first`, then feeding its result to `then`
kptr compose(const kptr &first, const kptr &then);

outcome resume(const ptr &n, run_stats *stats = nullptr);
box run(ptr n, run_stats *stats = nullptr);

}
}

#endif //STACKLESS_TRAMP_LIB_TRAMPOLINE_NODE_H_
