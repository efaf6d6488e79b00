#include <trampoline/node.h>
#include <util/util.h>
#include <optional>
#include <variant>
#include <vector>

namespace tramp {

std::ostream &operator<<(std::ostream &os, const run_stats &s) {
  return os << "steps=" << s.steps << " rewrites=" << s.rewrites << " suspensions=" << s.suspensions
            << " continuations=" << s.continuations;
}

namespace node {

namespace {
outcome more(thunk next) { return outcome(std::in_place_index<0>, std::move(next)); }
outcome finished(box value) { return outcome(std::in_place_index<1>, std::move(value)); }

// Whatever a dying node or continuation owns, including closures that capture other computations.
typedef std::variant<std::shared_ptr<const void>, thunk, box> remains;

// Work list of the release under way on this thread, if any.
thread_local std::vector<remains> *pending = nullptr;

// While an outer release drains its work list, a nested one only queues what it owns, so dropping a graph of any
// shape or size takes constant stack depth.
template<typename Bury>
void release(Bury &&bury) {
  if (pending != nullptr) {
    bury(*pending);
    return;
  }
  std::vector<remains> work;
  pending = &work;
  bury(work);
  while (!work.empty()) {
    remains last = std::move(work.back());
    work.pop_back();
  }
  pending = nullptr;
}

}

continuation::~continuation() {
  release([this](std::vector<remains> &work) {
    if (step)work.emplace_back(std::in_place_index<0>, std::move(step));
    if (rest)work.emplace_back(std::in_place_index<0>, std::move(rest));
  });
}

t::~t() {
  release([this](std::vector<remains> &work) {
    std::visit(util::overloaded{
        [&work](done &d) { if (!d.value.empty())work.emplace_back(std::in_place_index<2>, std::move(d.value)); },
        [&work](suspended &s) { if (s.next)work.emplace_back(std::in_place_index<1>, std::move(s.next)); },
        [&work](bound &b) {
          if (b.sub)work.emplace_back(std::in_place_index<0>, std::move(b.sub));
          if (b.k)work.emplace_back(std::in_place_index<0>, std::move(b.k));
        },
    }, v);
  });
}

ptr continuation::apply(const box &x) const {
  if (step == nullptr || !*step)THROW_INTERNAL_ERROR;
  ptr result = (*step)(x);
  if (rest == nullptr)return result;
  return make_bound(std::move(result), rest);
}

ptr make_done(box value) {
  if (value.empty())THROW_INTERNAL_ERROR;
  return std::make_shared<t>(done{std::move(value)});
}

ptr make_suspended(thunk next) {
  if (!next)THROW_INTERNAL_ERROR;
  return std::make_shared<t>(suspended{std::move(next)});
}

ptr make_bound(ptr sub, kptr k) {
  if (sub == nullptr || k == nullptr)THROW_INTERNAL_ERROR;
  return std::make_shared<t>(bound{std::move(sub), std::move(k)});
}

kptr make_continuation(step_fn step) {
  if (!step)THROW_INTERNAL_ERROR;
  return std::make_shared<continuation>(std::make_shared<const step_fn>(std::move(step)), nullptr);
}

kptr compose(const kptr &first, const kptr &then) {
  if (first == nullptr || then == nullptr)THROW_INTERNAL_ERROR;
  if (first->rest == nullptr)return std::make_shared<continuation>(first->step, then);
  std::vector<const continuation *> links;
  for (const continuation *c = first.get(); c != nullptr; c = c->rest.get())links.push_back(c);
  kptr acc = then;
  for (auto it = links.rbegin(); it != links.rend(); ++it)acc = std::make_shared<continuation>((*it)->step, std::move(acc));
  return acc;
}

outcome resume(const ptr &start, run_stats *stats) {
  if (start == nullptr)THROW_INTERNAL_ERROR;
  ptr n = start;
  while (true) {
    ptr rewritten;
    std::optional<outcome> r = std::visit(util::overloaded{
        [&](const done &d) -> std::optional<outcome> { return finished(d.value); },
        [&](const suspended &s) -> std::optional<outcome> {
          if (stats)++stats->suspensions;
          return more(s.next);
        },
        [&](const bound &b) -> std::optional<outcome> {
          if (b.sub == nullptr || b.k == nullptr)THROW_INTERNAL_ERROR;
          return std::visit(util::overloaded{
              [&](const done &d) -> std::optional<outcome> {
                if (stats)++stats->continuations;
                return more([k = b.k, value = d.value] { return k->apply(value); });
              },
              [&](const suspended &s) -> std::optional<outcome> {
                if (stats)++stats->suspensions;
                return more([next = s.next, k = b.k] { return make_bound(next(), k); });
              },
              [&](const bound &inner) -> std::optional<outcome> {
                // (m >>= f) >>= g  ~>  m >>= (x -> f x >>= g)
                rewritten = make_bound(inner.sub, compose(inner.k, b.k));
                return std::nullopt;
              },
          }, b.sub->v);
        },
    }, n->v);
    if (r.has_value())return std::move(*r);
    if (stats)++stats->rewrites;
    n = std::move(rewritten);
  }
}

box run(ptr n, run_stats *stats) {
  ptr current = std::move(n);
  while (true) {
    if (stats)++stats->steps;
    outcome o = resume(current, stats);
    if (auto *value = std::get_if<box>(&o))return std::move(*value);
    current = std::get<thunk>(o)();
  }
}

}
}
