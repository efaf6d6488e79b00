#ifndef STACKLESS_TRAMP_LIB_TRAMPOLINE_BOX_H_
#define STACKLESS_TRAMP_LIB_TRAMPOLINE_BOX_H_

#include <memory>
#include <typeinfo>
#include <type_traits>
#include <utility>
#include <util/util.h>

namespace tramp {

// Immutable, shared, type-tagged value. Nodes of every result type carry their values as boxes.
class box {
 public:
  box() = default;

  template<typename T>
  static box of(T &&value) {
    typedef std::decay_t<T> V;
    return box(std::make_shared<const V>(std::forward<T>(value)), typeid(V));
  }

  template<typename T>
  [[nodiscard]] const T &get() const {
    if (!holds<T>())THROW_INTERNAL_ERROR;
    return *static_cast<const T *>(p_.get());
  }

  template<typename T>
  [[nodiscard]] bool holds() const noexcept {
    return p_ != nullptr && *type_ == typeid(T);
  }

  [[nodiscard]] bool empty() const noexcept { return p_ == nullptr; }

 private:
  box(std::shared_ptr<const void> p, const std::type_info &type) : p_(std::move(p)), type_(&type) {}
  std::shared_ptr<const void> p_;
  const std::type_info *type_ = nullptr;
};

}

#endif //STACKLESS_TRAMP_LIB_TRAMPOLINE_BOX_H_
