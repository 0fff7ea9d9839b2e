#pragma once

#include <type_traits>
#include <utility>

namespace helm {

template <class Signature>
struct callback;

// Non-owning function reference: an opaque object pointer plus a thunk.
// Ports and hooks are wired with these so components never own their
// collaborators.
template <class R, class... Args>
struct callback<R(Args...)> {
  using result_type = R;
  using thunk_fn = R (*)(void *, Args...);

  void * object = nullptr;
  thunk_fn thunk = nullptr;

  constexpr callback() noexcept = default;
  constexpr callback(void * obj, thunk_fn fn) noexcept : object(obj), thunk(fn) {}

  constexpr explicit operator bool() const noexcept { return thunk != nullptr; }

  constexpr void reset() noexcept {
    object = nullptr;
    thunk = nullptr;
  }

  R operator()(Args... args) const {
    if constexpr (std::is_void_v<R>) {
      if (thunk != nullptr) {
        thunk(object, std::forward<Args>(args)...);
      }
    } else {
      return call_or(R{}, std::forward<Args>(args)...);
    }
  }

  // Unbound callbacks yield `fallback`, so a missing port can report a
  // status other than a value-initialized success.
  template <class Fallback>
  R call_or(Fallback && fallback, Args... args) const {
    static_assert(!std::is_void_v<R>, "call_or needs a result type");
    if (thunk == nullptr) {
      return static_cast<R>(std::forward<Fallback>(fallback));
    }
    return thunk(object, std::forward<Args>(args)...);
  }

  template <auto Fn>
  static constexpr callback from() noexcept {
    return callback{
      nullptr,
      [](void *, Args... args) -> R { return Fn(std::forward<Args>(args)...); },
    };
  }

  template <class T, auto MemFn>
  static constexpr callback from(T * obj) noexcept {
    return callback{
      obj,
      [](void * ptr, Args... args) -> R {
        return (static_cast<T *>(ptr)->*MemFn)(std::forward<Args>(args)...);
      },
    };
  }

  template <class T, auto MemFn>
  static constexpr callback from(const T * obj) noexcept {
    return callback{
      const_cast<T *>(obj),
      [](void * ptr, Args... args) -> R {
        return (static_cast<const T *>(ptr)->*MemFn)(std::forward<Args>(args)...);
      },
    };
  }
};

}  // namespace helm
