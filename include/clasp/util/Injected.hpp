// Copyright: 2025, Ableton AG, Berlin. All rights reserved.

#pragma once

#include <functional>
#include <memory>

namespace clasp
{
namespace util
{

// Utility type for aiding in dependency injection.
//
// Injected<T> owns a T by value, Injected<T&> refers to a T owned elsewhere and
// Injected<std::shared_ptr<T>> / Injected<std::unique_ptr<T>> reach a T through
// the given pointer. In all cases operator-> and operator* give access to the T.

namespace detail
{

template <typename T>
struct InjectedTraits
{
  using type = T;
  using Storage = T;

  static T* get(Storage& storage) { return &storage; }
  static const T* get(const Storage& storage) { return &storage; }
};

template <typename T>
struct InjectedTraits<T&>
{
  using type = T;
  using Storage = std::reference_wrapper<T>;

  static T* get(const Storage& storage) { return &storage.get(); }
};

template <typename T>
struct InjectedTraits<std::shared_ptr<T>>
{
  using type = T;
  using Storage = std::shared_ptr<T>;

  static T* get(const Storage& storage) { return storage.get(); }
};

template <typename T>
struct InjectedTraits<std::unique_ptr<T>>
{
  using type = T;
  using Storage = std::unique_ptr<T>;

  static T* get(const Storage& storage) { return storage.get(); }
};

} // namespace detail

template <typename T>
class Injected
{
  using Traits = detail::InjectedTraits<T>;

public:
  using type = typename Traits::type;

  Injected(typename Traits::Storage storage)
    : mStorage(std::move(storage))
  {
  }

  type* operator->() { return Traits::get(mStorage); }
  const type* operator->() const { return Traits::get(mStorage); }

  type& operator*() { return *Traits::get(mStorage); }
  const type& operator*() const { return *Traits::get(mStorage); }

private:
  typename Traits::Storage mStorage;
};

template <typename T>
Injected<T> injectVal(T t)
{
  return {std::move(t)};
}

template <typename T>
Injected<T&> injectRef(T& t)
{
  return {std::ref(t)};
}

template <typename T>
Injected<std::shared_ptr<T>> injectShared(std::shared_ptr<T> shared)
{
  return {std::move(shared)};
}

template <typename T>
Injected<std::unique_ptr<T>> injectUnique(std::unique_ptr<T> unique)
{
  return {std::move(unique)};
}

} // namespace util
} // namespace clasp
