#ifndef QUNET_CORE_UTILITY_SINGLETON_HPP
#define QUNET_CORE_UTILITY_SINGLETON_HPP

#include <memory>
#include <mutex>
#include <stdexcept>
#include <type_traits>

namespace qunet {

/// @brief CRTP base for process-wide objects
///
/// Derived classes keep their constructors private and befriend
/// `Singleton<Derived>`. The instance is created by the first call to
/// instance() (if Derived is default-constructible) or explicitly by
/// set_instance(), which can also replace an existing instance.
template <typename Derived>
class Singleton {
  template <typename T, typename Enabler = void>
  struct is_default_constructible_helper : public std::false_type {};
  template <typename T>
  struct is_default_constructible_helper<T, std::void_t<decltype(T{})>>
      : public std::true_type {};
  constexpr static bool derived_is_default_constructible =
      is_default_constructible_helper<Derived>::value;

 public:
  /// @return reference to the instance
  /// @throw std::logic_error if Derived is not default-constructible and
  /// set_instance() has not been called
  static Derived& instance() {
    if (auto* ptr = instance_accessor().get()) return *ptr;
    if constexpr (derived_is_default_constructible) {
      std::scoped_lock lock(instance_mutex());
      if (!instance_accessor())
        instance_accessor() = std::unique_ptr<Derived>(new Derived);
      return *instance_accessor();
    } else
      throw std::logic_error(
          "qunet::Singleton: is not default-constructible and set_instance() "
          "has not been called");
  }

  /// (re)constructs the instance from @p args
  /// @return reference to the newly-created instance
  template <typename... Args>
  static Derived& set_instance(Args&&... args) {
    std::scoped_lock lock(instance_mutex());
    instance_accessor() =
        std::unique_ptr<Derived>(new Derived(std::forward<Args>(args)...));
    return *instance_accessor();
  }

 protected:
  Singleton() = default;

  static auto& instance_accessor() {
    static std::unique_ptr<Derived> instance;
    return instance;
  }
  static auto& instance_mutex() {
    static std::mutex mtx;
    return mtx;
  }
};

}  // namespace qunet

#endif  // QUNET_CORE_UTILITY_SINGLETON_HPP
