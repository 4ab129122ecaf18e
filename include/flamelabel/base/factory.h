#pragma once

#include <flamelabel/result.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace flamelabel {
namespace base {

// ObjectFactory - enforces the create protocol for shared_ptr objects
//
//   1. Header declares the interface type (e.g., RawFont)
//   2. Cpp defines a private subclass (e.g., RawFontImpl) with init()
//   3. createImpl() builds the Impl, calls init(), returns Result<Ptr>
//
// Callers only ever see T::create(args...), never a half-initialized object.
//
template<typename T>
class ObjectFactory {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;

private:
    template<typename FType, typename... Args>
    struct HasCreateImpl {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::createImpl(std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

public:
    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        if constexpr (HasCreateImpl<Type, Args...>::value) {
            return Type::createImpl(std::forward<Args>(args)...);
        } else {
            static_assert(sizeof(T) == 0,
                "ObjectFactory: no matching static Result<Ptr> createImpl(Args...)");
            return Err<Ptr>("unreachable");
        }
    }
};

// ThreadSingleton - one instance per thread
//
// instance() returns Result<Ptr>; a failed creation is cached per thread
// and returned on every later call from that thread.
//
template<typename T>
class ThreadSingleton {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;

    static Result<Ptr> instance() {
        static thread_local Result<Ptr> _instance = []() -> Result<Ptr> {
            auto result = Type::createImpl();
            if (!result) {
                return Err<Ptr>("ThreadSingleton creation failed", result);
            }
            return result;
        }();
        return _instance;
    }

protected:
    ThreadSingleton() = default;
};

} // namespace base
} // namespace flamelabel
