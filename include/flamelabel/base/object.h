#pragma once

#include <memory>

namespace flamelabel {
namespace base {

class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    virtual const char* typeName() const { return "Object"; }

    // Shared ownership only
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(Object&&) = delete;

protected:
    Object() = default;
};

} // namespace base
} // namespace flamelabel
