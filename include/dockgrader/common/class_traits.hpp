/// \file
/// Mixins annotating the copy / move semantics of handle-like classes
#pragma once

#include <type_traits>

namespace dockgrader {

/// Base of types owning a resource that can be handed over but never duplicated
/// (e.g. a child process, a container engine connection)
class NonCopyable
{
public:
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;

    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

/// Base of types whose address is handed out to others (e.g. an Environment referenced by a running phase),
/// so that they may never be relocated
class NonMovable
{
public:
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    NonMovable& operator=(const NonMovable&) = delete;

    NonMovable(NonMovable&&) = delete;
    NonMovable& operator=(NonMovable&&) = delete;
};

static_assert(std::is_trivially_move_constructible_v<NonCopyable> && !std::is_copy_constructible_v<NonCopyable>);
static_assert(!std::is_move_constructible_v<NonMovable> && !std::is_copy_constructible_v<NonMovable>);

} // namespace dockgrader
