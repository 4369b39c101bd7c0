#pragma once

#include <cassert>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace sable::mem
{

// Non-atomic shared pointer. The deleter is bound when the first owner is
// created, so copies and destruction work with incomplete types (values and
// frames refer to each other).
template <typename T>
class rc_ptr
{
    struct _control_block_
    {
        T *ptr;
        std::size_t ref_count;
        void (*deleter)(T *);

        _control_block_(T *p, void (*d)(T *)) : ptr(p), ref_count(1), deleter(d) {}
        ~_control_block_() { deleter(ptr); }
    };

    _control_block_ *ctrl = nullptr;

    void acquire() noexcept
    {
        if (ctrl)
            ++ctrl->ref_count;
    }

    void release() noexcept
    {
        if (ctrl && --ctrl->ref_count == 0)
            delete ctrl;
        ctrl = nullptr;
    }

public:
    rc_ptr() = default;
    rc_ptr(std::nullptr_t) noexcept {}
    explicit rc_ptr(T *raw) : ctrl(raw ? new _control_block_(raw, [](T *p) { delete p; }) : nullptr) {}

    rc_ptr(const rc_ptr &other) noexcept : ctrl(other.ctrl) { acquire(); }
    rc_ptr(rc_ptr &&other) noexcept : ctrl(std::exchange(other.ctrl, nullptr)) {}

    rc_ptr &operator=(const rc_ptr &other) noexcept
    {
        if (ctrl != other.ctrl)
        {
            release();
            ctrl = other.ctrl;
            acquire();
        }
        return *this;
    }

    rc_ptr &operator=(rc_ptr &&other) noexcept
    {
        if (this != &other)
        {
            release();
            ctrl = std::exchange(other.ctrl, nullptr);
        }
        return *this;
    }

    ~rc_ptr() { release(); }

    T *get() const noexcept { return ctrl ? ctrl->ptr : nullptr; }
    T &operator*() const noexcept
    {
        assert(get());
        return *get();
    }
    T *operator->() const noexcept
    {
        assert(get());
        return get();
    }

    std::size_t use_count() const noexcept { return ctrl ? ctrl->ref_count : 0; }
    explicit operator bool() const noexcept { return get() != nullptr; }

    bool operator==(const rc_ptr &other) const noexcept { return get() == other.get(); }
    bool operator==(std::nullptr_t) const noexcept { return get() == nullptr; }

    void reset() noexcept { release(); }
};

template <typename T, typename... Args>
rc_ptr<T> make_rc(Args &&...args)
{
    return rc_ptr<T>(new T(std::forward<Args>(args)...));
}

}  // namespace sable::mem
