#ifndef ARENA_HPP_
#define ARENA_HPP_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>
#include <vector>

namespace sable::mem
{

// Bump allocator for AST nodes. Objects live until the arena is destroyed or
// reset; destructors of non-trivial objects run in reverse creation order.
class Arena
{
    static constexpr std::size_t DEF_BLOCK_SIZE = 8 * 1024;

    struct _block
    {
        std::byte *data;
        std::size_t size;
        std::size_t capacity;

        explicit _block(std::size_t sz) : data(new std::byte[sz]), size(0), capacity(sz) {}
        ~_block() { delete[] data; }

        _block(const _block &) = delete;
        _block &operator=(const _block &) = delete;
    };

    struct _dtor_entry
    {
        void *object;
        void (*destroy)(void *);
    };

    std::vector<_block *> blocks_;
    std::vector<_dtor_entry> dtors_;

    void add_block(std::size_t min_sz)
    {
        std::size_t block_size = std::max(DEF_BLOCK_SIZE, min_sz);
        blocks_.push_back(new _block(block_size));
    }

    void run_destructors()
    {
        for (auto it = dtors_.rbegin(); it != dtors_.rend(); ++it) it->destroy(it->object);
        dtors_.clear();
    }

    void release()
    {
        run_destructors();
        for (auto *b : blocks_) delete b;
        blocks_.clear();
    }

public:
    Arena() { add_block(DEF_BLOCK_SIZE); }
    ~Arena() { release(); }

    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;

    Arena(Arena &&other) noexcept : blocks_(std::move(other.blocks_)), dtors_(std::move(other.dtors_))
    {
        other.blocks_.clear();
        other.dtors_.clear();
    }

    Arena &operator=(Arena &&other) noexcept
    {
        if (this != &other)
        {
            release();
            blocks_ = std::move(other.blocks_);
            dtors_ = std::move(other.dtors_);
            other.blocks_.clear();
            other.dtors_.clear();
        }
        return *this;
    }

    template <typename T>
    T *allocate(std::size_t count = 1)
    {
        static_assert(alignof(T) <= alignof(std::max_align_t), "over-aligned types are not supported");
        std::size_t bytes = sizeof(T) * count;

        if (blocks_.empty())
            add_block(bytes);

        _block *back = blocks_.back();
        std::size_t offset = (back->size + alignof(T) - 1) & ~(alignof(T) - 1);
        if (offset + bytes > back->capacity)
        {
            add_block(bytes);
            back = blocks_.back();
            offset = 0;
        }

        back->size = offset + bytes;
        return reinterpret_cast<T *>(back->data + offset);
    }

    template <typename T, typename... Args>
    T *create(Args &&...args)
    {
        T *mem = allocate<T>();
        T *obj = new (mem) T(std::forward<Args>(args)...);
        if constexpr (!std::is_trivially_destructible_v<T>)
            dtors_.push_back({obj, [](void *p) { static_cast<T *>(p)->~T(); }});
        return obj;
    }

    // Destroys every object and keeps the first block for reuse.
    void reset()
    {
        run_destructors();
        for (std::size_t i = 1; i < blocks_.size(); ++i) delete blocks_[i];
        if (!blocks_.empty())
        {
            blocks_.resize(1);
            blocks_.front()->size = 0;
        }
    }

    std::size_t object_count() const { return dtors_.size(); }

    template <typename T>
    static std::decay_t<T> *alloc(Arena &arena, T &&obj)
    {
        return arena.create<std::decay_t<T>>(std::forward<T>(obj));
    }
};

}  // namespace sable::mem
#endif  // ARENA_HPP_
