// surge

#pragma once

#include "surge/export.hh"

#include <cstdint>
#include <new>

namespace surge {
    /// Every graph, compiler and evaluator allocates through one of these.
    /// Blocks are returned with the size and alignment they were requested
    /// with.
    class sgAllocator
    {
    public:
        [[nodiscard]] virtual void* allocate(uint32_t size, uint32_t alignment) = 0;
        virtual void free(void* block, uint32_t size, uint32_t alignment) = 0;

    protected:
        ~sgAllocator() = default;
    };

    class SG_API sgDefaultAllocator final : public sgAllocator
    {
    public:
        [[nodiscard]] void* allocate(uint32_t size, uint32_t alignment) override;
        void free(void* block, uint32_t size, uint32_t alignment) override;
    };

    // constructs a T in storage taken from alloc
    template <typename T, typename... ArgsT>
    [[nodiscard]] T* sgNew(sgAllocator& alloc, ArgsT&&... args)
    {
        return new (alloc.allocate(sizeof(T), alignof(T))) T(static_cast<ArgsT&&>(args)...);
    }

    // destroys an object made by sgNew; alloc must not live inside it
    template <typename T>
    void sgDelete(sgAllocator& alloc, T* object) noexcept
    {
        if (object == nullptr)
            return;

        object->~T();
        alloc.free(object, sizeof(T), alignof(T));
    }
} // namespace surge
