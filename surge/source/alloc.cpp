// surge

#include "surge/alloc.hh"

#include <new>

namespace surge {
    void* sgDefaultAllocator::allocate(uint32_t size, uint32_t alignment)
    {
        return ::operator new(size, std::align_val_t(alignment));
    }

    void sgDefaultAllocator::free(void* block, uint32_t size, uint32_t alignment)
    {
        if (block == nullptr)
            return;

        ::operator delete(block, size, std::align_val_t(alignment));
    }
} // namespace surge
