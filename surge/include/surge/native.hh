// surge

#pragma once

#include "surge/errors.hh"
#include "surge/export.hh"
#include "surge/types.hh"

#include <cstdint>

namespace surge {
    class sgAllocator;

    /// What a native function sees while it runs. Arguments are the dataized
    /// bytes of the receiver (methods only) followed by α0, α1, ...
    class sgNativeContext
    {
    public:
        [[nodiscard]] virtual uint32_t getArgCount() const noexcept = 0;
        [[nodiscard]] virtual sgBytes getArgAt(uint32_t index) const noexcept = 0;

        // sets the result to a copy of value
        virtual void result(sgBytes value) = 0;

        // sets the result to size bytes the caller fills through the returned pointer
        [[nodiscard]] virtual uint8_t* resultBuffer(uint32_t size) = 0;

        // sends bytes to the host's output stream
        virtual void write(sgBytes bytes) = 0;

        // records why the call failed; the native should then return false
        virtual void fail(sgErrorCode code) = 0;

    protected:
        ~sgNativeContext() = default;
    };

    struct sgNativeMeta final
    {
        char const* name = nullptr;
        sgNativeFunction function = nullptr;
        sgNativeKind kind = sgNativeKind::Method;
        void* userData = nullptr;
    };

    using sgOutputSink = void (*)(sgBytes bytes, void* userData);

    /// Everything the dataizer needs from its embedder.
    class sgDataizeHost
    {
    public:
        virtual bool lookupNative(sgName name, sgNativeMeta& out_meta) const noexcept = 0;
        // called while the dataizer holds its graph's lock; must not re-enter
        // a dataizer, merge or image build on that graph
        virtual void writeOutput(sgBytes bytes) = 0;

    protected:
        ~sgDataizeHost() = default;
    };

    /// Name to native function table. Built once at start-up and only read
    /// once dataization begins.
    class sgNativeRegistry : public sgDataizeHost
    {
    public:
        // false if the name is already taken or the meta is incomplete
        [[nodiscard]] virtual bool registerNative(sgNativeMeta const& meta) = 0;

        // standard output unless replaced; the sink runs under the dataized
        // graph's lock, like writeOutput
        virtual void setOutput(sgOutputSink sink, void* userData = nullptr) noexcept = 0;

        [[nodiscard]] virtual uint32_t nativeCount() const noexcept = 0;
        [[nodiscard]] virtual sgNativeMeta nativeAt(uint32_t index) const noexcept = 0;

    protected:
        ~sgNativeRegistry() = default;
    };

    [[nodiscard]] SG_API sgNativeRegistry* sgCreateNativeRegistry(sgAllocator& alloc);
    SG_API void sgDestroyNativeRegistry(sgNativeRegistry* registry);

    /// Registers inc, dec, neg, plus, minus, times, div, eq, lt, gt, concat
    /// and stdout. Integers are 8-byte big-endian two's complement.
    [[nodiscard]] SG_API bool sgRegisterBuiltins(sgNativeRegistry& registry);
} // namespace surge
