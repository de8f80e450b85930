// surge

#include "surge/native.hh"

#include "surge/alloc.hh"

#include "array.hh"
#include "fnv.hh"
#include "string.hh"
#include "utility.hh"

#include <cstdio>

namespace surge {
    namespace {
        void writeStdout(sgBytes bytes, void*)
        {
            if (bytes.size != 0)
            {
                std::fwrite(bytes.data, 1, bytes.size, stdout);
                std::fflush(stdout);
            }
        }

        class NativeRegistry final : public sgNativeRegistry
        {
        public:
            explicit NativeRegistry(sgAllocator& alloc) noexcept : allocator_(alloc), natives_(alloc) {}

            bool lookupNative(sgName name, sgNativeMeta& out_meta) const noexcept override;
            void writeOutput(sgBytes bytes) override;

            bool registerNative(sgNativeMeta const& meta) override;
            void setOutput(sgOutputSink sink, void* userData) noexcept override;

            uint32_t nativeCount() const noexcept override { return natives_.size(); }
            sgNativeMeta nativeAt(uint32_t index) const noexcept override;

            sgAllocator& allocator() noexcept { return allocator_; }

        private:
            struct Entry
            {
                Entry(sgString&& entryName, uint64_t hash, sgNativeMeta const& entryMeta) noexcept
                    : name(static_cast<sgString&&>(entryName)), nameHash(hash), meta(entryMeta)
                {
                }

                sgString name;
                uint64_t nameHash = 0;
                sgNativeMeta meta;
            };

            Entry const* find(sgName name) const noexcept;

            sgAllocator& allocator_;
            sgArray<Entry> natives_;
            sgOutputSink output_ = writeStdout;
            void* outputUserData_ = nullptr;
        };
    } // namespace

    sgNativeRegistry* sgCreateNativeRegistry(sgAllocator& alloc)
    {
        return sgNew<NativeRegistry>(alloc, alloc);
    }

    void sgDestroyNativeRegistry(sgNativeRegistry* registry)
    {
        if (registry == nullptr)
            return;

        NativeRegistry* const impl = static_cast<NativeRegistry*>(registry);
        sgDelete(impl->allocator(), impl);
    }

    bool NativeRegistry::lookupNative(sgName name, sgNativeMeta& out_meta) const noexcept
    {
        Entry const* const entry = find(name);
        if (entry == nullptr)
            return false;

        out_meta = entry->meta;
        return true;
    }

    void NativeRegistry::writeOutput(sgBytes bytes)
    {
        if (output_ != nullptr)
            output_(bytes, outputUserData_);
    }

    bool NativeRegistry::registerNative(sgNativeMeta const& meta)
    {
        SG_GUARD_OR(meta.name != nullptr, false);
        SG_GUARD_OR(meta.function != nullptr, false);

        sgName const name{meta.name};
        if (sgIsNameEmpty(name) || find(name) != nullptr)
            return false;

        sgString stored(allocator_, meta.name);
        uint64_t const hash = sgHashFnv1a64(stored.begin(), stored.end());

        Entry& entry = natives_.emplaceBack(static_cast<sgString&&>(stored), hash, meta);
        // the caller's name may not outlive us
        entry.meta.name = entry.name.cStr();
        return true;
    }

    void NativeRegistry::setOutput(sgOutputSink sink, void* userData) noexcept
    {
        output_ = sink;
        outputUserData_ = userData;
    }

    sgNativeMeta NativeRegistry::nativeAt(uint32_t index) const noexcept
    {
        SG_GUARD_OR(index < natives_.size(), sgNativeMeta{});
        return natives_[index].meta;
    }

    auto NativeRegistry::find(sgName name) const noexcept -> Entry const*
    {
        uint32_t const length = sgNameLen(name);
        uint64_t const hash = sgHashFnv1a64(name.name, name.name + length);

        for (Entry const& entry : natives_)
        {
            if (entry.nameHash == hash && entry.name.equals(name.name, length))
                return &entry;
        }
        return nullptr;
    }
} // namespace surge
