// surge

#include "surge/native.hh"

#include "utility.hh"

#include <cstdint>
#include <cstring>

namespace surge {
    namespace {
        bool expectArgs(sgNativeContext& ctx, uint32_t count)
        {
            if (ctx.getArgCount() == count)
                return true;

            ctx.fail(sgErrorCode::NativeTypeMismatch);
            return false;
        }

        bool readInt(sgNativeContext& ctx, uint32_t index, uint64_t& out_value)
        {
            sgBytes const arg = ctx.getArgAt(index);
            if (arg.size != 8)
            {
                ctx.fail(sgErrorCode::NativeTypeMismatch);
                return false;
            }

            out_value = sgLoadBigEndian64(arg.data);
            return true;
        }

        // arithmetic is done on the unsigned representation so overflow wraps
        bool resultInt(sgNativeContext& ctx, uint64_t value)
        {
            uint8_t bytes[8];
            sgStoreBigEndian64(value, bytes);
            ctx.result(sgBytes{.data = bytes, .size = 8});
            return true;
        }

        bool resultBool(sgNativeContext& ctx, bool value)
        {
            uint8_t const byte = value ? 1 : 0;
            ctx.result(sgBytes{.data = &byte, .size = 1});
            return true;
        }

        template <typename OpT>
        bool unaryInt(sgNativeContext& ctx, OpT op)
        {
            uint64_t value = 0;
            if (!expectArgs(ctx, 1) || !readInt(ctx, 0, value))
                return false;
            return resultInt(ctx, op(value));
        }

        template <typename OpT>
        bool binaryInt(sgNativeContext& ctx, OpT op)
        {
            uint64_t lhs = 0;
            uint64_t rhs = 0;
            if (!expectArgs(ctx, 2) || !readInt(ctx, 0, lhs) || !readInt(ctx, 1, rhs))
                return false;
            return op(lhs, rhs);
        }

        bool nativeInc(sgNativeContext& ctx, void*)
        {
            return unaryInt(ctx, [](uint64_t value) { return value + 1; });
        }

        bool nativeDec(sgNativeContext& ctx, void*)
        {
            return unaryInt(ctx, [](uint64_t value) { return value - 1; });
        }

        bool nativeNeg(sgNativeContext& ctx, void*)
        {
            return unaryInt(ctx, [](uint64_t value) { return ~value + 1; });
        }

        bool nativePlus(sgNativeContext& ctx, void*)
        {
            return binaryInt(ctx, [&ctx](uint64_t lhs, uint64_t rhs) { return resultInt(ctx, lhs + rhs); });
        }

        bool nativeMinus(sgNativeContext& ctx, void*)
        {
            return binaryInt(ctx, [&ctx](uint64_t lhs, uint64_t rhs) { return resultInt(ctx, lhs - rhs); });
        }

        bool nativeTimes(sgNativeContext& ctx, void*)
        {
            return binaryInt(ctx, [&ctx](uint64_t lhs, uint64_t rhs) { return resultInt(ctx, lhs * rhs); });
        }

        bool nativeDiv(sgNativeContext& ctx, void*)
        {
            return binaryInt(ctx, [&ctx](uint64_t lhs, uint64_t rhs) {
                if (rhs == 0)
                {
                    ctx.fail(sgErrorCode::NativeFailure);
                    return false;
                }

                int64_t const dividend = static_cast<int64_t>(lhs);
                int64_t const divisor = static_cast<int64_t>(rhs);

                // INT64_MIN / -1 wraps back to INT64_MIN
                if (divisor == -1)
                    return resultInt(ctx, ~lhs + 1);

                return resultInt(ctx, static_cast<uint64_t>(dividend / divisor));
            });
        }

        bool nativeLt(sgNativeContext& ctx, void*)
        {
            return binaryInt(ctx, [&ctx](uint64_t lhs, uint64_t rhs) {
                return resultBool(ctx, static_cast<int64_t>(lhs) < static_cast<int64_t>(rhs));
            });
        }

        bool nativeGt(sgNativeContext& ctx, void*)
        {
            return binaryInt(ctx, [&ctx](uint64_t lhs, uint64_t rhs) {
                return resultBool(ctx, static_cast<int64_t>(lhs) > static_cast<int64_t>(rhs));
            });
        }

        bool nativeEq(sgNativeContext& ctx, void*)
        {
            if (!expectArgs(ctx, 2))
                return false;

            sgBytes const lhs = ctx.getArgAt(0);
            sgBytes const rhs = ctx.getArgAt(1);
            return resultBool(ctx, lhs.size == rhs.size && (lhs.size == 0 || std::memcmp(lhs.data, rhs.data, lhs.size) == 0));
        }

        bool nativeConcat(sgNativeContext& ctx, void*)
        {
            uint32_t const argCount = ctx.getArgCount();
            if (argCount == 0)
            {
                ctx.fail(sgErrorCode::NativeTypeMismatch);
                return false;
            }

            uint32_t total = 0;
            for (uint32_t index = 0; index != argCount; ++index)
                total += ctx.getArgAt(index).size;

            uint8_t* out = ctx.resultBuffer(total);
            for (uint32_t index = 0; index != argCount; ++index)
            {
                sgBytes const arg = ctx.getArgAt(index);
                if (arg.size != 0)
                    std::memcpy(out, arg.data, arg.size);
                out += arg.size;
            }
            return true;
        }

        bool nativeStdout(sgNativeContext& ctx, void*)
        {
            if (!expectArgs(ctx, 1))
                return false;

            sgBytes const text = ctx.getArgAt(0);
            ctx.write(text);
            ctx.result(text);
            return true;
        }

        static constexpr sgNativeMeta builtins[] = {
            {.name = "inc", .function = nativeInc, .kind = sgNativeKind::Method},
            {.name = "dec", .function = nativeDec, .kind = sgNativeKind::Method},
            {.name = "neg", .function = nativeNeg, .kind = sgNativeKind::Method},
            {.name = "plus", .function = nativePlus, .kind = sgNativeKind::Method},
            {.name = "minus", .function = nativeMinus, .kind = sgNativeKind::Method},
            {.name = "times", .function = nativeTimes, .kind = sgNativeKind::Method},
            {.name = "div", .function = nativeDiv, .kind = sgNativeKind::Method},
            {.name = "eq", .function = nativeEq, .kind = sgNativeKind::Method},
            {.name = "lt", .function = nativeLt, .kind = sgNativeKind::Method},
            {.name = "gt", .function = nativeGt, .kind = sgNativeKind::Method},
            {.name = "concat", .function = nativeConcat, .kind = sgNativeKind::Method},
            {.name = "stdout", .function = nativeStdout, .kind = sgNativeKind::Function},
        };
    } // namespace

    bool sgRegisterBuiltins(sgNativeRegistry& registry)
    {
        for (sgNativeMeta const& meta : builtins)
        {
            if (!registry.registerNative(meta))
                return false;
        }
        return true;
    }
} // namespace surge
