// surge

#include <catch2/catch.hpp>

#include "surge/alloc.hh"
#include "surge/assembler.hh"
#include "surge/dataize.hh"
#include "surge/graph.hh"
#include "surge/native.hh"

#include "leak_alloc.hh"
#include "utility.hh"

#include <cstring>
#include <initializer_list>
#include <string>

using namespace surge;

namespace {
    // a minimal integer prototype: int.inc and int.times backed by the built-ins
    static constexpr char const intPrelude[] =
        "ADD($int); BIND(ν0, $int, int);\n"
        "ADD($inc); BIND($int, $inc, inc); BIND($inc, $int, ρ);\n"
        "ADD($incL); PUT($incL, string/inc); BIND($inc, $incL, λ);\n"
        "ADD($times); BIND($int, $times, times); BIND($times, $int, ρ);\n"
        "ADD($timesL); PUT($timesL, string/times); BIND($times, $timesL, λ);\n";

    int64_t asInt(sgBytes bytes) noexcept
    {
        if (bytes.size != 8)
            return -1;
        return static_cast<int64_t>(sgLoadBigEndian64(bytes.data));
    }

    bool bytesEqual(sgBytes bytes, std::initializer_list<uint8_t> expected) noexcept
    {
        return bytes.size == expected.size() && (bytes.size == 0 || std::memcmp(bytes.data, expected.begin(), bytes.size) == 0);
    }

    bool run(sgDataizer& dataizer, char const* locator, sgBytes& out_bytes)
    {
        return dataizer.dataizeLocator(locator, nullptr, out_bytes);
    }

    struct Counter
    {
        uint32_t calls = 0;
    };

    // returns 8 bytes holding the number of calls so far
    bool nativeCount(sgNativeContext& ctx, void* userData)
    {
        Counter& counter = *static_cast<Counter*>(userData);
        ++counter.calls;

        uint8_t* const out = ctx.resultBuffer(8);
        sgStoreBigEndian64(counter.calls, out);
        return true;
    }

    // fails the first time it is called, succeeds afterwards
    bool nativeFlaky(sgNativeContext& ctx, void* userData)
    {
        Counter& counter = *static_cast<Counter*>(userData);
        if (counter.calls++ == 0)
        {
            ctx.fail(sgErrorCode::NativeFailure);
            return false;
        }

        ctx.result(sgBytes{});
        return true;
    }

    void captureOutput(sgBytes bytes, void* userData)
    {
        static_cast<std::string*>(userData)->append(reinterpret_cast<char const*>(bytes.data), bytes.size);
    }
} // namespace

TEST_CASE("Dataizer", "[dataize]")
{
    test::LeakTestAllocator alloc;

    sgGraph* graph = sgCreateGraph(alloc);
    sgAssembler* assembler = sgCreateAssembler(alloc);
    sgNativeRegistry* registry = sgCreateNativeRegistry(alloc);
    REQUIRE(sgRegisterBuiltins(*registry));

    sgDataizer* dataizer = sgCreateDataizer(alloc, *registry, *graph);

    sgBytes bytes;

    SECTION("Literal payload")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($x); BIND(ν0, $x, x); PUT($x, 00-2A);"));

        REQUIRE(run(*dataizer, "Φ.x", bytes));
        CHECK(bytesEqual(bytes, {0x00, 0x2a}));

        // the Φ prefix is optional and Q is an alias for it
        REQUIRE(run(*dataizer, "x", bytes));
        CHECK(bytesEqual(bytes, {0x00, 0x2a}));
        REQUIRE(run(*dataizer, "Q.x", bytes));
        CHECK(bytesEqual(bytes, {0x00, 0x2a}));
    }

    SECTION("Literal through Δ")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($d); BIND(ν0, $d, d); ADD($data); PUT($data, 01-02); BIND($d, $data, Δ);"));

        REQUIRE(run(*dataizer, "Φ.d", bytes));
        CHECK(bytesEqual(bytes, {0x01, 0x02}));
    }

    SECTION("Empty literal")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($e); BIND(ν0, $e, e); PUT($e, --);"));

        REQUIRE(run(*dataizer, "Φ.e", bytes));
        CHECK(bytes.size == 0);
    }

    SECTION("Literal inherited through π")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($a); BIND(ν0, $a, a); PUT($a, 07); ADD($b); BIND(ν0, $b, b); BIND($b, $a, π);"));

        REQUIRE(run(*dataizer, "Φ.b", bytes));
        CHECK(bytesEqual(bytes, {0x07}));
    }

    SECTION("Method call on a dispatch")
    {
        std::string const source = std::string(intPrelude) +
            "ADD($x); BIND(ν0, $x, x); BIND($x, $int, π); PUT($x, int/41);\n"
            "ADD($y); BIND(ν0, $y, y); BIND($y, $x, β); PUT($y, string/inc);\n";
        REQUIRE(assembler->assemble(*graph, source.c_str()));

        REQUIRE(run(*dataizer, "Φ.y", bytes));
        CHECK(asInt(bytes) == 42);

        // the prototype's inc was copied into x with x as its context
        sgVertexId x = sgInvalidVertexId;
        REQUIRE(assembler->lookupAlias("x", x));
        sgVertexId inc = sgInvalidVertexId;
        sgVertexId copy = sgInvalidVertexId;
        REQUIRE(assembler->lookupAlias("inc", inc));
        REQUIRE(graph->attr(x, sgName{"inc"}, copy));
        CHECK(copy != inc);

        sgVertexId context = sgInvalidVertexId;
        REQUIRE(graph->attr(copy, sgName{sgAttr::rho}, context));
        CHECK(context == x);

        SECTION("Locator walk without a dispatch vertex")
        {
            REQUIRE(run(*dataizer, "Φ.x.inc", bytes));
            CHECK(asInt(bytes) == 42);
        }

        SECTION("By vertex")
        {
            sgVertexId y = sgInvalidVertexId;
            REQUIRE(assembler->lookupAlias("y", y));
            REQUIRE(dataizer->dataize(y, bytes));
            CHECK(asInt(bytes) == 42);
        }
    }

    SECTION("Application carries its literal")
    {
        // int(Δ=41).inc
        std::string source = std::string(intPrelude) + "ADD($inst); BIND($inst, $int, ε);\n";

        SECTION("Through Δ")
        {
            source += "ADD($lit); PUT($lit, int/41); BIND($inst, $lit, Δ);\n";
        }

        SECTION("As its own payload")
        {
            source += "PUT($inst, int/41);\n";
        }

        source += "ADD($foo); BIND(ν0, $foo, foo); BIND($foo, $inst, β); PUT($foo, string/inc);\n";
        REQUIRE(assembler->assemble(*graph, source.c_str()));

        REQUIRE(run(*dataizer, "Φ.foo", bytes));
        CHECK(asInt(bytes) == 42);

        // the literal went to the instance, not to the callee
        CHECK_FALSE(run(*dataizer, "Φ.int", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::AttributeNotFound);
    }

    SECTION("Application with a dispatched argument")
    {
        // six.times(six.inc)
        std::string const source = std::string(intPrelude) +
            "ADD($six); BIND(ν0, $six, six); BIND($six, $int, π); PUT($six, int/6);\n"
            "ADD($foo); BIND(ν0, $foo, foo);\n"
            "ADD($callee); BIND($foo, $callee, ε); BIND($callee, $six, β); PUT($callee, string/times);\n"
            "ADD($arg); BIND($foo, $arg, α0); BIND($arg, $six, β); PUT($arg, string/inc);\n";
        REQUIRE(assembler->assemble(*graph, source.c_str()));

        REQUIRE(run(*dataizer, "Φ.foo", bytes));
        CHECK(asInt(bytes) == 42);
    }

    SECTION("Copies see their own context")
    {
        // o.x is ξ.y; o2 inherits o and binds y, o3 applies o with y
        char const source[] =
            "ADD($o); BIND(ν0, $o, o);\n"
            "ADD($y); BIND($o, $y, y);\n"
            "ADD($x); BIND($o, $x, x); BIND($x, $o, ρ); BIND($x, $o, ξ); PUT($x, string/y);\n"
            "ADD($v); BIND(ν0, $v, v); PUT($v, 00-07);\n"
            "ADD($o2); BIND(ν0, $o2, o2); BIND($o2, $o, π); BIND($o2, $v, y);\n"
            "ADD($o3); BIND(ν0, $o3, o3); BIND($o3, $o, ε); BIND($o3, $v, y);\n";
        REQUIRE(assembler->assemble(*graph, source));

        SECTION("Inherited")
        {
            REQUIRE(run(*dataizer, "Φ.o2.x", bytes));
            CHECK(bytesEqual(bytes, {0x00, 0x07}));
        }

        SECTION("Applied")
        {
            REQUIRE(run(*dataizer, "Φ.o3.x", bytes));
            CHECK(bytesEqual(bytes, {0x00, 0x07}));
        }

        SECTION("The prototype itself has no value")
        {
            CHECK_FALSE(run(*dataizer, "Φ.o.x", bytes));
            REQUIRE(dataizer->getErrorCount() == 1);
            CHECK(dataizer->getError(0).code == sgErrorCode::AttributeNotFound);
            CHECK(std::strcmp(dataizer->getError(0).name, "Δ") == 0);

            sgVertexId y = sgInvalidVertexId;
            REQUIRE(assembler->lookupAlias("y", y));
            CHECK(dataizer->getError(0).vertex == y);
        }

        SECTION("Locate")
        {
            sgVertexId v = sgInvalidVertexId;
            REQUIRE(assembler->lookupAlias("v", v));

            sgVertexId located = sgInvalidVertexId;
            REQUIRE(dataizer->locate("o2.x", nullptr, located));
            CHECK(located == v);
        }
    }

    SECTION("Copy of a prototype reached through a dispatch")
    {
        // o2 copies whatever ref evaluates to and overrides y
        char const source[] =
            "ADD($o); BIND(ν0, $o, o);\n"
            "ADD($y); BIND($o, $y, y);\n"
            "ADD($x); BIND($o, $x, x); BIND($x, $o, ρ); BIND($x, $o, ξ); PUT($x, string/y);\n"
            "ADD($v); BIND(ν0, $v, v); PUT($v, 00-07);\n"
            "ADD($ref); BIND(ν0, $ref, ref); BIND($ref, ν0, β); PUT($ref, string/o);\n"
            "ADD($o2); BIND(ν0, $o2, o2); BIND($o2, $ref, π); BIND($o2, $v, y);\n";
        REQUIRE(assembler->assemble(*graph, source));

        REQUIRE(run(*dataizer, "Φ.o2.x", bytes));
        CHECK(bytesEqual(bytes, {0x00, 0x07}));

        // the copy is a new object; o itself is untouched
        sgVertexId o = sgInvalidVertexId;
        sgVertexId o2 = sgInvalidVertexId;
        REQUIRE(dataizer->locate("ref", nullptr, o));
        REQUIRE(dataizer->locate("o2", nullptr, o2));
        CHECK(o2 != o);

        sgVertexId prototype = sgInvalidVertexId;
        REQUIRE(graph->attr(o2, sgName{sgAttr::pi}, prototype));
        CHECK(prototype == o);
        CHECK_FALSE(run(*dataizer, "Φ.o.x", bytes));
    }

    SECTION("Out of vertex identifiers")
    {
        std::string const source = std::string(intPrelude) +
            "ADD($x); BIND(ν0, $x, x); BIND($x, $int, π); PUT($x, int/41);\n"
            "ADD($y); BIND(ν0, $y, y); BIND($y, $x, β); PUT($y, string/inc);\n";
        REQUIRE(assembler->assemble(*graph, source.c_str()));

        // x.inc needs a fresh copy, and none is left
        sgError error;
        REQUIRE(graph->add(sgVertexId{sgVertexId::invalid_value - 1}, error));

        CHECK_FALSE(run(*dataizer, "Φ.y", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::IdsExhausted);
    }

    SECTION("Decoratee")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($a); BIND(ν0, $a, a); PUT($a, 0A); ADD($w); BIND(ν0, $w, w); BIND($w, $a, φ);"));

        REQUIRE(run(*dataizer, "Φ.w", bytes));
        CHECK(bytesEqual(bytes, {0x0a}));
    }

    SECTION("Cycle")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($a); ADD($b); BIND(ν0, $a, a); BIND(ν0, $b, b); BIND($a, $b, φ); BIND($b, $a, φ);"));

        CHECK_FALSE(run(*dataizer, "Φ.a", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::CyclicDataization);

        // failures are remembered, not retried
        CHECK_FALSE(run(*dataizer, "Φ.b", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::CyclicDataization);
    }

    SECTION("Self dispatch")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($a); BIND(ν0, $a, a); BIND($a, $a, β); PUT($a, string/x);"));

        CHECK_FALSE(run(*dataizer, "Φ.a", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::CyclicDataization);
    }

    SECTION("Missing attribute")
    {
        CHECK_FALSE(run(*dataizer, "Φ.nothing", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::AttributeNotFound);
        CHECK(dataizer->getError(0).vertex == sgRootVertexId);
        CHECK(std::strcmp(dataizer->getError(0).name, "nothing") == 0);
    }

    SECTION("Empty locator step")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($x); BIND(ν0, $x, x); PUT($x, 01);"));

        CHECK_FALSE(run(*dataizer, "Φ..x", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::AttributeNotFound);
    }

    SECTION("Unknown native")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($f); BIND(ν0, $f, f); ADD($l); PUT($l, string/nope); BIND($f, $l, λ);"));

        CHECK_FALSE(run(*dataizer, "Φ.f", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::UnknownNative);
        CHECK(std::strcmp(dataizer->getError(0).name, "nope") == 0);
    }

    SECTION("Native type mismatch")
    {
        std::string const source = std::string(intPrelude) +
            "ADD($x); BIND(ν0, $x, x); BIND($x, $int, π); PUT($x, 01);\n"
            "ADD($y); BIND(ν0, $y, y); BIND($y, $x, β); PUT($y, string/inc);\n";
        REQUIRE(assembler->assemble(*graph, source.c_str()));

        CHECK_FALSE(run(*dataizer, "Φ.y", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::NativeTypeMismatch);
    }

    SECTION("Method without a receiver")
    {
        REQUIRE(assembler->assemble(*graph, "ADD($f); BIND(ν0, $f, f); ADD($l); PUT($l, string/inc); BIND($f, $l, λ);"));

        CHECK_FALSE(run(*dataizer, "Φ.f", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::AttributeNotFound);
        CHECK(std::strcmp(dataizer->getError(0).name, "ρ") == 0);
    }

    SECTION("Arguments are dataized left to right")
    {
        std::string output;
        registry->setOutput(captureOutput, &output);

        char const source[] =
            "ADD($out); PUT($out, string/stdout);\n"
            "ADD($cat); PUT($cat, string/concat);\n"
            "ADD($sa); BIND($sa, $out, λ); ADD($a); PUT($a, string/a); BIND($sa, $a, α0);\n"
            "ADD($sb); BIND($sb, $out, λ); ADD($b); PUT($b, string/b); BIND($sb, $b, α0);\n"
            "ADD($both); BIND(ν0, $both, both); BIND($both, $cat, λ); BIND($both, $sa, ρ); BIND($both, $sb, α0);\n";
        REQUIRE(assembler->assemble(*graph, source));

        REQUIRE(run(*dataizer, "Φ.both", bytes));
        CHECK(bytesEqual(bytes, {'a', 'b'}));
        CHECK(output == "ab");

        // cached; the side effects do not repeat
        REQUIRE(run(*dataizer, "Φ.both", bytes));
        CHECK(output == "ab");
    }

    SECTION("Cached values are reused")
    {
        Counter counter;
        REQUIRE(registry->registerNative(
            sgNativeMeta{.name = "count", .function = nativeCount, .kind = sgNativeKind::Function, .userData = &counter}));

        REQUIRE(assembler->assemble(*graph, "ADD($c); BIND(ν0, $c, c); ADD($l); PUT($l, string/count); BIND($c, $l, λ);"));

        REQUIRE(run(*dataizer, "Φ.c", bytes));
        CHECK(asInt(bytes) == 1);
        REQUIRE(run(*dataizer, "Φ.c", bytes));
        CHECK(asInt(bytes) == 1);
        CHECK(counter.calls == 1);
    }

    SECTION("Failed vertices are not retried")
    {
        Counter counter;
        REQUIRE(registry->registerNative(
            sgNativeMeta{.name = "flaky", .function = nativeFlaky, .kind = sgNativeKind::Function, .userData = &counter}));

        REQUIRE(assembler->assemble(*graph, "ADD($f); BIND(ν0, $f, f); ADD($l); PUT($l, string/flaky); BIND($f, $l, λ);"));

        CHECK_FALSE(run(*dataizer, "Φ.f", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::NativeFailure);

        CHECK_FALSE(run(*dataizer, "Φ.f", bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).code == sgErrorCode::NativeFailure);
        CHECK(counter.calls == 1);
    }

    SECTION("Depth limit")
    {
        // d0.φ = d1, d1.φ = d2, ... with a literal at the end
        sgError error;
        sgVertexId previous = sgInvalidVertexId;
        for (uint32_t index = 0; index != 32; ++index)
        {
            sgVertexId const vertex{100 + index};
            REQUIRE(graph->add(vertex, error));
            if (previous != sgInvalidVertexId)
                REQUIRE(graph->bind(previous, vertex, sgName{sgAttr::phi}, error));
            previous = vertex;
        }
        uint8_t const last = 0x11;
        REQUIRE(graph->put(previous, sgBytes{.data = &last, .size = 1}, error));

        SECTION("Within the limit")
        {
            REQUIRE(dataizer->dataize(sgVertexId{100}, bytes));
            CHECK(bytesEqual(bytes, {0x11}));
        }

        SECTION("Beyond the limit")
        {
            dataizer->setConfig(sgDataizeConfig{.maxDepth = 16});

            CHECK_FALSE(dataizer->dataize(sgVertexId{100}, bytes));
            REQUIRE(dataizer->getErrorCount() == 1);
            CHECK(dataizer->getError(0).code == sgErrorCode::DepthExceeded);
        }
    }

    SECTION("Unknown vertex")
    {
        CHECK_FALSE(dataizer->dataize(sgVertexId{999}, bytes));
        REQUIRE(dataizer->getErrorCount() == 1);
        CHECK(dataizer->getError(0).vertex == sgVertexId{999});
    }

    sgDestroyDataizer(dataizer);
    sgDestroyNativeRegistry(registry);
    sgDestroyAssembler(assembler);
    sgDestroyGraph(graph);
}
