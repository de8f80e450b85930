// surge

#include <catch2/catch.hpp>

#include "surge/alloc.hh"
#include "surge/assembler.hh"
#include "surge/graph.hh"

#include "leak_alloc.hh"
#include "utility.hh"

#include <cstring>
#include <initializer_list>

using namespace surge;

namespace {
    bool payloadEquals(sgGraph const& graph, sgVertexId vertex, std::initializer_list<uint8_t> expected)
    {
        sgBytes bytes;
        if (!graph.data(vertex, bytes) || bytes.size != expected.size())
            return false;
        return expected.size() == 0 || std::memcmp(bytes.data, expected.begin(), bytes.size) == 0;
    }

    sgVertexId attrOf(sgGraph const& graph, sgVertexId from, char const* name)
    {
        sgVertexId target = sgInvalidVertexId;
        if (!graph.attr(from, sgName{name}, target))
            return sgInvalidVertexId;
        return target;
    }
} // namespace

TEST_CASE("Assembler", "[assembler]")
{
    test::LeakTestAllocator alloc;

    sgGraph* graph = sgCreateGraph(alloc);
    sgAssembler* assembler = sgCreateAssembler(alloc);

    SECTION("Literal vertices")
    {
        char const source[] =
            "ADD(ν0);\n"
            "ADD(ν1);\n"
            "BIND(ν0, ν1, foo);\n"
            "PUT(ν1, 00-00-00-00-00-00-00-2A);\n";

        REQUIRE(assembler->assemble(*graph, source));
        CHECK(assembler->instructionCount() == 4);
        CHECK(assembler->getErrorCount() == 0);

        CHECK(graph->vertexCount() == 2);
        CHECK(attrOf(*graph, sgRootVertexId, "foo") == sgVertexId{1});
        CHECK(payloadEquals(*graph, sgVertexId{1}, {0, 0, 0, 0, 0, 0, 0, 0x2a}));
    }

    SECTION("ASCII vertex spelling")
    {
        REQUIRE(assembler->assemble(*graph, "ADD(v3); BIND(v0, v3, x); ADD(4); BIND(3, 4, y);"));
        CHECK(attrOf(*graph, sgRootVertexId, "x") == sgVertexId{3});
        CHECK(attrOf(*graph, sgVertexId{3}, "y") == sgVertexId{4});
    }

    SECTION("Aliases")
    {
        char const source[] =
            "ADD($ν1);  # first\n"
            "ADD($ν2);\n"
            "BIND(ν0, $ν1, a);\n"
            "BIND($ν1, $ν2, b);\n";

        REQUIRE(assembler->assemble(*graph, source));

        sgVertexId first = sgInvalidVertexId;
        sgVertexId second = sgInvalidVertexId;
        REQUIRE(assembler->lookupAlias("$ν1", first));
        REQUIRE(assembler->lookupAlias("ν2", second));
        CHECK(first != second);
        CHECK(first != sgRootVertexId);

        CHECK(attrOf(*graph, sgRootVertexId, "a") == first);
        CHECK(attrOf(*graph, first, "b") == second);

        sgVertexId missing = sgInvalidVertexId;
        CHECK_FALSE(assembler->lookupAlias("$ν3", missing));

        SECTION("Aliases are scoped to one unit")
        {
            REQUIRE(assembler->assemble(*graph, "ADD($ν1); BIND(ν0, $ν1, c);"));

            sgVertexId again = sgInvalidVertexId;
            REQUIRE(assembler->lookupAlias("$ν1", again));
            CHECK(again != first);
            CHECK(again != second);
            CHECK(attrOf(*graph, sgRootVertexId, "c") == again);
        }
    }

    SECTION("Aliases start above existing vertices")
    {
        REQUIRE(assembler->assemble(*graph, "ADD(ν7); ADD($x); BIND(ν0, $x, x);"));

        sgVertexId alias = sgInvalidVertexId;
        REQUIRE(assembler->lookupAlias("x", alias));
        CHECK(alias.value() > 7);
    }

    SECTION("Custom root")
    {
        sgError error;
        REQUIRE(graph->add(sgVertexId{50}, error));

        assembler->setRoot(sgVertexId{50});
        REQUIRE(assembler->assemble(*graph, "ADD(ν0); ADD($a); BIND(ν0, $a, inner);"));

        CHECK(attrOf(*graph, sgVertexId{50}, "inner") != sgInvalidVertexId);
        CHECK(attrOf(*graph, sgRootVertexId, "inner") == sgInvalidVertexId);
    }

    SECTION("Four argument BIND and DATA")
    {
        REQUIRE(assembler->assemble(*graph, "ADD(ν1); BIND(e1, ν0, ν1, foo); DATA(ν1, 01-02);"));
        CHECK(attrOf(*graph, sgRootVertexId, "foo") == sgVertexId{1});
        CHECK(payloadEquals(*graph, sgVertexId{1}, {1, 2}));
    }

    SECTION("Keywords are case insensitive")
    {
        REQUIRE(assembler->assemble(*graph, "add(ν1); bind(ν0, ν1, foo); put(ν1, FF);"));
        CHECK(payloadEquals(*graph, sgVertexId{1}, {0xff}));
    }

    SECTION("Typed literals")
    {
        char const source[] =
            "ADD(ν1); PUT(ν1, int/42);\n"
            "ADD(ν2); PUT(ν2, int/-1);\n"
            "ADD(ν3); PUT(ν3, string/inc);\n"
            "ADD(ν4); PUT(ν4, bool/true);\n"
            "ADD(ν5); PUT(ν5, float/1.5);\n"
            "ADD(ν6); PUT(ν6, --);\n"
            "ADD(ν7); PUT(ν7, \"string/a\\tb\");\n"
            "ADD(ν8); PUT(ν8, 'string/\\u00e9');\n"
            "ADD(ν9); PUT(ν9, 00 01-02);\n"
            "ADD(ν10); PUT(ν10, bytes/);\n";

        REQUIRE(assembler->assemble(*graph, source));

        CHECK(payloadEquals(*graph, sgVertexId{1}, {0, 0, 0, 0, 0, 0, 0, 42}));
        CHECK(payloadEquals(*graph, sgVertexId{2}, {0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));
        CHECK(payloadEquals(*graph, sgVertexId{3}, {'i', 'n', 'c'}));
        CHECK(payloadEquals(*graph, sgVertexId{4}, {1}));
        CHECK(payloadEquals(*graph, sgVertexId{5}, {0x3f, 0xf8, 0, 0, 0, 0, 0, 0}));
        CHECK(payloadEquals(*graph, sgVertexId{6}, {}));
        CHECK(payloadEquals(*graph, sgVertexId{7}, {'a', '\t', 'b'}));
        CHECK(payloadEquals(*graph, sgVertexId{8}, {0xc3, 0xa9}));
        CHECK(payloadEquals(*graph, sgVertexId{9}, {0, 1, 2}));
        CHECK(payloadEquals(*graph, sgVertexId{10}, {}));
    }

    SECTION("Errors")
    {
        SECTION("Forward reference")
        {
            CHECK_FALSE(assembler->assemble(*graph, "ADD(ν1);\nBIND(ν1, $later, x);\nADD($later);"));
            REQUIRE(assembler->getErrorCount() == 1);
            CHECK(assembler->getError(0).code == sgErrorCode::UnknownVertex);
            CHECK(assembler->getError(0).line == 2);
            CHECK(std::strcmp(assembler->getError(0).name, "$later") == 0);
        }

        SECTION("Duplicate vertex")
        {
            CHECK_FALSE(assembler->assemble(*graph, "ADD(ν1);\n\nADD(ν1);"));
            REQUIRE(assembler->getErrorCount() == 1);
            CHECK(assembler->getError(0).code == sgErrorCode::DuplicateVertex);
            CHECK(assembler->getError(0).vertex == sgVertexId{1});
            CHECK(assembler->getError(0).line == 3);
        }

        SECTION("Duplicate attribute")
        {
            CHECK_FALSE(assembler->assemble(*graph, "ADD(ν1); ADD(ν2); BIND(ν0, ν1, x); BIND(ν0, ν2, x);"));
            REQUIRE(assembler->getErrorCount() == 1);
            CHECK(assembler->getError(0).code == sgErrorCode::DuplicateAttribute);
            CHECK(assembler->getError(0).vertex == sgRootVertexId);
            CHECK(std::strcmp(assembler->getError(0).name, "x") == 0);

            // instructions before the failure stay applied
            CHECK(assembler->instructionCount() == 3);
            CHECK(attrOf(*graph, sgRootVertexId, "x") == sgVertexId{1});
        }

        SECTION("Unknown vertex")
        {
            CHECK_FALSE(assembler->assemble(*graph, "BIND(ν0, ν9, x);"));
            REQUIRE(assembler->getErrorCount() == 1);
            CHECK(assembler->getError(0).code == sgErrorCode::UnknownVertex);
            CHECK(assembler->getError(0).vertex == sgVertexId{9});
        }

        SECTION("Out of identifiers")
        {
            CHECK_FALSE(assembler->assemble(*graph, "ADD(ν4294967294);\nADD($a);"));
            REQUIRE(assembler->getErrorCount() == 1);
            CHECK(assembler->getError(0).code == sgErrorCode::IdsExhausted);
            CHECK(assembler->getError(0).line == 2);
            CHECK(std::strcmp(assembler->getError(0).name, "$a") == 0);
        }

        SECTION("Root alias")
        {
            CHECK_FALSE(assembler->assemble(*graph, "ADD($ν0);"));
            REQUIRE(assembler->getErrorCount() == 1);
            CHECK(assembler->getError(0).code == sgErrorCode::Malformed);
        }

        SECTION("Syntax")
        {
            char const* const sources[] = {
                "ADD(ν1)",            // missing terminator
                "ADD ν1;",            // missing parenthesis
                "JUMP(ν1);",          // unknown instruction
                "ADD(ν1, ν2);",       // wrong arity
                "ADD(νx);",           // bad vertex
                "PUT(ν0, 0);",        // odd hex digit count
                "PUT(ν0, int/4x);",
                "PUT(ν0, 'string/open);",
                "PUT(ν0, bool/maybe);",
                "BIND(ν0, ν0);",
            };

            for (char const* const source : sources)
            {
                CAPTURE(source);
                CHECK_FALSE(assembler->assemble(*graph, source));
                REQUIRE(assembler->getErrorCount() == 1);
                CHECK(assembler->getError(0).code == sgErrorCode::Malformed);
            }
        }
    }

    SECTION("Comments and blank lines")
    {
        char const source[] =
            "# leading comment\n"
            "\n"
            "ADD(ν1); # trailing comment\n"
            "   \t\n"
            "BIND(ν0, ν1, foo);\n";

        REQUIRE(assembler->assemble(*graph, source));
        CHECK(assembler->instructionCount() == 2);
    }

    sgDestroyAssembler(assembler);
    sgDestroyGraph(graph);
}
