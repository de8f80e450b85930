// surge

#include <catch2/catch.hpp>

#include "surge/alloc.hh"
#include "surge/assembler.hh"
#include "surge/dataize.hh"
#include "surge/graph.hh"
#include "surge/image.hh"
#include "surge/native.hh"

#include "image_internal.hh"
#include "leak_alloc.hh"
#include "utility.hh"

#include <cstring>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

using namespace surge;

namespace {
    // word-aligned copy of an image block, so it can be damaged and revalidated
    struct ImageCopy
    {
        explicit ImageCopy(sgImage const* image) : size(sgImageSize(image)), words((size + 7) / 8)
        {
            std::memcpy(words.data(), sgImageBytes(image), size);
        }

        uint8_t* bytes() noexcept { return reinterpret_cast<uint8_t*>(words.data()); }
        sgImageHeader* header() noexcept { return reinterpret_cast<sgImageHeader*>(words.data()); }

        uint32_t size = 0;
        std::vector<uint64_t> words;
    };

    bool sameGraph(sgGraph const& lhs, sgGraph const& rhs)
    {
        if (lhs.vertexCount() != rhs.vertexCount() || lhs.edgeCount() != rhs.edgeCount())
            return false;

        for (uint32_t index = 0; index != lhs.vertexCount(); ++index)
        {
            sgVertexId const vertex = lhs.vertexAt(index);
            if (rhs.vertexAt(index) != vertex)
                return false;

            sgBytes left;
            sgBytes right;
            bool const leftData = lhs.data(vertex, left);
            if (leftData != rhs.data(vertex, right))
                return false;
            if (leftData && (left.size != right.size || (left.size != 0 && std::memcmp(left.data, right.data, left.size) != 0)))
                return false;

            sgEdgeId leftEdge = lhs.firstEdge(vertex);
            sgEdgeId rightEdge = rhs.firstEdge(vertex);
            while (leftEdge != sgInvalidEdgeId && rightEdge != sgInvalidEdgeId)
            {
                sgEdge const a = lhs.edge(leftEdge);
                sgEdge const b = rhs.edge(rightEdge);
                if (a.to != b.to || !sgNameEquals(a.name, b.name))
                    return false;

                leftEdge = lhs.nextEdge(leftEdge);
                rightEdge = rhs.nextEdge(rightEdge);
            }
            if (leftEdge != rightEdge)
                return false;
        }

        return true;
    }
} // namespace

TEST_CASE("Image", "[image]")
{
    test::LeakTestAllocator alloc;

    sgGraph* graph = sgCreateGraph(alloc);
    sgAssembler* assembler = sgCreateAssembler(alloc);

    char const source[] =
        "ADD(ν1); ADD(ν2); ADD(ν7);\n"
        "BIND(ν0, ν1, foo); BIND(ν1, ν2, π); BIND(ν1, ν0, ρ); BIND(ν0, ν7, bär);\n"
        "PUT(ν2, 00-00-00-00-00-00-00-2A); PUT(ν7, --); PUT(ν0, string/root);\n";
    REQUIRE(assembler->assemble(*graph, source));

    sgImage* image = sgBuildImage(alloc, *graph);
    REQUIRE(image != nullptr);
    CHECK(sgImageSize(image) > sizeof(sgImageHeader));
    CHECK(sgValidateImage(sgImageBytes(image), sgImageSize(image)));

    sgError error;

    SECTION("Round trip")
    {
        sgGraph* loaded = sgLoadImage(alloc, sgImageBytes(image), sgImageSize(image), error);
        REQUIRE(loaded != nullptr);
        CHECK(sameGraph(*graph, *loaded));
        CHECK(loaded->nextVertexId() == sgVertexId{8});

        // the loaded graph is an ordinary graph
        sgError addError;
        CHECK(loaded->add(sgVertexId{8}, addError));
        CHECK_FALSE(loaded->add(sgVertexId{7}, addError));

        sgDestroyGraph(loaded);
    }

    SECTION("Loaded programs dataize the same")
    {
        // forty.inc and six.times(six.inc)
        char const program[] =
            "ADD($int); BIND(ν0, $int, int);\n"
            "ADD($inc); BIND($int, $inc, inc); BIND($inc, $int, ρ);\n"
            "ADD($incL); PUT($incL, string/inc); BIND($inc, $incL, λ);\n"
            "ADD($times); BIND($int, $times, times); BIND($times, $int, ρ);\n"
            "ADD($timesL); PUT($timesL, string/times); BIND($times, $timesL, λ);\n"
            "ADD($forty); BIND(ν0, $forty, forty); BIND($forty, $int, π); PUT($forty, int/41);\n"
            "ADD($next); BIND(ν0, $next, next); BIND($next, $forty, β); PUT($next, string/inc);\n"
            "ADD($six); BIND(ν0, $six, six); BIND($six, $int, π); PUT($six, int/6);\n"
            "ADD($foo); BIND(ν0, $foo, foo);\n"
            "ADD($callee); BIND($foo, $callee, ε); BIND($callee, $six, β); PUT($callee, string/times);\n"
            "ADD($arg); BIND($foo, $arg, α0); BIND($arg, $six, β); PUT($arg, string/inc);\n";

        sgGraph* source = sgCreateGraph(alloc);
        REQUIRE(assembler->assemble(*source, program));

        sgImage* programImage = sgBuildImage(alloc, *source);
        REQUIRE(programImage != nullptr);
        sgGraph* loaded = sgLoadImage(alloc, sgImageBytes(programImage), sgImageSize(programImage), error);
        REQUIRE(loaded != nullptr);

        sgNativeRegistry* registry = sgCreateNativeRegistry(alloc);
        REQUIRE(sgRegisterBuiltins(*registry));

        sgDataizer* fromSource = sgCreateDataizer(alloc, *registry, *source);
        sgDataizer* fromImage = sgCreateDataizer(alloc, *registry, *loaded);

        for (char const* const locator : {"Φ.next", "Φ.foo"})
        {
            CAPTURE(locator);

            sgBytes expected;
            REQUIRE(fromSource->dataizeLocator(locator, nullptr, expected));
            std::vector<uint8_t> const kept(expected.data, expected.data + expected.size);

            sgBytes actual;
            REQUIRE(fromImage->dataizeLocator(locator, nullptr, actual));
            CHECK(std::vector<uint8_t>(actual.data, actual.data + actual.size) == kept);
            REQUIRE(actual.size == 8);
            CHECK(sgLoadBigEndian64(actual.data) == 42);
        }

        sgDestroyDataizer(fromImage);
        sgDestroyDataizer(fromSource);
        sgDestroyNativeRegistry(registry);
        sgDestroyGraph(loaded);
        sgDestroyImage(programImage);
        sgDestroyGraph(source);
    }

    SECTION("Empty graph")
    {
        sgGraph* empty = sgCreateGraph(alloc);
        sgImage* emptyImage = sgBuildImage(alloc, *empty);
        CHECK(sgValidateImage(sgImageBytes(emptyImage), sgImageSize(emptyImage)));

        sgGraph* loaded = sgLoadImage(alloc, sgImageBytes(emptyImage), sgImageSize(emptyImage), error);
        REQUIRE(loaded != nullptr);
        CHECK(loaded->vertexCount() == 1);
        CHECK(loaded->edgeCount() == 0);

        sgDestroyGraph(loaded);
        sgDestroyImage(emptyImage);
        sgDestroyGraph(empty);
    }

    SECTION("Damaged images are rejected")
    {
        ImageCopy copy(image);
        REQUIRE(sgValidateImage(copy.bytes(), copy.size));

        SECTION("Flipped byte")
        {
            copy.bytes()[copy.size - 1] ^= 0x5a;
        }

        SECTION("Bad magic")
        {
            copy.header()->magic = 0;
        }

        SECTION("Future version")
        {
            copy.header()->version = sgImageVersion + 1;
        }

        SECTION("Truncated")
        {
            copy.size -= 8;
        }

        SECTION("Too small for a header")
        {
            copy.size = sizeof(sgImageHeader) - 1;
        }

        CHECK_FALSE(sgValidateImage(copy.bytes(), copy.size));

        sgGraph* loaded = sgLoadImage(alloc, copy.bytes(), copy.size, error);
        CHECK(loaded == nullptr);
        CHECK(error.code == sgErrorCode::CorruptImage);
    }

    SECTION("Files")
    {
        std::filesystem::path const path = std::filesystem::temp_directory_path() / "surge-test-image.sodg";
        std::string const pathText = path.string();

        REQUIRE(sgSaveGraph(alloc, *graph, pathText.c_str(), error));
        CHECK(std::filesystem::file_size(path) == sgImageSize(image));

        sgGraph* loaded = sgLoadGraph(alloc, pathText.c_str(), error);
        REQUIRE(loaded != nullptr);
        CHECK(sameGraph(*graph, *loaded));
        sgDestroyGraph(loaded);

        std::filesystem::remove(path);

        SECTION("Missing file")
        {
            CHECK(sgLoadGraph(alloc, pathText.c_str(), error) == nullptr);
            CHECK(error.code == sgErrorCode::ReadFailed);
            // the name holds the path, truncated when long
            CHECK(pathText.rfind(error.name, 0) == 0);
        }
    }

    SECTION("Unwritable path")
    {
        std::filesystem::path const path = std::filesystem::temp_directory_path() / "surge-no-such-dir" / "image.sodg";
        std::string const pathText = path.string();

        CHECK_FALSE(sgSaveGraph(alloc, *graph, pathText.c_str(), error));
        CHECK(error.code == sgErrorCode::WriteFailed);
    }

    sgDestroyImage(image);
    sgDestroyAssembler(assembler);
    sgDestroyGraph(graph);
}
