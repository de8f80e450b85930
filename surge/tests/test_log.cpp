// surge

#include <catch2/catch.hpp>

#include "surge/alloc.hh"
#include "surge/assembler.hh"
#include "surge/graph.hh"
#include "surge/log.hh"
#include "surge/merge.hh"

#include "leak_alloc.hh"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

using namespace surge;

namespace {
    struct Captured
    {
        sgLogLevel level;
        std::string tag;
        std::string message;
    };

    void captureSink(sgLogEvent const& event, void* userData)
    {
        static_cast<std::vector<Captured>*>(userData)->push_back(
            Captured{.level = event.level, .tag = event.tag, .message = std::string(event.message, event.messageLength)});
    }
} // namespace

TEST_CASE("Logger", "[log]")
{
    std::vector<Captured> events;

    sgLogger logger;
    logger.setSink(captureSink, &events);

    SECTION("Disabled by default")
    {
        SG_LOG_ERROR(&logger, "test", "dropped");
        CHECK(events.empty());
        CHECK_FALSE(logger.enabled(sgLogLevel::Error, "test"));
    }

    SECTION("Enabled")
    {
        logger.enable();
        CHECK(logger.level() == sgLogLevel::Warn);

        SG_LOG_INFO(&logger, "test", "below the level");
        SG_LOG_WARN(&logger, "test", "{} + {} = {}", 1, 2, 3);
        SG_LOG_ERROR(&logger, "other", "error {}", "text");

        REQUIRE(events.size() == 2);
        CHECK(events[0].level == sgLogLevel::Warn);
        CHECK(events[0].tag == "test");
        CHECK(events[0].message == "1 + 2 = 3");
        CHECK(events[1].level == sgLogLevel::Error);
        CHECK(events[1].tag == "other");
        CHECK(events[1].message == "error text");

        SECTION("Level")
        {
            logger.setLevel(sgLogLevel::Trace);
            SG_LOG_TRACE(&logger, "test", "trace");
            CHECK(events.size() == 3);

            logger.setLevel(sgLogLevel::Off);
            SG_LOG_ERROR(&logger, "test", "off");
            CHECK(events.size() == 3);
        }

        SECTION("Tags")
        {
            CHECK(logger.allowTag("merge"));
            SG_LOG_ERROR(&logger, "dataize", "filtered");
            SG_LOG_ERROR(&logger, "merge", "kept");
            REQUIRE(events.size() == 3);
            CHECK(events[2].message == "kept");

            logger.clearTags();
            SG_LOG_ERROR(&logger, "dataize", "unfiltered");
            CHECK(events.size() == 4);
        }

        SECTION("Tag table limits")
        {
            CHECK_FALSE(logger.allowTag(""));
            CHECK_FALSE(logger.allowTag(std::string(sgLogger::tagCapacity, 't')));

            for (uint32_t index = 0; index != sgLogger::maxTags; ++index)
                CHECK(logger.allowTag(std::string("tag") + std::to_string(index)));
            CHECK_FALSE(logger.allowTag("one-more"));

            // allowing a known tag again is not a new entry
            CHECK(logger.allowTag("tag0"));

            SG_LOG_ERROR(&logger, "tag7", "kept");
            SG_LOG_ERROR(&logger, "one-more", "filtered");
            REQUIRE(events.size() == 3);
            CHECK(events[2].tag == "tag7");
        }

        SECTION("Disable")
        {
            logger.disable();
            SG_LOG_ERROR(&logger, "test", "dropped");
            CHECK(events.size() == 2);
        }

        SECTION("No sink")
        {
            logger.setSink(nullptr);
            CHECK_FALSE(logger.enabled(sgLogLevel::Error, "test"));
            SG_LOG_ERROR(&logger, "test", "dropped");
            CHECK(events.size() == 2);
        }
    }

    SECTION("Null logger")
    {
        sgLogger* none = nullptr;
        SG_LOG_ERROR(none, "test", "nothing");
        CHECK(events.empty());
    }

    SECTION("Level names")
    {
        CHECK(std::strcmp(sgLogLevelName(sgLogLevel::Trace), "trace") == 0);
        CHECK(std::strcmp(sgLogLevelName(sgLogLevel::Warn), "warn") == 0);
        CHECK(std::strcmp(sgLogLevelName(sgLogLevel::Off), "off") == 0);
    }

    SECTION("Components log through the graph's logger")
    {
        test::LeakTestAllocator alloc;

        logger.enable();
        logger.setLevel(sgLogLevel::Info);

        sgGraph* base = sgCreateGraph(alloc);
        sgGraph* incoming = sgCreateGraph(alloc);
        sgAssembler* assembler = sgCreateAssembler(alloc);
        base->setLogger(&logger);

        REQUIRE(assembler->assemble(*base, "ADD(ν1); BIND(ν0, ν1, a);"));
        REQUIRE(assembler->assemble(*incoming, "ADD(ν1); BIND(ν0, ν1, a);"));

        sgError error;
        CHECK_FALSE(sgMerge(*base, *incoming, error));

        REQUIRE_FALSE(events.empty());
        CHECK(events.back().level == sgLogLevel::Warn);
        CHECK(events.back().tag == "merge");
        CHECK(events.back().message.find("'a'") != std::string::npos);

        sgDestroyAssembler(assembler);
        sgDestroyGraph(incoming);
        sgDestroyGraph(base);
    }
}
