#include <doctest/doctest.h>
#include "unimix/line_splitter.hpp"

#include <string>

using namespace unimix;

TEST_CASE("Newline framing splits lines and keeps partial input across feeds") {
    LineSplitter sp(TextFraming::Newline, 4096);

    auto a = sp.feed(std::string("{\"a\":1}\n{\"b\""));
    REQUIRE(a.lines.size() == 1);
    CHECK(a.lines[0] == "{\"a\":1}");
    CHECK(sp.pending() == 4);

    auto b = sp.feed(std::string(":2}\n"));
    REQUIRE(b.lines.size() == 1);
    CHECK(b.lines[0] == "{\"b\":2}");
    CHECK(sp.pending() == 0);
}

TEST_CASE("CR is stripped and blank lines are skipped") {
    LineSplitter sp(TextFraming::Newline, 4096);
    auto out = sp.feed(std::string("\r\n  \n{\"x\":1}\r\n\n"));
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{\"x\":1}");
    CHECK(out.errors.empty());
}

TEST_CASE("An over-long line is one overflow and the following line survives") {
    LineSplitter sp(TextFraming::Newline, 8);
    auto out = sp.feed(std::string("{\"0123456789\"}\n{}\n"));
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::BufferOverflow);
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{}");
}

TEST_CASE("A line of exactly the maximum length is accepted") {
    LineSplitter sp(TextFraming::Newline, 6);
    auto out = sp.feed(std::string("{\"a\":}\n"));
    CHECK(out.errors.empty());
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{\"a\":}");
}

TEST_CASE("Noise ahead of the JSON object is cut and chatter lines are skipped") {
    LineSplitter sp(TextFraming::Newline, 4096);
    auto out = sp.feed(std::string("ets Jun  8 2016 00:22:57\n\x80\x81{\"a\":1}\nready\n"));
    CHECK(out.errors.empty());
    CHECK(out.skipped == 2);
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{\"a\":1}");
}

TEST_CASE("Marker framing extracts bodies and ignores bytes between them") {
    LineSplitter sp(TextFraming::Markers, 4096);
    auto out = sp.feed(std::string("boot noise <MSG>{\"a\":1}</MSG>\njunk<MSG>{\"b\":2}</MS"));
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{\"a\":1}");

    auto rest = sp.feed(std::string("G>"));
    REQUIRE(rest.lines.size() == 1);
    CHECK(rest.lines[0] == "{\"b\":2}");
}

TEST_CASE("Marker split across feeds is still recognized") {
    LineSplitter sp(TextFraming::Markers, 4096);
    CHECK(sp.feed(std::string("<M")).lines.empty());
    CHECK(sp.feed(std::string("SG>{}</")).lines.empty());
    auto out = sp.feed(std::string("MSG>"));
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{}");
}

TEST_CASE("Over-long marker body overflows once and the next body is read") {
    LineSplitter sp(TextFraming::Markers, 4);
    auto out = sp.feed(std::string("<MSG>0123456789</MSG><MSG>ok</MSG>"));
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::BufferOverflow);
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "ok");
}

TEST_CASE("wrap() adds the terminator for each framing") {
    CHECK(LineSplitter(TextFraming::Newline, 10).wrap("{}") == "{}\n");
    CHECK(LineSplitter(TextFraming::Markers, 10).wrap("{}") == "<MSG>{}</MSG>\n");
}

TEST_CASE("reset() drops pending text") {
    LineSplitter sp(TextFraming::Newline, 100);
    sp.feed(std::string("{\"half"));
    sp.reset();
    auto out = sp.feed(std::string("{}\n"));
    REQUIRE(out.lines.size() == 1);
    CHECK(out.lines[0] == "{}");
}

TEST_CASE("Text framing names parse case-insensitively") {
    TextFraming f = TextFraming::Newline;
    CHECK(parse_text_framing("MARKERS", f));
    CHECK(f == TextFraming::Markers);
    CHECK(parse_text_framing("newline", f));
    CHECK(f == TextFraming::Newline);
    CHECK_FALSE(parse_text_framing("xml", f));
    CHECK(std::string(to_string(TextFraming::Markers)) == "markers");
}
