#include <doctest/doctest.h>
#include "qlink/normalizer.hpp"

using namespace qlink;

TEST_CASE("Sequence replies are kept element by element, blanks dropped") {
    RawReply r = Lines{"2", " M1\r", "", "M2"};
    CHECK((normalize(r) == Lines{"2", "M1", "M2"}));
}

TEST_CASE("Newline-joined string splits on LF and CRLF") {
    RawReply r = std::string("2\r\n1 S1 0 0 1.0 0 A\n\n1 S2 1 0 1.0 0 B\r\n");
    Lines out = normalize(r);
    REQUIRE(out.size() == 3);
    CHECK(out[0] == "2");
    CHECK(out[1] == "1 S1 0 0 1.0 0 A");
    CHECK(out[2] == "1 S2 1 0 1.0 0 B");
}

TEST_CASE("Single-line string splits on commas when present, else whitespace") {
    CHECK((normalize(RawReply{std::string("2, M1 ,M2")}) == Lines{"2", "M1", "M2"}));
    CHECK((normalize(RawReply{std::string("  2   M1\tM2 ")}) == Lines{"2", "M1", "M2"}));
    CHECK((normalize(RawReply{std::string("a,,b,")}) == Lines{"a", "b"}));
}

TEST_CASE("Empty replies normalize to nothing") {
    CHECK(normalize(RawReply{std::string()}).empty());
    CHECK(normalize(RawReply{std::string(" \r\n ")}).empty());
    CHECK(normalize(RawReply{Lines{}}).empty());
}

TEST_CASE("Master list is the same whatever shape the bridge used") {
    const Lines want{"2", "M1", "M2"};
    CHECK(tokenize(normalize(RawReply{std::string("2 M1 M2")})) == want);
    CHECK(tokenize(normalize(RawReply{std::string("2\nM1 M2")})) == want);
    CHECK(tokenize(normalize(RawReply{std::string("2\r\nM1\r\nM2")})) == want);
    CHECK((tokenize(normalize(RawReply{Lines{"2", "M1", "M2"}})) == want));
    CHECK(tokenize(normalize(RawReply{Lines{"2 M1 M2"}})) == want);
    CHECK((tokenize(normalize(RawReply{std::string("2,M1,M2")})) == want));
}

TEST_CASE("Handshake ack tokenizes identically from list or string") {
    CHECK((tokenize(normalize(RawReply{Lines{"1", "0"}})) == Lines{"1", "0"}));
    CHECK((tokenize(normalize(RawReply{std::string("1 0")})) == Lines{"1", "0"}));
}

TEST_CASE("split_fields and trim helpers") {
    CHECK((split_fields("  a  b\tc ") == Lines{"a", "b", "c"}));
    CHECK(split_fields("").empty());
    CHECK(trim("\t x y \r\n") == "x y");
    CHECK(trim("   ").empty());
}

TEST_CASE("describe renders both shapes on one line") {
    CHECK(describe(RawReply{std::string("VQM")}) == "\"VQM\"");
    CHECK((describe(RawReply{Lines{"1", "0"}}) == "[\"1\",\"0\"]"));
}
