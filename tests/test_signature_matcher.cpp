#include <catch2/catch_test_macros.hpp>
#include "security/signature_matcher.hpp"

#include <string>

using namespace secplane;

// ============================================================================
// Signatures
// ============================================================================

TEST_CASE("SignatureMatcher: each built-in signature is detected", "[signature]") {
    SignatureMatcher matcher;
    CHECK(matcher.size() == 4);

    CHECK(matcher.first_match({"' OR '1'='1"}) == "sql_injection");
    CHECK(matcher.first_match({"id=1' AnD 'a'='a"}) == "sql_injection");
    CHECK(matcher.first_match({"<script src=x>alert(1)</script>"}) == "script_injection");
    CHECK(matcher.first_match({"<SCRIPT>alert(1)</SCRIPT>"}) == "script_injection");
    CHECK(matcher.first_match({"/files/../../etc/passwd"}) == "path_traversal");
    CHECK(matcher.first_match({"cmd=EXEC xp_cmdshell"}) == "code_execution");
    CHECK(matcher.first_match({"eval(atob(payload))"}) == "code_execution");
}

TEST_CASE("SignatureMatcher: benign payloads pass", "[signature]") {
    SignatureMatcher matcher;
    CHECK_FALSE(matcher.first_match({"/api/documents", "page=2&sort=name", "{\"title\": \"Q3 report\"}"}));
    // Keywords only count as whole words
    CHECK_FALSE(matcher.first_match({"color = 'red'"}));
    CHECK_FALSE(matcher.first_match({"order=desc&brand='acme'"}));
    CHECK_FALSE(matcher.first_match({"executive summary", "evaluation"}));
    CHECK_FALSE(matcher.first_match({"<scripture>text</scripture>"}));
    CHECK_FALSE(matcher.first_match({"", "", ""}));
}

TEST_CASE("SignatureMatcher: parts of a signature must share a line", "[signature]") {
    SignatureMatcher matcher;
    CHECK_FALSE(matcher.first_match({"tea or coffee\nprice = 'low'"}));
    CHECK(matcher.first_match({"first line\ntea or x = 'y'"}) == "sql_injection");
    CHECK_FALSE(matcher.first_match({"<script>\nalert(1)\n</script>"}));
}

TEST_CASE("SignatureMatcher: first signature in order wins", "[signature]") {
    SignatureMatcher matcher;
    // Path input comes first, but sql_injection is checked before path_traversal
    CHECK(matcher.first_match({"/a/../b", "q=1' or 'x'='x"}) == "sql_injection");
}

// ============================================================================
// Large payloads
// ============================================================================

TEST_CASE("SignatureMatcher: large bodies scan without blowing up", "[signature]") {
    SignatureMatcher matcher;
    const std::string filler(200 * 1024, 'a');

    CHECK_FALSE(matcher.first_match({"name or " + filler}));
    CHECK_FALSE(matcher.first_match({"<script " + filler}));
    CHECK(matcher.first_match({"name or x='1' " + filler}) == "sql_injection");

    std::string lines;
    for (int i = 0; i < 20000; ++i) lines += "a or b = c\n";
    CHECK_FALSE(matcher.first_match({lines}));
}

TEST_CASE("SignatureMatcher: only the configured prefix is scanned", "[signature]") {
    const std::string padded = std::string(64, 'a') + " ' or '1'='1";

    CHECK(SignatureMatcher().first_match({padded}) == "sql_injection");

    SignatureMatcher small(32);
    CHECK(small.max_scan_bytes() == 32);
    CHECK_FALSE(small.first_match({padded}));
    CHECK(small.first_match({"' or '1'='1"}) == "sql_injection");
}
