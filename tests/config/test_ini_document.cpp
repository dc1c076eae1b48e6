#include "gtest/gtest.h"
#include "config/ini_document.h"
#include "errors.h"

static const char* SAMPLE =
    "# managed by hand\n"
    "\n"
    "[default]\n"
    "region = eu-west-1\n"
    "output=json\n"
    "\n"
    "[profile dev]\n"
    "; comment in a section\n"
    "s3 =\n"
    "  max_concurrent_requests = 20\n"
    "region   =   us-east-1\n";

TEST(IniDocumentParse, RoundTripsExactBytes) {
    ASSERT_EQ(serialize_ini_document(parse_ini_document(SAMPLE)), SAMPLE);
}

TEST(IniDocumentParse, RoundTripsWithoutTrailingNewline) {
    std::string text = "[default]\nregion = eu-west-1";
    IniDocument doc = parse_ini_document(text);
    ASSERT_FALSE(doc.trailing_newline);
    ASSERT_EQ(serialize_ini_document(doc), text);
}

TEST(IniDocumentParse, RoundTripsCrlfAndBlankRuns) {
    std::string text = "[default]\r\nregion = eu-west-1\r\n\n\n\n[profile x]\n";
    ASSERT_EQ(serialize_ini_document(parse_ini_document(text)), text);
}

TEST(IniDocumentParse, EmptyTextIsEmptyDocument) {
    IniDocument doc = parse_ini_document("");
    ASSERT_TRUE(doc.empty());
    ASSERT_EQ(serialize_ini_document(doc), "");
}

TEST(IniDocumentParse, SectionsAndValues) {
    IniDocument doc = parse_ini_document(SAMPLE);
    ASSERT_EQ(doc.preamble.size(), 2u);
    ASSERT_EQ(doc.headers(), (std::vector<std::string>{"default", "profile dev"}));

    const IniSection* def = doc.find("default");
    ASSERT_NE(def, nullptr);
    ASSERT_EQ(def->value("region"), "eu-west-1");
    ASSERT_EQ(def->value("output"), "json");

    const IniSection* dev = doc.find("profile dev");
    ASSERT_NE(dev, nullptr);
    ASSERT_EQ(dev->value("region"), "us-east-1");
    ASSERT_TRUE(dev->hasKey("s3"));
    ASSERT_EQ(dev->lines[2].kind, IniLineKind::Other);
    ASSERT_EQ(doc.find("profile missing"), nullptr);
}

TEST(IniDocumentParse, LastDuplicateKeyWins) {
    IniDocument doc = parse_ini_document("[a]\nk = 1\nk = 2\n");
    ASSERT_EQ(doc.sections[0].value("k"), "2");
    ASSERT_EQ(doc.sections[0].entries().size(), 2u);
}

TEST(IniDocumentParse, HeaderIsTrimmed) {
    IniDocument doc = parse_ini_document("[ profile  x ]\n");
    ASSERT_EQ(doc.sections[0].header, "profile  x");
    ASSERT_EQ(doc.sections[0].header_line, "[ profile  x ]");
}

TEST(IniDocumentParse, KeyBeforeFirstHeaderIsMalformed) {
    try {
        parse_ini_document("# ok\nregion = us-east-1\n[default]\n", "/tmp/config");
        FAIL() << "expected MalformedDocument";
    } catch (const MalformedDocument& e) {
        ASSERT_EQ(e.lineNumber(), 2u);
        ASSERT_EQ(e.line(), "region = us-east-1");
        ASSERT_EQ(e.path(), "/tmp/config");
        ASSERT_NE(std::string(e.what()).find("/tmp/config:2"), std::string::npos);
    }
}

TEST(IniDocumentParse, TrailingTriviaStart) {
    IniDocument doc = parse_ini_document("[a]\nk = 1\n# note\n\n[b]\n");
    ASSERT_EQ(doc.sections[0].trailingTriviaStart(), 1u);
    ASSERT_EQ(doc.sections[1].trailingTriviaStart(), 0u);
}

TEST(IniDocumentBuild, CanonicalSection) {
    IniSection section = make_ini_section("sso-session corp", {{"sso_start_url", "https://x"},
                                                                {"sso_region", "us-east-1"}});
    IniDocument doc;
    doc.sections.push_back(section);
    doc.trailing_newline = true;
    ASSERT_EQ(serialize_ini_document(doc),
              "[sso-session corp]\nsso_start_url = https://x\nsso_region = us-east-1\n");
}
