#include <gtest/gtest.h>
#include "functions/docx_converter/src/properties.hpp"
#include "test_support.hpp"

using test_support::kWordNs;
using test_support::parse_body;

static ParagraphProperties paragraph_props(const std::string& p_xml) {
    auto parsed = parse_body(p_xml);
    return read_paragraph_properties(parsed.first(), kWordNs);
}

static RunProperties run_props(const std::string& rpr_inner) {
    auto parsed = parse_body("<w:r><w:rPr>" + rpr_inner + "</w:rPr><w:t>x</w:t></w:r>");
    return read_run_properties(parsed.first(), kWordNs);
}

TEST(ParagraphPropertiesTest, DefaultsWithoutPropertiesBlock) {
    ParagraphProperties p = paragraph_props("<w:p><w:r><w:t>plain</w:t></w:r></w:p>");
    EXPECT_EQ(p.alignment, Alignment::Left);
    EXPECT_EQ(p.first_line_indent, 0);
    EXPECT_FALSE(p.is_heading);
}

TEST(ParagraphPropertiesTest, DefaultsWithEmptyPropertiesBlock) {
    ParagraphProperties p = paragraph_props("<w:p><w:pPr/></w:p>");
    EXPECT_EQ(p.alignment, Alignment::Left);
    EXPECT_EQ(p.first_line_indent, 0);
    EXPECT_FALSE(p.is_heading);
}

TEST(ParagraphPropertiesTest, ReadsAlignment) {
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:jc w:val=\"center\"/></w:pPr></w:p>").alignment, Alignment::Center);
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:jc w:val=\"right\"/></w:pPr></w:p>").alignment, Alignment::Right);
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:jc w:val=\"both\"/></w:pPr></w:p>").alignment, Alignment::Justify);
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:jc w:val=\"justify\"/></w:pPr></w:p>").alignment, Alignment::Justify);
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:jc w:val=\"distributed\"/></w:pPr></w:p>").alignment, Alignment::Left);
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:jc/></w:pPr></w:p>").alignment, Alignment::Left);
}

TEST(ParagraphPropertiesTest, ReadsFirstLineIndent) {
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:ind w:firstLine=\"720\"/></w:pPr></w:p>").first_line_indent, 720);
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:ind w:left=\"720\"/></w:pPr></w:p>").first_line_indent, 0);
    EXPECT_EQ(paragraph_props("<w:p><w:pPr><w:ind w:firstLine=\"abc\"/></w:pPr></w:p>").first_line_indent, 0);
}

TEST(ParagraphPropertiesTest, HeadingIsCaseInsensitiveSubstring) {
    EXPECT_TRUE(paragraph_props("<w:p><w:pPr><w:pStyle w:val=\"Heading1\"/></w:pPr></w:p>").is_heading);
    EXPECT_TRUE(paragraph_props("<w:p><w:pPr><w:pStyle w:val=\"Heading Centered\"/></w:pPr></w:p>").is_heading);
    EXPECT_TRUE(paragraph_props("<w:p><w:pPr><w:pStyle w:val=\"myHEADINGstyle\"/></w:pPr></w:p>").is_heading);
    EXPECT_FALSE(paragraph_props("<w:p><w:pPr><w:pStyle w:val=\"Normal\"/></w:pPr></w:p>").is_heading);
    EXPECT_FALSE(paragraph_props("<w:p><w:pPr><w:pStyle/></w:pPr></w:p>").is_heading);
}

TEST(ParagraphPropertiesTest, IgnoresForeignNamespaceProperties) {
    ParagraphProperties p = paragraph_props(
        "<w:p xmlns:o=\"urn:other\"><w:pPr><o:jc w:val=\"center\"/><w:jc o:val=\"right\"/></w:pPr></w:p>");
    EXPECT_EQ(p.alignment, Alignment::Left);
}

TEST(IndentParsingTest, ParsesLeadingInteger) {
    EXPECT_EQ(parse_indent_units("720"), 720);
    EXPECT_EQ(parse_indent_units("  360"), 360);
    EXPECT_EQ(parse_indent_units("720abc"), 720);
    EXPECT_EQ(parse_indent_units(""), 0);
    EXPECT_EQ(parse_indent_units("x1"), 0);
    EXPECT_EQ(parse_indent_units("-240"), 0);
}

TEST(RunPropertiesTest, DefaultsWithoutPropertiesBlock) {
    auto parsed = parse_body("<w:r><w:t>x</w:t></w:r>");
    RunProperties r = read_run_properties(parsed.first(), kWordNs);
    EXPECT_FALSE(r.bold);
    EXPECT_FALSE(r.italic);
    EXPECT_FALSE(r.underline);
    EXPECT_FALSE(r.strike);
}

TEST(RunPropertiesTest, BoldAbsentIsOff) {
    EXPECT_FALSE(run_props("<w:i/>").bold);
}

TEST(RunPropertiesTest, BoldWithoutValueIsOn) {
    EXPECT_TRUE(run_props("<w:b/>").bold);
}

TEST(RunPropertiesTest, BoldValues) {
    EXPECT_FALSE(run_props("<w:b w:val=\"0\"/>").bold);
    EXPECT_TRUE(run_props("<w:b w:val=\"1\"/>").bold);
    EXPECT_TRUE(run_props("<w:b w:val=\"true\"/>").bold);
}

TEST(RunPropertiesTest, UnderlineOffSentinelIsNone) {
    EXPECT_TRUE(run_props("<w:u w:val=\"single\"/>").underline);
    EXPECT_TRUE(run_props("<w:u/>").underline);
    EXPECT_FALSE(run_props("<w:u w:val=\"none\"/>").underline);
    // u 의 off 값은 "0" 이 아님
    EXPECT_TRUE(run_props("<w:u w:val=\"0\"/>").underline);
}

TEST(RunPropertiesTest, ItalicAndStrike) {
    RunProperties r = run_props("<w:i/><w:strike w:val=\"1\"/>");
    EXPECT_TRUE(r.italic);
    EXPECT_TRUE(r.strike);

    RunProperties off = run_props("<w:i w:val=\"0\"/><w:strike w:val=\"0\"/>");
    EXPECT_FALSE(off.italic);
    EXPECT_FALSE(off.strike);
}
