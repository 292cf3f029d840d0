#include "html/FormatValidator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace hwcheck;

static std::vector<IssueKind> kinds(const ValidationResult& r) {
    std::vector<IssueKind> out;
    for (const auto& i : r.issues) out.push_back(i.kind);
    return out;
}

static size_t count_kind(const ValidationResult& r, IssueKind kind) {
    return (size_t)std::count_if(r.issues.begin(), r.issues.end(),
                                 [&](const Issue& i) { return i.kind == kind; });
}

TEST(FormatValidator, MinimalValidDocument) {
    auto r = validate_index_html(
        R"(<html><head><link rel="stylesheet" href="css/style.css"></head><body></body></html>)");
    EXPECT_TRUE(r.format_ok());
    EXPECT_TRUE(r.format_issues().empty());
}

TEST(FormatValidator, TypicalHomeworkPage) {
    const std::string html =
        "<!DOCTYPE html>\n"
        "<html lang=\"en\">\n"
        "<head>\n"
        "  <meta charset=\"utf-8\">\n"
        "  <title>My page</title>\n"
        "  <link rel=\"stylesheet\" href=\"style.css\" />\n"
        "  <style>body > p { color: red; }</style>\n"
        "</head>\n"
        "<body>\n"
        "  <!-- main content -->\n"
        "  <h1>Hello</h1>\n"
        "  <p>Some <b>bold</b> text<br>and an <img src=\"cat.png\" alt=\"cat\">.</p>\n"
        "  <ul><li>one</li><li>two</li></ul>\n"
        "</body>\n"
        "</html>\n";
    auto r = validate_index_html(html);
    EXPECT_TRUE(r.format_ok()) << (r.issues.empty() ? "" : describe(r.issues.front()));
}

TEST(FormatValidator, MissingBodyReportedOnce) {
    auto r = validate_index_html(R"(<html><head><link rel="stylesheet" href="style.css"></head></html>)");
    ASSERT_EQ(r.issues.size(), 1u);
    EXPECT_EQ(r.issues[0].kind, IssueKind::MissingRequired);
    EXPECT_EQ(r.issues[0].tag, "body");
    EXPECT_EQ(r.format_issues()[0], "index.html is missing <body> tag.");
    EXPECT_FALSE(r.format_ok());
}

TEST(FormatValidator, StrayBodyCloseDoesNotCascade) {
    auto r = validate_index_html("<html><head></body></head></html>");
    EXPECT_EQ(kinds(r), (std::vector<IssueKind>{
        IssueKind::UnexpectedClose, IssueKind::MissingRequired, IssueKind::NoCssLink}));
    EXPECT_EQ(r.issues[0].tag, "body");
    EXPECT_EQ(r.issues[1].tag, "body");
}

TEST(FormatValidator, ExtraClosingTag) {
    auto r = validate_index_html("<p>text</p></p>");
    EXPECT_EQ(count_kind(r, IssueKind::UnexpectedClose), 1u);
    EXPECT_EQ(r.format_issues()[0], "Unexpected closing tag </p> at line 1.");
    EXPECT_EQ(kinds(r), (std::vector<IssueKind>{
        IssueKind::UnexpectedClose, IssueKind::MissingRequired, IssueKind::MissingRequired,
        IssueKind::MissingRequired, IssueKind::NoCssLink}));
}

TEST(FormatValidator, HeadWrappingHtmlIsBadOrder) {
    auto r = validate_index_html("<head><html><body></body></html></head>");
    EXPECT_EQ(count_kind(r, IssueKind::BadOrder), 1u);
    EXPECT_EQ(count_kind(r, IssueKind::MissingRequired), 0u);
}

TEST(FormatValidator, IconLinkOnlyTriggersNoCssLink) {
    auto r = validate_index_html(
        R"(<html><head><link rel="icon" href="favicon.ico"></head><body></body></html>)");
    ASSERT_EQ(r.issues.size(), 1u);
    EXPECT_EQ(r.issues[0].kind, IssueKind::NoCssLink);
    EXPECT_EQ(r.format_issues()[0], "index.html does not link to a CSS file.");
}

TEST(FormatValidator, LinkWithoutRelIsAccepted) {
    auto r = validate_index_html(R"(<html><head><link href="style.css"></head><body></body></html>)");
    EXPECT_TRUE(r.format_ok());
}

TEST(FormatValidator, CanonicalIssueOrder) {
    const std::string html =
        "<html></>\n"
        "<body>\n"
        "<div>\n"
        "<span>\n"
        "</div>\n"
        "<p>\n";
    auto r = validate_index_html(html);
    EXPECT_EQ(kinds(r), (std::vector<IssueKind>{
        IssueKind::Malformed, IssueKind::Mismatched,
        IssueKind::Unclosed, IssueKind::Unclosed, IssueKind::Unclosed,
        IssueKind::MissingRequired, IssueKind::NoCssLink}));

    const auto msgs = r.format_issues();
    ASSERT_EQ(msgs.size(), 7u);
    EXPECT_EQ(msgs[0], "index.html has malformed markup at line 1: malformed end tag.");
    EXPECT_EQ(msgs[1], "Mismatched closing tag </div> at line 5 (expected </span>).");
    EXPECT_EQ(msgs[2], "Unclosed tag <html> (opened at line 1).");
    EXPECT_EQ(msgs[3], "Unclosed tag <body> (opened at line 2).");
    EXPECT_EQ(msgs[4], "Unclosed tag <p> (opened at line 6).");
    EXPECT_EQ(msgs[5], "index.html is missing <head> tag.");
    EXPECT_EQ(msgs[6], "index.html does not link to a CSS file.");
}

TEST(FormatValidator, ScanIssuesInterleaveWithStructuralIssuesByPosition) {
    auto r = validate_index_html("</p>\n<div <span></span>");
    ASSERT_GE(r.issues.size(), 2u);
    EXPECT_EQ(r.issues[0].kind, IssueKind::UnexpectedClose);
    EXPECT_EQ(r.issues[1].kind, IssueKind::Malformed);
    EXPECT_EQ(r.issues[1].line, 2u);
}

TEST(FormatValidator, RepeatedRunsAreIdentical) {
    const std::string html = "<html><body><p><b></p></b><head></head></html><div>";
    const auto a = validate_index_html(html).format_issues();
    const auto b = validate_index_html(html).format_issues();
    EXPECT_FALSE(a.empty());
    EXPECT_EQ(a, b);
}

TEST(FormatValidator, BinaryDocumentIsUnreadable) {
    const std::string bytes("\x89PNG\r\n\x1a\n\0\0\0\rIHDR", 16);
    auto r = validate_index_html(bytes);
    ASSERT_EQ(r.issues.size(), 1u);
    EXPECT_EQ(r.issues[0].kind, IssueKind::Unreadable);
    EXPECT_EQ(r.format_issues()[0], "index.html is not readable as text.");
}

TEST(FormatValidator, EmbeddedNulStillValidated) {
    const std::string html =
        "<html><head><link rel=\"stylesheet\" href=\"style.css\"></head><body><p>";
    const std::string bytes = html + std::string(1, '\0') + "hi</p></body></html>";
    auto r = validate_index_html(bytes);
    EXPECT_TRUE(r.format_ok()) << (r.issues.empty() ? "" : describe(r.issues.front()));
}

TEST(FormatValidator, EmptyCommentDoesNotSwallowDocument) {
    auto r = validate_index_html(R"(<html><!--><head><link href="a.css"></head><body></body></html>)");
    EXPECT_TRUE(r.format_ok()) << (r.issues.empty() ? "" : describe(r.issues.front()));
}

TEST(FormatValidator, EmptyDocument) {
    auto r = validate_index_html("");
    EXPECT_EQ(kinds(r), (std::vector<IssueKind>{
        IssueKind::MissingRequired, IssueKind::MissingRequired,
        IssueKind::MissingRequired, IssueKind::NoCssLink}));
}

TEST(FormatValidator, SyntheticEvents) {
    auto r = validate_events({
        start_tag("html"), start_tag("head"),
        start_tag("link", {{"rel", "stylesheet"}, {"href", "style.css"}}),
        end_tag("head"), start_tag("body"), end_tag("body"), end_tag("html"),
    });
    EXPECT_TRUE(r.format_ok());
}

TEST(FormatValidator, SyntheticEventsWithoutPositions) {
    auto r = validate_events({start_tag("html"), end_tag("body")});
    ASSERT_FALSE(r.issues.empty());
    EXPECT_EQ(r.format_issues()[0], "Unexpected closing tag </body>.");
}

TEST(IssueKindName, StableCodes) {
    EXPECT_STREQ(issue_kind_name(IssueKind::MissingRequired), "missing_required");
    EXPECT_STREQ(issue_kind_name(IssueKind::UnexpectedClose), "unexpected_close");
    EXPECT_STREQ(issue_kind_name(IssueKind::NoCssLink), "no_css_link");
    EXPECT_STREQ(issue_kind_name(IssueKind::BadOrder), "bad_order");
}
