// test_mathfix_segmenter_gtest.cpp - Unit tests for the Segmenter
//
// Tests segmenter.hpp:
// - fenced code blocks and inline code spans
// - $, $$, \( \), \[ \] and bracket-line math
// - pandoc rules for single dollars
// - unterminated display math
// - lossless concatenation

#include <gtest/gtest.h>
#include "mathfix/segmenter.hpp"
#include "lib/log.h"

using namespace mathfix;

// ============================================================================
// Test Fixture
// ============================================================================

class SegmenterTest : public ::testing::Test {
protected:
    Segmenter segmenter;
    DiagnosticList diagnostics;

    Document segment(const std::string& text) {
        Document doc = segmenter.segment(text, &diagnostics);
        // every byte lands in exactly one region
        EXPECT_EQ(doc.concat(), text);
        return doc;
    }

    static std::vector<RegionKind> kinds(const Document& doc) {
        std::vector<RegionKind> out;
        for (const Region& r : doc.regions()) out.push_back(r.kind);
        return out;
    }
};

// ============================================================================
// Prose and inline math
// ============================================================================

TEST_F(SegmenterTest, PlainProse) {
    Document doc = segment("hello world\n");
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc.at(0).kind, RegionKind::Prose);
}

TEST_F(SegmenterTest, EmptyInput) {
    Document doc = segment("");
    EXPECT_TRUE(doc.empty());
}

TEST_F(SegmenterTest, InlineDollarMath) {
    Document doc = segment("a $x^2$ b");
    ASSERT_EQ(doc.size(), 3u);
    EXPECT_EQ(doc.at(0).text, "a ");
    EXPECT_EQ(doc.at(1).kind, RegionKind::MathInline);
    EXPECT_EQ(doc.at(1).text, "$x^2$");
    EXPECT_EQ(doc.at(2).text, " b");
}

TEST_F(SegmenterTest, CurrencyIsProse) {
    Document doc = segment("costs $5 and $10 today");
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc.at(0).kind, RegionKind::Prose);
}

TEST_F(SegmenterTest, OpenerFollowedBySpaceIsProse) {
    Document doc = segment("a $ x $ b");
    EXPECT_EQ(doc.count(RegionKind::MathInline), 0u);
}

TEST_F(SegmenterTest, CloserFollowedByDigitIsProse) {
    Document doc = segment("$x$5");
    EXPECT_EQ(doc.count(RegionKind::MathInline), 0u);
}

TEST_F(SegmenterTest, InlineMathDoesNotCrossBlankLine) {
    Document doc = segment("$a\n\nb$");
    EXPECT_EQ(doc.count(RegionKind::MathInline), 0u);
}

TEST_F(SegmenterTest, EscapedDollarIsProse) {
    Document doc = segment("price \\$5 and $x$");
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc.at(0).text, "price \\$5 and ");
    EXPECT_EQ(doc.at(1).text, "$x$");
}

TEST_F(SegmenterTest, ParenDelimiters) {
    Document doc = segment("see \\(a+b\\) here");
    ASSERT_EQ(doc.size(), 3u);
    EXPECT_EQ(doc.at(1).kind, RegionKind::MathInline);
    EXPECT_EQ(doc.at(1).text, "\\(a+b\\)");
}

// ============================================================================
// Display math
// ============================================================================

TEST_F(SegmenterTest, DisplayDollars) {
    Document doc = segment("a\n$$x$$\nb");
    EXPECT_EQ(kinds(doc), (std::vector<RegionKind>{
        RegionKind::Prose, RegionKind::MathBlock, RegionKind::Prose}));
    EXPECT_EQ(doc.at(1).text, "$$x$$");
    EXPECT_FALSE(doc.at(1).unterminated);
}

TEST_F(SegmenterTest, DisplayPairsWithNearestMarker) {
    Document doc = segment("$$a$$ and $$b$$");
    ASSERT_EQ(doc.count(RegionKind::MathBlock), 2u);
    EXPECT_EQ(doc.at(0).text, "$$a$$");
    EXPECT_EQ(doc.at(2).text, "$$b$$");
}

TEST_F(SegmenterTest, BracketDisplayAtLineStart) {
    Document doc = segment("\\[\nx = 1\n\\]\n");
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc.at(0).kind, RegionKind::MathBlock);
    EXPECT_EQ(doc.at(0).text, "\\[\nx = 1\n\\]");
    EXPECT_EQ(doc.at(1).text, "\n");
}

TEST_F(SegmenterTest, BracketDisplayMidLineIsProse) {
    Document doc = segment("text \\[x\\] more");
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc.at(0).kind, RegionKind::Prose);
}

TEST_F(SegmenterTest, BareBracketLines) {
    Document doc = segment("Energy:\n[\nE = mc^2\n]\ndone");
    ASSERT_EQ(doc.count(RegionKind::MathBlock), 1u);
    EXPECT_EQ(doc.at(1).text, "[\nE = mc^2\n]");
}

TEST_F(SegmenterTest, UnclosedBracketLineIsProse) {
    Document doc = segment("[\nnot closed\n");
    EXPECT_EQ(doc.count(RegionKind::MathBlock), 0u);
}

TEST_F(SegmenterTest, UnterminatedDisplayClosesAtParagraphEnd) {
    Document doc = segment("intro\n\n$$\nx = 1\n\nnext para");
    ASSERT_EQ(doc.count(RegionKind::MathBlock), 1u);
    const Region& block = doc.at(1);
    EXPECT_EQ(block.text, "$$\nx = 1");
    EXPECT_TRUE(block.unterminated);
    EXPECT_EQ(doc.at(2).text, "\n\nnext para");

    ASSERT_EQ(diagnostics.count(DiagnosticKind::UnbalancedDelimiter), 1u);
    const Diagnostic& d = diagnostics.diagnostics()[0];
    EXPECT_EQ(d.severity, DiagnosticSeverity::WARNING);
    EXPECT_EQ(d.location.line, 3u);
    EXPECT_EQ(d.location.column, 1u);
    EXPECT_EQ(d.context_line, "$$");
}

TEST_F(SegmenterTest, UnterminatedDisplayAtEndOfDocument) {
    Document doc = segment("text\n$$\na^2\n");
    ASSERT_EQ(doc.size(), 3u);
    EXPECT_EQ(doc.at(1).text, "$$\na^2");
    EXPECT_TRUE(doc.at(1).unterminated);
    EXPECT_EQ(doc.at(2).text, "\n");
}

// ============================================================================
// Code
// ============================================================================

TEST_F(SegmenterTest, InlineCodeProtectsDollars) {
    Document doc = segment("use `$x$` now");
    ASSERT_EQ(doc.size(), 3u);
    EXPECT_EQ(doc.at(1).kind, RegionKind::InlineCode);
    EXPECT_EQ(doc.at(1).text, "`$x$`");
    EXPECT_TRUE(doc.at(1).is_protected());
}

TEST_F(SegmenterTest, UnmatchedBacktickIsLiteral) {
    Document doc = segment("a ` b $x$");
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc.at(0).text, "a ` b ");
    EXPECT_EQ(doc.at(1).kind, RegionKind::MathInline);
}

TEST_F(SegmenterTest, DoubleBacktickSpan) {
    Document doc = segment("x ``a ` $b$`` y");
    ASSERT_EQ(doc.count(RegionKind::InlineCode), 1u);
    EXPECT_EQ(doc.at(1).text, "``a ` $b$``");
    EXPECT_EQ(doc.count(RegionKind::MathInline), 0u);
}

TEST_F(SegmenterTest, FencedCodeBlock) {
    Document doc = segment("```\n$$x$$\n```\nafter $y$");
    EXPECT_EQ(kinds(doc), (std::vector<RegionKind>{
        RegionKind::CodeBlock, RegionKind::Prose, RegionKind::MathInline}));
    EXPECT_EQ(doc.at(0).text, "```\n$$x$$\n```\n");
}

TEST_F(SegmenterTest, TildeFenceWithInfoString) {
    Document doc = segment("a\n~~~ python\nx = '$a$'\n~~~\nb");
    ASSERT_EQ(doc.count(RegionKind::CodeBlock), 1u);
    EXPECT_EQ(doc.at(1).text, "~~~ python\nx = '$a$'\n~~~\n");
    EXPECT_EQ(doc.count(RegionKind::MathInline), 0u);
}

TEST_F(SegmenterTest, UnterminatedFenceRunsToEnd) {
    Document doc = segment("text\n~~~\n$x$\n");
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc.at(1).kind, RegionKind::CodeBlock);
    EXPECT_EQ(doc.at(1).text, "~~~\n$x$\n");
}

TEST_F(SegmenterTest, FenceClosesOnlyWithLongEnoughRun) {
    Document doc = segment("````\ncode\n```\nstill $x$\n````\nout");
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc.at(0).text, "````\ncode\n```\nstill $x$\n````\n");
    EXPECT_EQ(doc.at(1).text, "out");
}

TEST_F(SegmenterTest, DisplayDoesNotReachIntoCode) {
    // the open $$ has no partner before the fence
    Document doc = segment("$$\na\n```\n$$\n```\n");
    ASSERT_GE(doc.size(), 2u);
    EXPECT_TRUE(doc.at(0).unterminated);
    EXPECT_EQ(doc.at(0).text, "$$\na");
    EXPECT_EQ(doc.count(RegionKind::CodeBlock), 1u);
}

// ============================================================================
// Spans and helpers
// ============================================================================

TEST_F(SegmenterTest, RegionSpans) {
    Document doc = segment("line1\nthe $x$");
    ASSERT_EQ(doc.size(), 2u);
    const Span& span = doc.at(1).span;
    EXPECT_EQ(span.offset, 10u);
    EXPECT_EQ(span.length, 3u);
    EXPECT_EQ(span.start.line, 2u);
    EXPECT_EQ(span.start.column, 5u);
}

TEST_F(SegmenterTest, MixedDocumentIsLossless) {
    std::string text =
        "# Title\n\n"
        "Inline $a_1$ and \\(b\\) and `code $c$`.\n\n"
        "$$\n\\sum_i x_i\n$$\n\n"
        "```bash\necho $HOME\n```\n"
        "[\ny = 2\n]\n"
        "trailing $$ open\n";
    Document doc = segment(text);
    EXPECT_EQ(doc.count(RegionKind::CodeBlock), 1u);
    EXPECT_EQ(doc.count(RegionKind::InlineCode), 1u);
    EXPECT_EQ(doc.count(RegionKind::MathInline), 2u);
    EXPECT_EQ(doc.count(RegionKind::MathBlock), 3u);
}

TEST(SegmenterHelperTest, RunLength) {
    std::string text = "$$$a";
    EXPECT_EQ(run_length(text, 0, text.size(), '$'), 3u);
    EXPECT_EQ(run_length(text, 1, 2, '$'), 1u);
    EXPECT_EQ(run_length(text, 3, text.size(), '$'), 0u);
}
