// test_mathfix_detector_gtest.cpp - Unit tests for the MathDetector
//
// Tests math_detector.hpp:
// - command and operator allow-lists
// - rejection of prose-looking spans (sentences, links, URLs, long spans)
// - splitting a Prose region and running math rules on promoted spans

#include <gtest/gtest.h>
#include "mathfix/math_detector.hpp"
#include "lib/log.h"

using namespace mathfix;

// ============================================================================
// Test Fixture
// ============================================================================

class MathDetectorTest : public ::testing::Test {
protected:
    RuleEngine engine;
    DiagnosticList diagnostics;

    static Region prose(const std::string& text) {
        return Region(RegionKind::Prose, text, Span(100, text.size(), SourceLocation(100, 3, 1)));
    }

    static std::vector<std::string> texts(const std::vector<Region>& pieces) {
        std::vector<std::string> out;
        for (const Region& r : pieces) out.push_back(r.text);
        return out;
    }
};

// ============================================================================
// Classification
// ============================================================================

TEST_F(MathDetectorTest, CommandSignal) {
    MathDetector detector;
    EXPECT_EQ(detector.classify("\\alpha + \\beta"), MathSignal::Command);
    EXPECT_EQ(detector.classify("a \\to b"), MathSignal::Command);
    EXPECT_EQ(detector.classify("\\frac{1}{2}"), MathSignal::Command);
}

TEST_F(MathDetectorTest, CommandMustEndAtWordBoundary) {
    MathDetector detector;
    EXPECT_EQ(detector.classify("\\alphabet soup"), MathSignal::None);
}

TEST_F(MathDetectorTest, OperatorSignal) {
    MathDetector detector;
    EXPECT_EQ(detector.classify("x = 1"), MathSignal::Operator);
    EXPECT_EQ(detector.classify("x_i"), MathSignal::Operator);
    EXPECT_EQ(detector.classify("e^{-t}"), MathSignal::Operator);
    EXPECT_EQ(detector.classify("n^2 terms"), MathSignal::Operator);
}

TEST_F(MathDetectorTest, WordsAreNotScripts) {
    MathDetector detector;
    EXPECT_EQ(detector.classify("see file_name"), MathSignal::None);
    EXPECT_EQ(detector.classify("see the appendix"), MathSignal::None);
    EXPECT_EQ(detector.classify("_x"), MathSignal::None);
}

TEST_F(MathDetectorTest, CustomAllowLists) {
    DetectorOptions options;
    options.commands = {"foo"};
    options.operators = {"<"};
    MathDetector detector(options);
    ASSERT_TRUE(detector.ok());

    EXPECT_EQ(detector.classify("\\foo x"), MathSignal::Command);
    EXPECT_EQ(detector.classify("\\alpha"), MathSignal::None);
    EXPECT_EQ(detector.classify("a < b"), MathSignal::Operator);
    EXPECT_EQ(detector.classify("a = b"), MathSignal::None);
}

TEST_F(MathDetectorTest, EmptyCommandList) {
    DetectorOptions options;
    options.commands.clear();
    MathDetector detector(options);
    EXPECT_TRUE(detector.ok());
    EXPECT_EQ(detector.classify("\\alpha"), MathSignal::None);
    EXPECT_EQ(detector.classify("a = b"), MathSignal::Operator);
}

// ============================================================================
// Span search
// ============================================================================

TEST_F(MathDetectorTest, FindsParenthesizedMath) {
    MathDetector detector;
    std::vector<MathSpan> spans = detector.find_spans("where (\\alpha + \\beta) is");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].open, 6u);
    EXPECT_EQ(spans[0].close, 21u);
    EXPECT_EQ(spans[0].interior, "\\alpha + \\beta");
    EXPECT_EQ(spans[0].signal, MathSignal::Command);
}

TEST_F(MathDetectorTest, NestedParensMatched) {
    MathDetector detector;
    std::vector<MathSpan> spans = detector.find_spans("so (f(x) = 1) holds");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].interior, "f(x) = 1");
}

TEST_F(MathDetectorTest, PlainProseIgnored) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("(see the appendix)").empty());
    EXPECT_TRUE(detector.find_spans("no parens at all").empty());
    EXPECT_TRUE(detector.find_spans("unbalanced (x = 1").empty());
}

TEST_F(MathDetectorTest, SentenceBreakRejected) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("(a = b. Then X follows)").empty());
}

TEST_F(MathDetectorTest, InnerSpanOfRejectedOuter) {
    MathDetector detector;
    std::vector<MathSpan> spans = detector.find_spans("(see (x=1). Then more)");
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].open, 5u);
    EXPECT_EQ(spans[0].interior, "x=1");
}

TEST_F(MathDetectorTest, LinkTargetsSkipped) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("[link](http://x.com/?a=b)").empty());
    EXPECT_TRUE(detector.find_spans("[a](docs/b(x=1).md)").empty());
}

TEST_F(MathDetectorTest, UrlRejected) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("(see http://a.b/c?d=e)").empty());
}

TEST_F(MathDetectorTest, EscapedParenSkipped) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("\\(x = 1)").empty());
}

TEST_F(MathDetectorTest, OddDollarCountRejected) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("(a $= b)").empty());
    EXPECT_EQ(detector.find_spans("(a $b$ = c)").size(), 1u);
}

TEST_F(MathDetectorTest, BlankLineRejected) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("(x =\n\n1)").empty());
    EXPECT_EQ(detector.find_spans("(x =\n1)").size(), 1u);
}

TEST_F(MathDetectorTest, DigitAfterCloseRejected) {
    MathDetector detector;
    EXPECT_TRUE(detector.find_spans("(x = 1)2").empty());
}

TEST_F(MathDetectorTest, MaxSpan) {
    DetectorOptions options;
    options.max_span = 5;
    MathDetector detector(options);
    EXPECT_TRUE(detector.find_spans("(x = 1 + 2)").empty());
    EXPECT_EQ(detector.find_spans("(x=1)").size(), 1u);
}

// ============================================================================
// Promotion
// ============================================================================

TEST_F(MathDetectorTest, SplitsProseRegion) {
    MathDetector detector;
    std::vector<Region> pieces = detector.detect(prose("where (\\alpha + \\beta) is"),
                                                 engine, &diagnostics);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(texts(pieces), (std::vector<std::string>{
        "where ", "$\\alpha + \\beta$", " is"}));
    EXPECT_EQ(pieces[0].kind, RegionKind::Prose);
    EXPECT_EQ(pieces[1].kind, RegionKind::MathInline);
    EXPECT_EQ(pieces[2].kind, RegionKind::Prose);

    EXPECT_EQ(pieces[1].span.offset, 106u);
    EXPECT_EQ(pieces[1].span.start.line, 3u);
    EXPECT_EQ(pieces[1].span.start.column, 7u);
    EXPECT_EQ(detector.promoted(), 1u);
}

TEST_F(MathDetectorTest, PromotedSpansGetMathRules) {
    MathDetector detector;
    std::vector<Region> pieces = detector.detect(prose("then (x_ + |y| = 1)."), engine, &diagnostics);
    ASSERT_EQ(pieces.size(), 3u);
    EXPECT_EQ(pieces[1].text, "$x + \\left|y\\right| = 1$");

    pieces = detector.detect(prose("so (\\int, f = 1)"), engine, &diagnostics);
    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[1].text, "$\\int f = 1$");
}

TEST_F(MathDetectorTest, InteriorTrimmedAndDollarsRemoved) {
    MathDetector detector;
    std::vector<Region> pieces = detector.detect(prose("( a $b$ = c )"), engine, &diagnostics);
    ASSERT_EQ(pieces.size(), 1u);
    EXPECT_EQ(pieces[0].text, "$a b = c$");
}

TEST_F(MathDetectorTest, StrayDollarBlocksPromotion) {
    MathDetector detector;
    EXPECT_TRUE(detector.detect(prose("costs $5 (x=1)"), engine, &diagnostics).empty());
    EXPECT_EQ(detector.promoted(), 0u);
}

TEST_F(MathDetectorTest, AdjacentSpansNotBothPromoted) {
    MathDetector detector;
    std::vector<Region> pieces = detector.detect(prose("(x=1)(y=2)"), engine, &diagnostics);
    EXPECT_EQ(texts(pieces), (std::vector<std::string>{"$x=1$", "(y=2)"}));
}

TEST_F(MathDetectorTest, NeighbouringDollarsRespected) {
    MathDetector detector;
    EXPECT_TRUE(detector.detect(prose("(x=1) next"), engine, &diagnostics, '$', '\0').empty());
    EXPECT_TRUE(detector.detect(prose("see (x=1)"), engine, &diagnostics, '\0', '$').empty());
    EXPECT_TRUE(detector.detect(prose("see (x=1)"), engine, &diagnostics, '\0', '2').empty());
    EXPECT_EQ(detector.detect(prose("see (x=1)"), engine, &diagnostics, '\0', ' ').size(), 2u);
}

TEST_F(MathDetectorTest, DisabledDetector) {
    DetectorOptions options;
    options.enabled = false;
    MathDetector detector(options);
    EXPECT_TRUE(detector.detect(prose("a (x = 1) b"), engine, &diagnostics).empty());
}

TEST_F(MathDetectorTest, OnlyProseRegions) {
    MathDetector detector;
    Region code(RegionKind::InlineCode, "`(x = 1)`");
    EXPECT_TRUE(detector.detect(code, engine, &diagnostics).empty());
}

TEST_F(MathDetectorTest, SignalNames) {
    EXPECT_STREQ(math_signal_name(MathSignal::Command), "command");
    EXPECT_STREQ(math_signal_name(MathSignal::Operator), "operator");
    EXPECT_STREQ(math_signal_name(MathSignal::None), "none");
}
