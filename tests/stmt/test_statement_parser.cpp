// tests/stmt/test_statement_parser.cpp - Tests for the statement scanner,
//                                          scaffolds, classification, render
// Part of the architectural statement engine (C++20)
//
// Validates:
//   1. Tokenizing: reference tokens, punctuation, positions, trailing period
//   2. Modal extraction anywhere in the sentence
//   3. Each archetype scaffold and its phrasings
//   4. Classification: formal, semi-formal, informal, malformed numbers
//   5. Context checks: layer slots, broken tag expression definitions
//   6. Canonical rendering

#include <archgov/ref/context.h>
#include <archgov/ref/reference.h>
#include <archgov/stmt/expression.h>
#include <archgov/stmt/parser.h>
#include <archgov/stmt/render.h>
#include <archgov/stmt/scanner.h>

#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

using namespace archgov;
using namespace archgov::stmt;

// =========================================================================
// Helpers
// =========================================================================

namespace {

key_set const known{"a", "b", "R", "L"};

parsed_statement formal(std::string const& text) {
    auto p = parse_statement(text, known);
    EXPECT_EQ(p.classification, statement_class::formal) << text;
    EXPECT_TRUE(p.errors.empty()) << text;
    return p;
}

template<typename T>
T expr_as(std::string const& text) {
    auto p = formal(text);
    EXPECT_TRUE(p.expression.has_value()) << text;
    if (!p.expression || !std::holds_alternative<T>(*p.expression)) {
        ADD_FAILURE() << "wrong archetype: " << text;
        return T{};
    }
    return std::get<T>(*p.expression);
}

} // namespace

// =========================================================================
// 1. Scanner
// =========================================================================

TEST(Scanner, WordsAndReferences) {
    auto toks = scan_statement("$$$api$$$ must not depend on $$$db$$$.");
    ASSERT_EQ(toks.size(), 6u);
    EXPECT_TRUE(toks[0].is_reference());
    EXPECT_EQ(toks[0].text, "api");
    EXPECT_EQ(toks[0].position, 0u);
    EXPECT_TRUE(toks[1].is("MUST"));
    EXPECT_FALSE(toks[0].is("api"));
    EXPECT_TRUE(toks[5].is_reference());
    EXPECT_EQ(toks[5].text, "db");
    EXPECT_EQ(toks[5].position, 29u);
}

TEST(Scanner, ReferenceTouchingPunctuation) {
    auto toks = scan_statement("($$$a$$$), x");
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[0].text, "(");
    EXPECT_TRUE(toks[1].is_reference());
    EXPECT_EQ(toks[1].position, 1u);
    EXPECT_EQ(toks[2].text, "),");
    EXPECT_EQ(toks[3].text, "x");
}

TEST(Scanner, PositionsCountLeadingSpace) {
    auto toks = scan_statement("  there is $$$x$$$");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0].position, 2u);
    EXPECT_EQ(toks[2].position, 11u);
}

TEST(Scanner, MalformedReferenceStaysAWord) {
    auto toks = scan_statement("$$$bad and $$$$$$");
    ASSERT_EQ(toks.size(), 3u);
    for (auto const& t : toks) EXPECT_FALSE(t.is_reference());
    EXPECT_EQ(toks[0].text, "$$$bad");
}

TEST(Scanner, ExtractReferenceNames) {
    EXPECT_EQ(extract_reference_names("$$$b$$$ must correspond to $$$a$$$ and $$$b$$$"),
              (std::vector<std::string>{"b", "a"}));
    EXPECT_TRUE(extract_reference_names("no references here").empty());
}

// =========================================================================
// 2. Modal
// =========================================================================

TEST(Modal, MustShouldNone) {
    EXPECT_EQ(formal("$$$a$$$ must be in $$$b$$$").modifier, modal::must);
    EXPECT_EQ(formal("$$$a$$$ should be in $$$b$$$").modifier, modal::should);
    EXPECT_EQ(formal("$$$a$$$ is in $$$b$$$").modifier, modal::none);
}

TEST(Modal, AnywhereInSentence) {
    auto p = formal("MUST $$$a$$$ be in $$$b$$$");
    EXPECT_EQ(p.modifier, modal::must);
    EXPECT_EQ(p.type, statement_type::containment);
}

TEST(Modal, FirstOneWins) {
    std::vector<token> toks = scan_statement("should x must y");
    EXPECT_EQ(extract_modal(toks), modal::should);
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[0].is("x"));
    EXPECT_TRUE(toks[1].is("must"));
}

TEST(Modal, SeverityMapping) {
    EXPECT_EQ(violation_severity(modal::should), severity_level::warning);
    EXPECT_EQ(violation_severity(modal::must), severity_level::error);
    EXPECT_EQ(violation_severity(modal::none), severity_level::error);
}

// =========================================================================
// 3. Archetypes
// =========================================================================

TEST(Archetype, Existence) {
    EXPECT_EQ(expr_as<existence>("there must be $$$R$$$").ref, "R");
    EXPECT_EQ(expr_as<existence>("$$$R$$$ must exist.").ref, "R");
    EXPECT_EQ(expr_as<existence>("there should exist $$$R$$$").ref, "R");
}

TEST(Archetype, Containment) {
    auto c = expr_as<containment>("every $$$a$$$ must be contained in $$$b$$$");
    EXPECT_EQ(c, (containment{"a", "b"}));
    EXPECT_EQ(expr_as<containment>("$$$a$$$ must be located within $$$b$$$"),
              (containment{"a", "b"}));

    auto reversed = expr_as<containment>("$$$b$$$ must contain every $$$a$$$");
    EXPECT_EQ(reversed.subject, "a");
    EXPECT_EQ(reversed.container, "b");
}

TEST(Archetype, ExclusionReach) {
    auto plain = expr_as<exclusion>("$$$a$$$ must not depend on $$$b$$$");
    EXPECT_EQ(plain.source, "a");
    EXPECT_EQ(plain.target, "b");
    EXPECT_FALSE(plain.qualified);

    auto trans = expr_as<exclusion>("$$$a$$$ must not transitively depend on $$$b$$$");
    EXPECT_TRUE(trans.qualified);
    EXPECT_EQ(trans.reach, exclusion_reach::transitive);

    auto direct = expr_as<exclusion>("$$$a$$$ must not depend on $$$b$$$ directly");
    EXPECT_TRUE(direct.qualified);
    EXPECT_EQ(direct.reach, exclusion_reach::direct);

    EXPECT_EQ(expr_as<exclusion>("$$$a$$$ should not depend on $$$b$$$ indirectly").reach,
              exclusion_reach::transitive);
}

TEST(Archetype, ExclusionNegations) {
    EXPECT_EQ(formal("$$$a$$$ does not depend upon $$$b$$$").type, statement_type::exclusion);
    EXPECT_EQ(formal("$$$a$$$ must never depend on $$$b$$$").type, statement_type::exclusion);
    EXPECT_EQ(formal("every $$$a$$$ cannot depend on $$$b$$$").type, statement_type::exclusion);
}

TEST(Archetype, CardinalityOperators) {
    EXPECT_EQ(expr_as<cardinality>("there must be exactly 3 $$$R$$$"),
              (cardinality{"R", cmp_op::eq, 3}));
    EXPECT_EQ(expr_as<cardinality>("there must be at least 2 $$$R$$$").op, cmp_op::ge);
    EXPECT_EQ(expr_as<cardinality>("there must be at most 0 $$$R$$$").op, cmp_op::le);
    EXPECT_EQ(expr_as<cardinality>("there must be more than 1 $$$R$$$").op, cmp_op::gt);
    EXPECT_EQ(expr_as<cardinality>("there must be fewer than 4 $$$R$$$").op, cmp_op::lt);
    EXPECT_EQ(expr_as<cardinality>("there are less than 4 $$$R$$$").op, cmp_op::lt);
}

TEST(Archetype, CardinalityNegationAndNone) {
    EXPECT_EQ(expr_as<cardinality>("there must be no $$$R$$$"), (cardinality{"R", cmp_op::eq, 0}));
    EXPECT_EQ(expr_as<cardinality>("there must be not exactly 1 $$$R$$$").op, cmp_op::ne);
    EXPECT_EQ(expr_as<cardinality>("there must not be more than 5 $$$R$$$"),
              (cardinality{"R", cmp_op::le, 5}));
}

TEST(Archetype, CardinalityDoubleNegationCancels) {
    EXPECT_EQ(expr_as<cardinality>("there must not be not exactly 1 $$$R$$$"),
              (cardinality{"R", cmp_op::eq, 1}));
    EXPECT_EQ(expr_as<cardinality>("there must not be not at least 2 $$$R$$$").op, cmp_op::ge);
    EXPECT_EQ(expr_as<cardinality>("there must not be exactly 1 $$$R$$$").op, cmp_op::ne);
    EXPECT_EQ(expr_as<cardinality>("there must not be no $$$R$$$"),
              (cardinality{"R", cmp_op::ne, 0}));
}

TEST(Archetype, CardinalityBeforeExistence) {
    EXPECT_EQ(formal("there must be at least 1 $$$R$$$").type, statement_type::cardinality);
    EXPECT_EQ(formal("there must be $$$R$$$").type, statement_type::existence);
}

TEST(Archetype, CoverageOfAllComponents) {
    auto c = expr_as<coverage>("all components must have an owner on layer $$$L$$$");
    EXPECT_TRUE(c.covers_all());
    EXPECT_EQ(c.layer, "L");
    EXPECT_TRUE(expr_as<coverage>("every component in the system must be covered by $$$L$$$")
                    .covers_all());
}

TEST(Archetype, CoverageOfReference) {
    auto c = expr_as<coverage>("$$$R$$$ must belong to a group on $$$L$$$");
    EXPECT_FALSE(c.covers_all());
    EXPECT_EQ(c.subject, "R");
    EXPECT_EQ(reference_names(c), (std::vector<std::string>{"R", "L"}));
    EXPECT_EQ(formal("every $$$R$$$ has an owner in $$$L$$$").type, statement_type::coverage);
}

TEST(Archetype, Correspondence) {
    EXPECT_EQ(expr_as<correspondence>("$$$a$$$ must correspond to $$$b$$$"),
              (correspondence{"a", "b"}));
    EXPECT_EQ(formal("$$$a$$$ should align with $$$b$$$").type, statement_type::correspondence);
    EXPECT_EQ(formal("$$$a$$$ matches $$$b$$$").type, statement_type::correspondence);
}

TEST(Archetype, Refinement) {
    EXPECT_EQ(expr_as<refinement>("$$$a$$$ must refine $$$b$$$"), (refinement{"a", "b"}));
    EXPECT_EQ(formal("$$$a$$$ must be a refinement of $$$b$$$").type, statement_type::refinement);
    // nest in is refinement, not containment
    EXPECT_EQ(formal("$$$a$$$ must nest in $$$b$$$").type, statement_type::refinement);
}

TEST(Archetype, MatchersStandAlone) {
    auto toks = scan_statement("$$$a$$$ not depend on $$$b$$$");
    EXPECT_TRUE(match_exclusion(toks).has_value());
    EXPECT_FALSE(match_containment(toks).has_value());
    EXPECT_FALSE(match_existence(toks).has_value());

    auto card = scan_statement("there be exactly 2 $$$R$$$");
    auto m = match_scaffold(card);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->type, statement_type::cardinality);
}

// =========================================================================
// 4. Classification
// =========================================================================

TEST(Classification, InformalText) {
    auto p = parse_statement("keep the design simple", known);
    EXPECT_EQ(p.classification, statement_class::informal);
    EXPECT_EQ(p.type, statement_type::unclassified);
    EXPECT_FALSE(p.expression.has_value());
    EXPECT_TRUE(p.errors.empty());
}

TEST(Classification, ReferencesButNoScaffold) {
    auto p = parse_statement("$$$a$$$ must talk to $$$b$$$", known);
    EXPECT_EQ(p.classification, statement_class::informal);
    EXPECT_EQ(p.references, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(p.modifier, modal::must);
}

TEST(Classification, TrailingWordsBreakScaffold) {
    EXPECT_EQ(parse_statement("$$$a$$$ must be in $$$b$$$ mostly", known).classification,
              statement_class::informal);
}

TEST(Classification, MalformedNumber) {
    auto p = parse_statement("there must be exactly three $$$R$$$", known);
    EXPECT_EQ(p.classification, statement_class::informal);
    EXPECT_EQ(p.type, statement_type::unclassified);
    EXPECT_FALSE(p.expression.has_value());
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0].kind, error_kind::syntax);
    EXPECT_EQ(p.errors[0].message, "expected a non-negative integer");
    EXPECT_EQ(p.errors[0].position, 22u);
    EXPECT_EQ(p.errors[0].token, "three");

    EXPECT_EQ(parse_statement("there must be at least -1 $$$R$$$", known).errors.size(), 1u);
}

TEST(Classification, UnknownNamesMakeSemiFormal) {
    auto p = parse_statement("$$$a$$$ must be in $$$ghost$$$", known);
    EXPECT_EQ(p.classification, statement_class::semi_formal);
    EXPECT_EQ(p.type, statement_type::containment);
    EXPECT_TRUE(p.expression.has_value());
    EXPECT_EQ(p.unresolved_names, (std::vector<std::string>{"ghost"}));
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0].kind, error_kind::unresolved_reference);
    EXPECT_EQ(p.errors[0].position, 19u);
    EXPECT_EQ(p.errors[0].token, "ghost");
}

TEST(Classification, RepeatedUnknownNameReportedOnce) {
    auto p = parse_statement("$$$x$$$ must not depend on $$$x$$$", known);
    EXPECT_EQ(p.unresolved_names.size(), 1u);
    EXPECT_EQ(p.errors.size(), 1u);
}

TEST(Classification, DetectTypeFromIndicatorPhrases) {
    EXPECT_EQ(detect_statement_type("Payments must have AT LEAST two owners"),
              statement_type::cardinality);
    EXPECT_EQ(detect_statement_type("every service should have an owner in the org chart"),
              statement_type::coverage);
    EXPECT_EQ(detect_statement_type("teams align with bounded contexts"),
              statement_type::correspondence);
    EXPECT_EQ(detect_statement_type("squads nest within tribes"), statement_type::refinement);
    EXPECT_EQ(detect_statement_type("the UI must not depend on the database"),
              statement_type::exclusion);
    EXPECT_EQ(detect_statement_type("billing should be contained by finance"),
              statement_type::containment);
    EXPECT_EQ(detect_statement_type("an audit log exists"), statement_type::existence);
    EXPECT_EQ(detect_statement_type("There should be a gateway"), statement_type::existence);
    EXPECT_FALSE(detect_statement_type("keep it simple").has_value());
}

TEST(Classification, DetectTypeIndicatorOrder) {
    // Cardinality phrases win over the existence opener.
    EXPECT_EQ(detect_statement_type("there must be exactly one gateway"),
              statement_type::cardinality);
    // Exclusion is checked before containment.
    EXPECT_EQ(detect_statement_type("ui must not depend on db and be in web"),
              statement_type::exclusion);
}

// =========================================================================
// 5. Context checks
// =========================================================================

TEST(ContextParse, LayerSlotNeedsLayerReference) {
    ref::context ctx(graph::graph_snapshot{},
                     {ref::list_reference("plain", {}), ref::layer_reference("tiers", "t"),
                      ref::layer_reference("teams", "o")});

    auto ok = parse_statement("$$$teams$$$ must correspond to $$$tiers$$$", ctx);
    EXPECT_EQ(ok.classification, statement_class::formal);

    auto bad = parse_statement("$$$plain$$$ must correspond to $$$tiers$$$", ctx);
    EXPECT_EQ(bad.classification, statement_class::semi_formal);
    ASSERT_EQ(bad.errors.size(), 1u);
    EXPECT_EQ(bad.errors[0].kind, error_kind::type_mismatch);
    EXPECT_EQ(bad.errors[0].token, "plain");

    // The subject of a coverage statement is not a layer slot.
    auto cov = parse_statement("$$$plain$$$ must belong to a group on $$$tiers$$$", ctx);
    EXPECT_EQ(cov.classification, statement_class::formal);
}

TEST(ContextParse, BrokenTagExpressionMakesStatementInvalid) {
    ref::context ctx(graph::graph_snapshot{},
                     {ref::tag_reference("bad", "'a' AND"), ref::tag_reference("good", "'a'")});

    auto const* def_err = ctx.definition_error("bad");
    ASSERT_NE(def_err, nullptr);
    EXPECT_EQ(def_err->kind, error_kind::syntax);
    EXPECT_EQ(def_err->position, 7u);
    EXPECT_EQ(ctx.definition_error("good"), nullptr);

    auto p = parse_statement("there must be $$$bad$$$", ctx);
    EXPECT_EQ(p.classification, statement_class::invalid);
    EXPECT_FALSE(p.is_formal());
    EXPECT_EQ(p.type, statement_type::existence);
    ASSERT_EQ(p.errors.size(), 1u);
    EXPECT_EQ(p.errors[0].kind, error_kind::syntax);
    EXPECT_EQ(p.errors[0].position, 7u);
    EXPECT_EQ(p.errors[0].message, "reference 'bad': unexpected end of expression");

    // Named twice, reported once.
    auto twice = parse_statement("$$$bad$$$ must not depend on $$$bad$$$", ctx);
    EXPECT_EQ(twice.classification, statement_class::invalid);
    EXPECT_EQ(twice.errors.size(), 1u);

    EXPECT_EQ(parse_statement("there must be $$$good$$$", ctx).classification,
              statement_class::formal);
    EXPECT_EQ(to_string(statement_class::invalid), "invalid");
}

// =========================================================================
// 6. Render
// =========================================================================

TEST(Render, CanonicalText) {
    EXPECT_EQ(render(existence{"R"}, modal::must), "there must be $$$R$$$");
    EXPECT_EQ(render(existence{"R"}, modal::none), "there is $$$R$$$");
    EXPECT_EQ(render(exclusion{"ui", "db", exclusion_reach::transitive, true}, modal::must),
              "$$$ui$$$ must not depend on $$$db$$$ transitively");
    EXPECT_EQ(render(exclusion{"ui", "db"}, modal::none), "$$$ui$$$ does not depend on $$$db$$$");
    EXPECT_EQ(render(cardinality{"R", cmp_op::ge, 2}, modal::should),
              "there should be at least 2 $$$R$$$");
    EXPECT_EQ(render(coverage{std::string(all_components), "L"}, modal::must),
              "all components must belong to a group on $$$L$$$");
}

TEST(Render, OutputParsesBack) {
    std::vector<formal_expression> const exprs{
        existence{"R"},
        containment{"a", "b"},
        exclusion{"a", "b", exclusion_reach::direct, true},
        cardinality{"R", cmp_op::ne, 1},
        coverage{"R", "L"},
        coverage{std::string(all_components), "L"},
        correspondence{"a", "b"},
        refinement{"a", "b"},
    };
    for (auto const& e : exprs) {
        for (auto m : {modal::must, modal::should, modal::none}) {
            auto const text = render(e, m);
            auto p = parse_statement(text, known);
            ASSERT_TRUE(p.expression.has_value()) << text;
            EXPECT_EQ(*p.expression, e) << text;
            EXPECT_EQ(p.modifier, m) << text;
            EXPECT_EQ(p.type, type_of(e)) << text;
        }
    }
}

TEST(Render, TemplatesCoverEveryArchetype) {
    constexpr auto templates = statement_templates();
    for (auto t : {statement_type::existence, statement_type::containment,
                   statement_type::exclusion, statement_type::cardinality,
                   statement_type::coverage, statement_type::correspondence,
                   statement_type::refinement}) {
        bool found = false;
        for (auto const& tpl : templates) found = found || tpl.type == t;
        EXPECT_TRUE(found) << to_string(t);
    }
}
