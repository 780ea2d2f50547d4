#include <gtest/gtest.h>
#include <agentcoord/agentcoord.hpp>

using namespace agentcoord;

// ===========================================================================
// Rule syntax
// ===========================================================================

TEST(PolicyParserTest, BareScopeMatchesEverything) {
    auto rules = parse_policy("open", "permit(principal, action, resource);");
    ASSERT_EQ(rules.size(), 1u);

    const auto& rule = rules[0];
    EXPECT_EQ(rule.policy_name, "open");
    EXPECT_EQ(rule.effect, PolicyEffect::Permit);
    EXPECT_FALSE(rule.principal.has_value());
    EXPECT_TRUE(rule.actions.empty());
    EXPECT_FALSE(rule.resource.has_value());
    EXPECT_TRUE(rule.matches("anyone", "anything", "anywhere", TRUST_SUSPENDED));
}

TEST(PolicyParserTest, ActionEqualityAndLists) {
    auto rules = parse_policy("p",
        "permit(principal, action == Action::\"acquire_lock\", resource);\n"
        "forbid(principal, action in [Action::\"force_push\", Action::\"delete_branch\"], resource);");
    ASSERT_EQ(rules.size(), 2u);

    EXPECT_EQ(rules[0].actions, std::vector<std::string>{"acquire_lock"});
    EXPECT_EQ(rules[1].effect, PolicyEffect::Forbid);
    EXPECT_EQ(rules[1].actions, (std::vector<std::string>{"force_push", "delete_branch"}));

    EXPECT_TRUE(rules[1].matches("a", "delete_branch", "", TRUST_ADMIN));
    EXPECT_FALSE(rules[1].matches("a", "acquire_lock", "", TRUST_ADMIN));
}

TEST(PolicyParserTest, PrincipalAndResourceEquality) {
    auto rules = parse_policy("p",
        "permit(principal == Agent::\"alice\", action, resource == Domain::\"github.com\");");
    ASSERT_EQ(rules.size(), 1u);

    ASSERT_TRUE(rules[0].principal.has_value());
    EXPECT_EQ(rules[0].principal->type, "Agent");
    EXPECT_EQ(rules[0].principal->id, "alice");
    ASSERT_TRUE(rules[0].resource.has_value());
    EXPECT_EQ(rules[0].resource->id, "github.com");

    EXPECT_TRUE(rules[0].matches("alice", "network_access", "github.com", TRUST_STANDARD));
    EXPECT_FALSE(rules[0].matches("bob", "network_access", "github.com", TRUST_STANDARD));
    EXPECT_FALSE(rules[0].matches("alice", "network_access", "gitlab.com", TRUST_STANDARD));
}

TEST(PolicyParserTest, NamespacedEntityType) {
    auto rules = parse_policy("p",
        "permit(principal == Coord::Agent::\"bot\", action, resource);");
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].principal->type, "Coord::Agent");
    EXPECT_EQ(rules[0].principal->id, "bot");
}

TEST(PolicyParserTest, WhenConditions) {
    auto rules = parse_policy("p",
        "permit(principal, action, resource)\n"
        "when { principal.trust_level >= 2 && principal.trust_level < 4 };");
    ASSERT_EQ(rules.size(), 1u);
    ASSERT_EQ(rules[0].conditions.size(), 2u);
    EXPECT_EQ(rules[0].conditions[0].op, Comparison::GreaterEqual);
    EXPECT_EQ(rules[0].conditions[1].op, Comparison::Less);

    EXPECT_FALSE(rules[0].matches("a", "x", "", TRUST_RESTRICTED));
    EXPECT_TRUE(rules[0].matches("a", "x", "", TRUST_STANDARD));
    EXPECT_TRUE(rules[0].matches("a", "x", "", TRUST_ELEVATED));
    EXPECT_FALSE(rules[0].matches("a", "x", "", TRUST_ADMIN));
}

TEST(PolicyParserTest, AllComparisonOperators) {
    TrustCondition c;
    c.value = 2;

    c.op = Comparison::Equal;        EXPECT_TRUE(c.holds(2));  EXPECT_FALSE(c.holds(3));
    c.op = Comparison::NotEqual;     EXPECT_TRUE(c.holds(3));  EXPECT_FALSE(c.holds(2));
    c.op = Comparison::Greater;      EXPECT_TRUE(c.holds(3));  EXPECT_FALSE(c.holds(2));
    c.op = Comparison::GreaterEqual; EXPECT_TRUE(c.holds(2));  EXPECT_FALSE(c.holds(1));
    c.op = Comparison::Less;         EXPECT_TRUE(c.holds(1));  EXPECT_FALSE(c.holds(2));
    c.op = Comparison::LessEqual;    EXPECT_TRUE(c.holds(2));  EXPECT_FALSE(c.holds(3));

    EXPECT_STREQ(to_string(Comparison::GreaterEqual), ">=");
    EXPECT_STREQ(to_string(PolicyEffect::Forbid), "forbid");
}

TEST(PolicyParserTest, CommentsAndWhitespaceAreIgnored) {
    auto rules = parse_policy("p",
        "// suspended agents\n"
        "forbid(principal, action, resource)   // everything\n"
        "   when { principal.trust_level == 0 };\n"
        "\n"
        "// nothing else\n");
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].effect, PolicyEffect::Forbid);
}

TEST(PolicyParserTest, EmptyDocumentHasNoRules) {
    EXPECT_TRUE(parse_policy("p", "").empty());
    EXPECT_TRUE(parse_policy("p", "  // only a comment").empty());
}

TEST(PolicyParserTest, EscapedQuotesInStrings) {
    auto rules = parse_policy("p",
        "permit(principal, action, resource == File::\"say \\\"hi\\\".txt\");");
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].resource->id, "say \"hi\".txt");
}

TEST(PolicyParserTest, DefaultDocumentsParse) {
    for (const auto& document : default_policy_documents()) {
        EXPECT_NO_THROW(parse_policy(document.name, document.text)) << document.name;
    }
}

// ===========================================================================
// Parse errors
// ===========================================================================

TEST(PolicyParserErrorTest, MissingSemicolonReportsEndOfInput) {
    const std::string text = "permit(principal, action, resource)";
    try {
        parse_policy("broken", text);
        FAIL() << "expected PolicyParseException";
    } catch (const PolicyParseException& e) {
        EXPECT_EQ(e.policy_name(), "broken");
        EXPECT_EQ(e.offset(), text.size());
        EXPECT_NE(std::string(e.what()).find("end of input"), std::string::npos);
    }
}

TEST(PolicyParserErrorTest, NonActionEntityInActionScope) {
    try {
        parse_policy("p", "permit(principal, action == Ation::\"x\", resource);");
        FAIL() << "expected PolicyParseException";
    } catch (const PolicyParseException& e) {
        EXPECT_EQ(e.offset(), 28u);
        EXPECT_NE(std::string(e.what()).find("expected Action entity"), std::string::npos);
    }
}

TEST(PolicyParserErrorTest, UnexpectedCharacter) {
    try {
        parse_policy("p", "permit@");
        FAIL() << "expected PolicyParseException";
    } catch (const PolicyParseException& e) {
        EXPECT_EQ(e.offset(), 6u);
    }
}

TEST(PolicyParserErrorTest, UnterminatedString) {
    try {
        parse_policy("p", "permit(principal == Agent::\"alice, action, resource);");
        FAIL() << "expected PolicyParseException";
    } catch (const PolicyParseException& e) {
        EXPECT_EQ(e.offset(), 27u);
    }
}

TEST(PolicyParserErrorTest, MalformedRules) {
    EXPECT_THROW(parse_policy("p", "allow(principal, action, resource);"), PolicyParseException);
    EXPECT_THROW(parse_policy("p", "permit(action, principal, resource);"), PolicyParseException);
    EXPECT_THROW(parse_policy("p", "permit(principal, action in [], resource);"), PolicyParseException);
    EXPECT_THROW(parse_policy("p", "permit(principal, action, resource) when { };"),
                 PolicyParseException);
    EXPECT_THROW(parse_policy("p",
                 "permit(principal, action, resource) when { principal.trust_level >= high };"),
                 PolicyParseException);
    EXPECT_THROW(parse_policy("p",
                 "permit(principal, action, resource) when { principal.role == 2 };"),
                 PolicyParseException);
}

TEST(PolicyParserErrorTest, ErrorIsCoordinationException) {
    EXPECT_THROW(parse_policy("p", "permit("), CoordinationException);
}
