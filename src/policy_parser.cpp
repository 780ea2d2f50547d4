#include "agentcoord/policy_parser.hpp"
#include "agentcoord/exceptions.hpp"

#include <algorithm>
#include <cctype>

namespace agentcoord {

namespace {

enum class TokenKind { Identifier, String, Integer, Symbol, End };

struct Token {
    TokenKind kind{TokenKind::End};
    std::string text;
    std::size_t offset{0};
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::vector<Token> tokenize(const std::string& name, const std::string& text) {
    static const char* const two_char[] = {"::", "==", "!=", ">=", "<=", "&&"};
    static const std::string single_char = "()[]{},;.<>";

    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            while (i < text.size() && text[i] != '\n') ++i;
            continue;
        }

        Token tok;
        tok.offset = i;

        if (is_ident_start(c)) {
            std::size_t start = i;
            while (i < text.size() && is_ident_char(text[i])) ++i;
            tok.kind = TokenKind::Identifier;
            tok.text = text.substr(start, i - start);
        } else if (is_digit(c) || (c == '-' && i + 1 < text.size() && is_digit(text[i + 1]))) {
            std::size_t start = i++;
            while (i < text.size() && is_digit(text[i])) ++i;
            tok.kind = TokenKind::Integer;
            tok.text = text.substr(start, i - start);
        } else if (c == '"') {
            ++i;
            bool closed = false;
            while (i < text.size()) {
                char ch = text[i++];
                if (ch == '"') {
                    closed = true;
                    break;
                }
                if (ch == '\\' && i < text.size()) {
                    ch = text[i++];
                }
                tok.text += ch;
            }
            if (!closed) {
                throw PolicyParseException(name, tok.offset, "unterminated string literal");
            }
            tok.kind = TokenKind::String;
        } else {
            bool matched = false;
            for (const char* sym : two_char) {
                if (text.compare(i, 2, sym) == 0) {
                    tok.kind = TokenKind::Symbol;
                    tok.text = sym;
                    i += 2;
                    matched = true;
                    break;
                }
            }
            if (!matched) {
                if (single_char.find(c) == std::string::npos) {
                    throw PolicyParseException(name, i, std::string("unexpected character '") + c + "'");
                }
                tok.kind = TokenKind::Symbol;
                tok.text = std::string(1, c);
                ++i;
            }
        }
        tokens.push_back(std::move(tok));
    }

    Token end;
    end.kind = TokenKind::End;
    end.offset = text.size();
    tokens.push_back(end);
    return tokens;
}

class Parser {
public:
    Parser(const std::string& name, std::vector<Token> tokens)
        : name_(name), tokens_(std::move(tokens)) {}

    std::vector<PolicyRule> parse() {
        std::vector<PolicyRule> rules;
        while (peek().kind != TokenKind::End) {
            rules.push_back(parse_rule());
        }
        return rules;
    }

private:
    const std::string& name_;
    std::vector<Token> tokens_;
    std::size_t pos_{0};

    const Token& peek() const { return tokens_[pos_]; }

    const Token& advance() {
        const Token& tok = tokens_[pos_];
        if (tok.kind != TokenKind::End) ++pos_;
        return tok;
    }

    [[noreturn]] void fail(const std::string& detail) const {
        throw PolicyParseException(name_, peek().offset, detail);
    }

    std::string describe(const Token& tok) const {
        return tok.kind == TokenKind::End ? std::string("end of input") : "'" + tok.text + "'";
    }

    bool accept_symbol(const char* sym) {
        if (peek().kind == TokenKind::Symbol && peek().text == sym) {
            advance();
            return true;
        }
        return false;
    }

    bool accept_keyword(const char* word) {
        if (peek().kind == TokenKind::Identifier && peek().text == word) {
            advance();
            return true;
        }
        return false;
    }

    void expect_symbol(const char* sym) {
        if (!accept_symbol(sym)) {
            fail(std::string("expected '") + sym + "', found " + describe(peek()));
        }
    }

    void expect_keyword(const char* word) {
        if (!accept_keyword(word)) {
            fail(std::string("expected '") + word + "', found " + describe(peek()));
        }
    }

    std::string expect_identifier() {
        if (peek().kind != TokenKind::Identifier) {
            fail("expected identifier, found " + describe(peek()));
        }
        return advance().text;
    }

    PolicyRule parse_rule() {
        PolicyRule rule;
        rule.policy_name = name_;

        if (accept_keyword("permit")) {
            rule.effect = PolicyEffect::Permit;
        } else if (accept_keyword("forbid")) {
            rule.effect = PolicyEffect::Forbid;
        } else {
            fail("expected 'permit' or 'forbid', found " + describe(peek()));
        }

        expect_symbol("(");

        expect_keyword("principal");
        if (accept_symbol("==")) {
            rule.principal = parse_entity();
        }
        expect_symbol(",");

        expect_keyword("action");
        if (accept_symbol("==")) {
            rule.actions.push_back(parse_action());
        } else if (accept_keyword("in")) {
            expect_symbol("[");
            do {
                rule.actions.push_back(parse_action());
            } while (accept_symbol(","));
            expect_symbol("]");
        }
        expect_symbol(",");

        expect_keyword("resource");
        if (accept_symbol("==")) {
            rule.resource = parse_entity();
        }
        expect_symbol(")");

        if (accept_keyword("when")) {
            expect_symbol("{");
            do {
                rule.conditions.push_back(parse_condition());
            } while (accept_symbol("&&"));
            expect_symbol("}");
        }

        expect_symbol(";");
        return rule;
    }

    // Type::"id" with optional namespaces (Ns::Type::"id")
    EntityRef parse_entity() {
        EntityRef entity;
        entity.type = expect_identifier();
        expect_symbol("::");
        while (peek().kind == TokenKind::Identifier) {
            entity.type += "::" + advance().text;
            expect_symbol("::");
        }
        if (peek().kind != TokenKind::String) {
            fail("expected entity id string, found " + describe(peek()));
        }
        entity.id = advance().text;
        return entity;
    }

    std::string parse_action() {
        std::size_t offset = peek().offset;
        auto entity = parse_entity();
        if (entity.type != "Action") {
            throw PolicyParseException(name_, offset, "expected Action entity, found " + entity.type);
        }
        return entity.id;
    }

    TrustCondition parse_condition() {
        expect_keyword("principal");
        expect_symbol(".");
        expect_keyword("trust_level");

        TrustCondition condition;
        const Token& op = peek();
        if (op.kind != TokenKind::Symbol) {
            fail("expected comparison operator, found " + describe(op));
        }
        if (op.text == "==")      condition.op = Comparison::Equal;
        else if (op.text == "!=") condition.op = Comparison::NotEqual;
        else if (op.text == ">=") condition.op = Comparison::GreaterEqual;
        else if (op.text == ">")  condition.op = Comparison::Greater;
        else if (op.text == "<=") condition.op = Comparison::LessEqual;
        else if (op.text == "<")  condition.op = Comparison::Less;
        else fail("expected comparison operator, found " + describe(op));
        advance();

        if (peek().kind != TokenKind::Integer || peek().text.size() > 9) {
            fail("expected integer trust level, found " + describe(peek()));
        }
        condition.value = static_cast<TrustLevel>(std::stol(advance().text));
        return condition;
    }
};

} // anonymous namespace

bool TrustCondition::holds(TrustLevel trust) const noexcept {
    switch (op) {
        case Comparison::Equal:        return trust == value;
        case Comparison::NotEqual:     return trust != value;
        case Comparison::GreaterEqual: return trust >= value;
        case Comparison::Greater:      return trust > value;
        case Comparison::LessEqual:    return trust <= value;
        case Comparison::Less:         return trust < value;
    }
    return false;
}

bool PolicyRule::matches(const AgentId& agent_id, const std::string& action,
                         const std::string& resource_id, TrustLevel trust) const {
    if (principal && principal->id != agent_id) {
        return false;
    }
    if (!actions.empty() && std::find(actions.begin(), actions.end(), action) == actions.end()) {
        return false;
    }
    if (resource && resource->id != resource_id) {
        return false;
    }
    return std::all_of(conditions.begin(), conditions.end(),
                       [trust](const TrustCondition& c) { return c.holds(trust); });
}

std::vector<PolicyRule> parse_policy(const std::string& policy_name, const std::string& text) {
    Parser parser(policy_name, tokenize(policy_name, text));
    return parser.parse();
}

const char* to_string(PolicyEffect effect) {
    switch (effect) {
        case PolicyEffect::Permit: return "permit";
        case PolicyEffect::Forbid: return "forbid";
    }
    return "unknown";
}

const char* to_string(Comparison op) {
    switch (op) {
        case Comparison::Equal:        return "==";
        case Comparison::NotEqual:     return "!=";
        case Comparison::GreaterEqual: return ">=";
        case Comparison::Greater:      return ">";
        case Comparison::LessEqual:    return "<=";
        case Comparison::Less:         return "<";
    }
    return "?";
}

} // namespace agentcoord
