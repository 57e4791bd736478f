#include "expr/Expression.hpp"
#include "expr/Functions.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace weft {
namespace expr {

namespace {

bool isNameStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string describe(const Token& tok) {
    if (tok.type == TokenType::END) return "end of expression";
    if (tok.type == TokenType::STRING) return "string \"" + tok.text + "\"";
    return "'" + tok.text + "'";
}

AstNodePtr makeNode(AstNode::Type type, std::vector<AstNodePtr> children = {}, std::string name = "") {
    auto node = std::make_shared<AstNode>();
    node->type = type;
    for (const auto& child : children) {
        node->height = std::max(node->height, child->height + 1);
    }
    if (node->height > kMaxTreeHeight) {
        throw std::runtime_error("Expression nested too deeply");
    }
    node->children = std::move(children);
    node->name = std::move(name);
    return node;
}

/**
 * Counts parser recursion for the lifetime of one parse call
 */
class NestingGuard {
public:
    explicit NestingGuard(size_t& depth) : m_depth(depth) { ++m_depth; }
    ~NestingGuard() { --m_depth; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

    bool exceeded() const { return m_depth > kMaxNestingDepth; }

private:
    size_t& m_depth;
};

AstNodePtr makeLiteral(json value) {
    auto node = std::make_shared<AstNode>();
    node->type = AstNode::Type::Literal;
    node->value = std::move(value);
    return node;
}

} // anonymous namespace

// ============================================================================
// Tokenizer
// ============================================================================

Tokenizer::Tokenizer(const std::string& input) : m_input(input) {}

void Tokenizer::skipWhitespaceAndComments() {
    while (m_pos < m_input.size()) {
        if (std::isspace(static_cast<unsigned char>(m_input[m_pos]))) {
            ++m_pos;
        } else if (m_input.compare(m_pos, 2, "/*") == 0) {
            size_t end = m_input.find("*/", m_pos + 2);
            if (end == std::string::npos) {
                throw std::runtime_error("Unterminated comment at position " + std::to_string(m_pos));
            }
            m_pos = end + 2;
        } else {
            break;
        }
    }
}

Token Tokenizer::readNumber() {
    size_t start = m_pos;
    bool isFloat = false;

    while (m_pos < m_input.size() && std::isdigit(static_cast<unsigned char>(m_input[m_pos]))) {
        ++m_pos;
    }
    if (m_pos + 1 < m_input.size() && m_input[m_pos] == '.' &&
        std::isdigit(static_cast<unsigned char>(m_input[m_pos + 1]))) {
        isFloat = true;
        ++m_pos;
        while (m_pos < m_input.size() && std::isdigit(static_cast<unsigned char>(m_input[m_pos]))) {
            ++m_pos;
        }
    }
    if (m_pos < m_input.size() && (m_input[m_pos] == 'e' || m_input[m_pos] == 'E')) {
        size_t save = m_pos;
        ++m_pos;
        if (m_pos < m_input.size() && (m_input[m_pos] == '+' || m_input[m_pos] == '-')) {
            ++m_pos;
        }
        if (m_pos < m_input.size() && std::isdigit(static_cast<unsigned char>(m_input[m_pos]))) {
            isFloat = true;
            while (m_pos < m_input.size() && std::isdigit(static_cast<unsigned char>(m_input[m_pos]))) {
                ++m_pos;
            }
        } else {
            m_pos = save;
        }
    }

    Token tok;
    tok.type = TokenType::NUMBER;
    tok.pos = start;
    tok.text = m_input.substr(start, m_pos - start);
    tok.numericValue = std::stod(tok.text);
    tok.integral = !isFloat;
    return tok;
}

Token Tokenizer::readString(char quote) {
    size_t start = m_pos;
    ++m_pos;  // opening quote
    std::string value;

    while (m_pos < m_input.size() && m_input[m_pos] != quote) {
        char c = m_input[m_pos];
        if (c == '\\') {
            if (m_pos + 1 >= m_input.size()) break;
            char esc = m_input[++m_pos];
            switch (esc) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                case 'b': value += '\b'; break;
                case 'f': value += '\f'; break;
                case 'u': {
                    if (m_pos + 4 >= m_input.size()) {
                        throw std::runtime_error("Invalid unicode escape at position " + std::to_string(m_pos));
                    }
                    std::string hex = m_input.substr(m_pos + 1, 4);
                    for (char h : hex) {
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(m_pos));
                        }
                    }
                    appendUtf8(value, static_cast<uint32_t>(std::stoul(hex, nullptr, 16)));
                    m_pos += 4;
                    break;
                }
                default: value += esc; break;
            }
            ++m_pos;
        } else {
            value += c;
            ++m_pos;
        }
    }

    if (m_pos >= m_input.size()) {
        throw std::runtime_error("Unterminated string literal at position " + std::to_string(start));
    }
    ++m_pos;  // closing quote

    Token tok;
    tok.type = TokenType::STRING;
    tok.text = std::move(value);
    tok.pos = start;
    return tok;
}

Token Tokenizer::readName() {
    size_t start = m_pos;
    while (m_pos < m_input.size() && isNameChar(m_input[m_pos])) {
        ++m_pos;
    }
    Token tok;
    tok.type = TokenType::NAME;
    tok.text = m_input.substr(start, m_pos - start);
    tok.pos = start;
    return tok;
}

Token Tokenizer::readQuotedName() {
    // `field with spaces`
    size_t start = m_pos;
    size_t end = m_input.find('`', m_pos + 1);
    if (end == std::string::npos) {
        throw std::runtime_error("Unterminated quoted name at position " + std::to_string(start));
    }
    Token tok;
    tok.type = TokenType::NAME;
    tok.text = m_input.substr(start + 1, end - start - 1);
    tok.pos = start;
    tok.quotedName = true;
    m_pos = end + 1;
    return tok;
}

Token Tokenizer::readVariable() {
    size_t start = m_pos;
    ++m_pos;  // $
    Token tok;
    tok.type = TokenType::VARIABLE;
    tok.pos = start;

    if (m_pos < m_input.size() && m_input[m_pos] == '$') {
        ++m_pos;
        tok.text = "$$";
        return tok;
    }

    size_t nameStart = m_pos;
    while (m_pos < m_input.size() && isNameChar(m_input[m_pos])) {
        ++m_pos;
    }
    tok.text = "$" + m_input.substr(nameStart, m_pos - nameStart);
    return tok;
}

Token Tokenizer::next() {
    skipWhitespaceAndComments();

    if (m_pos >= m_input.size()) {
        Token tok;
        tok.type = TokenType::END;
        tok.pos = m_pos;
        return tok;
    }

    char c = m_input[m_pos];
    size_t start = m_pos;

    auto single = [&](TokenType type) {
        ++m_pos;
        Token tok;
        tok.type = type;
        tok.text = std::string(1, c);
        tok.pos = start;
        return tok;
    };
    auto twoChar = [&](TokenType type, const char* text) {
        m_pos += 2;
        Token tok;
        tok.type = type;
        tok.text = text;
        tok.pos = start;
        return tok;
    };
    char nextChar = m_pos + 1 < m_input.size() ? m_input[m_pos + 1] : '\0';

    switch (c) {
        case '.': return single(TokenType::DOT);
        case ',': return single(TokenType::COMMA);
        case ':': return single(TokenType::COLON);
        case '?': return single(TokenType::QUESTION);
        case '(': return single(TokenType::LPAREN);
        case ')': return single(TokenType::RPAREN);
        case '[': return single(TokenType::LBRACKET);
        case ']': return single(TokenType::RBRACKET);
        case '{': return single(TokenType::LBRACE);
        case '}': return single(TokenType::RBRACE);
        case '+': return single(TokenType::PLUS);
        case '-': return single(TokenType::MINUS);
        case '*': return single(TokenType::STAR);
        case '/': return single(TokenType::SLASH);
        case '%': return single(TokenType::PERCENT);
        case '&': return single(TokenType::AMP);
        case '=': return single(TokenType::EQ);
        case '!':
            if (nextChar == '=') return twoChar(TokenType::NEQ, "!=");
            break;
        case '<':
            if (nextChar == '=') return twoChar(TokenType::LTE, "<=");
            return single(TokenType::LT);
        case '>':
            if (nextChar == '=') return twoChar(TokenType::GTE, ">=");
            return single(TokenType::GT);
        case '"':
        case '\'':
            return readString(c);
        case '`':
            return readQuotedName();
        case '$':
            return readVariable();
    }

    if (std::isdigit(static_cast<unsigned char>(c))) {
        return readNumber();
    }

    if (isNameStart(c)) {
        return readName();
    }

    throw std::runtime_error("Unexpected character '" + std::string(1, c) +
                             "' at position " + std::to_string(m_pos));
}

Token Tokenizer::peek() {
    size_t savedPos = m_pos;
    Token tok = next();
    m_pos = savedPos;
    return tok;
}

// ============================================================================
// Parser
// ============================================================================

Parser::Parser(const std::string& expression)
    : m_tokenizer(expression)
{
    advance();
}

void Parser::advance() {
    m_currentToken = m_tokenizer.next();
}

void Parser::fail(const std::string& message) const {
    throw std::runtime_error(message + " at position " + std::to_string(m_currentToken.pos));
}

void Parser::expect(TokenType type, const std::string& what) {
    if (m_currentToken.type != type) {
        fail("Expected " + what + " but found " + describe(m_currentToken));
    }
    advance();
}

bool Parser::isKeyword(const std::string& word) const {
    return m_currentToken.type == TokenType::NAME &&
           !m_currentToken.quotedName &&
           m_currentToken.text == word;
}

AstNodePtr Parser::parse() {
    AstNodePtr root = parseCondition();
    if (m_currentToken.type != TokenType::END) {
        fail("Unexpected " + describe(m_currentToken));
    }
    return root;
}

AstNodePtr Parser::parseCondition() {
    NestingGuard guard(m_depth);
    if (guard.exceeded()) {
        fail("Expression nested too deeply");
    }
    AstNodePtr condition = parseOr();
    if (m_currentToken.type != TokenType::QUESTION) {
        return condition;
    }
    advance();
    AstNodePtr whenTrue = parseCondition();
    expect(TokenType::COLON, "':' in conditional expression");
    AstNodePtr whenFalse = parseCondition();
    return makeNode(AstNode::Type::Condition, {condition, whenTrue, whenFalse});
}

AstNodePtr Parser::parseOr() {
    AstNodePtr left = parseAnd();
    while (isKeyword("or")) {
        advance();
        AstNodePtr right = parseAnd();
        left = makeNode(AstNode::Type::Binary, {left, right}, "or");
    }
    return left;
}

AstNodePtr Parser::parseAnd() {
    AstNodePtr left = parseComparison();
    while (isKeyword("and")) {
        advance();
        AstNodePtr right = parseComparison();
        left = makeNode(AstNode::Type::Binary, {left, right}, "and");
    }
    return left;
}

AstNodePtr Parser::parseComparison() {
    AstNodePtr left = parseAdditive();

    std::string op;
    switch (m_currentToken.type) {
        case TokenType::EQ:
        case TokenType::NEQ:
        case TokenType::LT:
        case TokenType::LTE:
        case TokenType::GT:
        case TokenType::GTE:
            op = m_currentToken.text;
            break;
        default:
            if (isKeyword("in")) op = "in";
            break;
    }
    if (op.empty()) {
        return left;
    }

    advance();
    AstNodePtr right = parseAdditive();
    return makeNode(AstNode::Type::Binary, {left, right}, op);
}

AstNodePtr Parser::parseAdditive() {
    AstNodePtr left = parseTerm();
    while (m_currentToken.type == TokenType::PLUS ||
           m_currentToken.type == TokenType::MINUS ||
           m_currentToken.type == TokenType::AMP) {
        std::string op = m_currentToken.text;
        advance();
        AstNodePtr right = parseTerm();
        left = makeNode(AstNode::Type::Binary, {left, right}, op);
    }
    return left;
}

AstNodePtr Parser::parseTerm() {
    AstNodePtr left = parseUnary();
    while (m_currentToken.type == TokenType::STAR ||
           m_currentToken.type == TokenType::SLASH ||
           m_currentToken.type == TokenType::PERCENT) {
        std::string op = m_currentToken.text;
        advance();
        AstNodePtr right = parseUnary();
        left = makeNode(AstNode::Type::Binary, {left, right}, op);
    }
    return left;
}

AstNodePtr Parser::parseUnary() {
    if (m_currentToken.type != TokenType::MINUS) {
        return parsePostfix();
    }
    NestingGuard guard(m_depth);
    if (guard.exceeded()) {
        fail("Expression nested too deeply");
    }
    advance();
    AstNodePtr operand = parseUnary();
    if (operand->type == AstNode::Type::Literal && operand->value.is_number()) {
        if (operand->value.is_number_integer()) {
            return makeLiteral(-operand->value.get<int64_t>());
        }
        return makeLiteral(-operand->value.get<double>());
    }
    return makeNode(AstNode::Type::Negate, {operand});
}

AstNodePtr Parser::parsePostfix() {
    AstNodePtr node = parsePrimary();

    while (true) {
        if (m_currentToken.type == TokenType::DOT) {
            advance();
            node = makeNode(AstNode::Type::Path, {node, parseStep()});
        } else if (m_currentToken.type == TokenType::LBRACKET) {
            advance();
            if (m_currentToken.type == TokenType::RBRACKET) {
                // a[] keeps the value as is
                advance();
                continue;
            }
            if (m_currentToken.type == TokenType::STAR && m_tokenizer.peek().type == TokenType::RBRACKET) {
                advance();
                advance();
                node = makeNode(AstNode::Type::Path, {node, makeNode(AstNode::Type::Wildcard)});
                continue;
            }
            AstNodePtr predicate = parseCondition();
            expect(TokenType::RBRACKET, "']'");
            node = makeNode(AstNode::Type::Predicate, {node, predicate});
        } else {
            return node;
        }
    }
}

AstNodePtr Parser::parseStep() {
    switch (m_currentToken.type) {
        case TokenType::NAME: {
            std::string name = m_currentToken.text;
            advance();
            return makeNode(AstNode::Type::Field, {}, name);
        }
        case TokenType::STAR:
            advance();
            return makeNode(AstNode::Type::Wildcard);
        case TokenType::LPAREN:
        case TokenType::VARIABLE:
        case TokenType::LBRACE:
        case TokenType::LBRACKET:
            return parsePrimary();
        default:
            fail("Expected field name after '.' but found " + describe(m_currentToken));
    }
}

AstNodePtr Parser::parsePrimary() {
    Token tok = m_currentToken;

    switch (tok.type) {
        case TokenType::NUMBER:
            advance();
            if (tok.integral && std::fabs(tok.numericValue) < 9007199254740992.0) {
                return makeLiteral(static_cast<int64_t>(tok.numericValue));
            }
            return makeLiteral(tok.numericValue);

        case TokenType::STRING:
            advance();
            return makeLiteral(tok.text);

        case TokenType::NAME:
            if (!tok.quotedName) {
                if (tok.text == "true") { advance(); return makeLiteral(true); }
                if (tok.text == "false") { advance(); return makeLiteral(false); }
                if (tok.text == "null") { advance(); return makeLiteral(nullptr); }
                if (tok.text == "and" || tok.text == "or" || tok.text == "in") {
                    fail("Unexpected keyword '" + tok.text + "'");
                }
            }
            advance();
            return makeNode(AstNode::Type::Field, {}, tok.text);

        case TokenType::STAR:
            advance();
            return makeNode(AstNode::Type::Wildcard);

        case TokenType::VARIABLE:
            advance();
            if (tok.text == "$") return makeNode(AstNode::Type::Context);
            if (tok.text == "$$") return makeNode(AstNode::Type::Root);
            if (m_currentToken.type == TokenType::LPAREN) {
                return parseCall(tok.text.substr(1));
            }
            return makeNode(AstNode::Type::Variable, {}, tok.text.substr(1));

        case TokenType::LPAREN: {
            advance();
            AstNodePtr inner = parseCondition();
            expect(TokenType::RPAREN, "')'");
            return inner;
        }

        case TokenType::LBRACKET:
            return parseArray();

        case TokenType::LBRACE:
            return parseObject();

        default:
            fail("Unexpected " + describe(tok));
    }
}

AstNodePtr Parser::parseCall(const std::string& name) {
    const FunctionSpec* spec = findFunction(name);
    if (!spec) {
        fail("Unknown function: $" + name);
    }

    expect(TokenType::LPAREN, "'('");
    std::vector<AstNodePtr> args;
    if (m_currentToken.type != TokenType::RPAREN) {
        args.push_back(parseCondition());
        while (m_currentToken.type == TokenType::COMMA) {
            advance();
            args.push_back(parseCondition());
        }
    }
    expect(TokenType::RPAREN, "')' after function arguments");

    if (args.size() < spec->minArgs || args.size() > spec->maxArgs) {
        fail("Wrong number of arguments for $" + name + ": got " + std::to_string(args.size()));
    }
    return makeNode(AstNode::Type::Call, std::move(args), name);
}

AstNodePtr Parser::parseArray() {
    expect(TokenType::LBRACKET, "'['");
    std::vector<AstNodePtr> items;
    if (m_currentToken.type != TokenType::RBRACKET) {
        items.push_back(parseCondition());
        while (m_currentToken.type == TokenType::COMMA) {
            advance();
            items.push_back(parseCondition());
        }
    }
    expect(TokenType::RBRACKET, "']'");
    return makeNode(AstNode::Type::ArrayCtor, std::move(items));
}

AstNodePtr Parser::parseObject() {
    expect(TokenType::LBRACE, "'{'");
    std::vector<AstNodePtr> pairs;
    if (m_currentToken.type != TokenType::RBRACE) {
        while (true) {
            pairs.push_back(parseCondition());
            expect(TokenType::COLON, "':' in object constructor");
            pairs.push_back(parseCondition());
            if (m_currentToken.type != TokenType::COMMA) break;
            advance();
        }
    }
    expect(TokenType::RBRACE, "'}'");
    return makeNode(AstNode::Type::ObjectCtor, std::move(pairs));
}

} // namespace expr
} // namespace weft
