#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace weft {
namespace expr {

using json = nlohmann::json;

/// Variables visible as $name inside an expression
using Bindings = std::map<std::string, json>;

inline constexpr std::chrono::milliseconds kDefaultTimeout{100};

/// Deepest bracket / unary / conditional nesting the parser accepts
inline constexpr size_t kMaxNestingDepth = 256;

/// Tallest syntax tree the parser builds and the evaluator walks
inline constexpr size_t kMaxTreeHeight = 1024;

/**
 * Token types for the expression lexer
 */
enum class TokenType {
    NUMBER,     // 42, 3.14, 1e3
    STRING,     // "text" or 'text'
    NAME,       // field name, keyword (and, or, in, true, false, null) or `quoted name`
    VARIABLE,   // $, $$, $name
    DOT,        // .
    COMMA,      // ,
    COLON,      // :
    QUESTION,   // ?
    LPAREN,     // (
    RPAREN,     // )
    LBRACKET,   // [
    RBRACKET,   // ]
    LBRACE,     // {
    RBRACE,     // }
    PLUS,       // +
    MINUS,      // -
    STAR,       // *
    SLASH,      // /
    PERCENT,    // %
    AMP,        // &
    EQ,         // =
    NEQ,        // !=
    LT,         // <
    LTE,        // <=
    GT,         // >
    GTE,        // >=
    END         // End of input
};

struct Token {
    TokenType type = TokenType::END;
    std::string text;
    double numericValue = 0.0;
    size_t pos = 0;
    bool quotedName = false;    // NAME written with backticks, never a keyword
    bool integral = false;      // NUMBER without fraction or exponent
};

/**
 * AST produced by the parser and walked by the evaluator
 */
struct AstNode;

using AstNodePtr = std::shared_ptr<const AstNode>;

struct AstNode {
    enum class Type {
        Literal,        // value
        Field,          // name, looked up on the current context
        Wildcard,       // *, every value of the current context
        Context,        // $
        Root,           // $$
        Variable,       // $name
        Path,           // children[0] . children[1]
        Predicate,      // children[0] [ children[1] ]
        Negate,         // - children[0]
        Binary,         // children[0] op children[1]
        Condition,      // children[0] ? children[1] : children[2]
        ArrayCtor,      // [ children... ]
        ObjectCtor,     // { children[2i] : children[2i+1] ... }
        Call            // $name( children... )
    };

    Type type = Type::Literal;
    json value;                         // Literal
    std::string name;                   // Field, Variable, Call, Binary operator
    std::vector<AstNodePtr> children;
    size_t height = 1;                  // 1 + tallest child
};

/**
 * Tokenizer for the expression language
 */
class Tokenizer {
public:
    explicit Tokenizer(const std::string& input);
    Token next();
    Token peek();

private:
    std::string m_input;
    size_t m_pos = 0;

    void skipWhitespaceAndComments();
    Token readNumber();
    Token readString(char quote);
    Token readName();
    Token readQuotedName();
    Token readVariable();
};

/**
 * Recursive descent parser
 *
 * Grammar (lowest precedence first):
 *   condition  := or ('?' condition ':' condition)?
 *   or         := and ('or' and)*
 *   and        := comparison ('and' comparison)*
 *   comparison := additive (('=' | '!=' | '<' | '<=' | '>' | '>=' | 'in') additive)?
 *   additive   := term (('+' | '-' | '&') term)*
 *   term       := unary (('*' | '/' | '%') unary)*
 *   unary      := '-' unary | postfix
 *   postfix    := primary ('.' step | '[' condition ']')*
 *   primary    := NUMBER | STRING | NAME | '*' | VARIABLE | call
 *               | '(' condition ')' | '[' list ']' | '{' pairs '}'
 *
 * Throws std::runtime_error with a position-annotated message, including
 * "Expression nested too deeply" past kMaxNestingDepth / kMaxTreeHeight.
 */
class Parser {
public:
    explicit Parser(const std::string& expression);

    AstNodePtr parse();

private:
    Tokenizer m_tokenizer;
    Token m_currentToken;
    size_t m_depth = 0;

    void advance();
    void expect(TokenType type, const std::string& what);
    bool isKeyword(const std::string& word) const;
    [[noreturn]] void fail(const std::string& message) const;

    AstNodePtr parseCondition();
    AstNodePtr parseOr();
    AstNodePtr parseAnd();
    AstNodePtr parseComparison();
    AstNodePtr parseAdditive();
    AstNodePtr parseTerm();
    AstNodePtr parseUnary();
    AstNodePtr parsePostfix();
    AstNodePtr parseStep();
    AstNodePtr parsePrimary();
    AstNodePtr parseCall(const std::string& name);
    AstNodePtr parseArray();
    AstNodePtr parseObject();
};

/**
 * A parsed expression, reusable across evaluations
 *
 * Usage:
 *   auto e = Expression::compile("input.items[price > 10].name", "metadata.where");
 *   json names = e.evaluate(context);
 */
class Expression {
public:
    /**
     * Parse an expression. Throws ExpressionSyntaxError.
     * @param path where the expression comes from, used in error messages
     */
    static Expression compile(const std::string& expression, const std::string& path = "");

    /**
     * Evaluate against a context object. Missing fields yield null.
     * Throws ExpressionEvaluationError, or ExpressionTimeoutError when the
     * deadline is reached.
     */
    json evaluate(const json& context,
                  const Bindings& variables = {},
                  std::chrono::milliseconds timeout = kDefaultTimeout) const;

    const std::string& source() const { return m_source; }
    const std::string& path() const { return m_path; }

private:
    Expression(std::string source, std::string path, AstNodePtr root);

    std::string m_source;
    std::string m_path;
    AstNodePtr m_root;
};

/**
 * Compile and evaluate in one step
 */
json evaluate(const std::string& expression,
              const json& context,
              std::chrono::milliseconds timeout = kDefaultTimeout,
              const std::string& path = "",
              const Bindings& variables = {});

/**
 * Parse only. Throws ExpressionSyntaxError on failure.
 */
void checkSyntax(const std::string& expression, const std::string& path = "");

/**
 * Boolean cast: null, false, 0, "", [] and {} are false
 */
bool isTruthy(const json& value);

/**
 * String cast used by $string, '&' and prompt rendering
 */
std::string toDisplayString(const json& value);

} // namespace expr
} // namespace weft
