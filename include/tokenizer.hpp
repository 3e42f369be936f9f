#pragma once
#include <map>
#include <string>
#include <vector>
#include "common.hpp"

namespace Tokenizer {

enum class TokenType {
    // keywords
    INT,
    FLOAT,
    CHAR,
    VOID,
    IF,
    ELIF,
    ELSE,
    LOOP,
    FROM,
    TO,
    STEP,
    SHOW,
    TELL,
    RETURN,
    FUNC,

    IDENTIFIER,
    INTEGER_LITERAL,
    FLOAT_LITERAL,
    CHAR_LITERAL,

    // operators
    PLUS,
    MINUS,
    MULTIPLY,
    DIVIDE,
    MODULO,
    ASSIGN,
    EQ,
    NEQ,
    LT,
    GT,
    LTE,
    GTE,
    AND,
    OR,
    NOT,

    // delimiters
    LPAREN,
    RPAREN,
    LBRACE,
    RBRACE,
    SEMICOLON,
    COMMA,

    END_OF_FILE,
};

// "INT", "IDENTIFIER", ..., "EOF"
std::string tokenTypeName(TokenType type);

struct Token {
    TokenType type;
    std::string matched;  // raw lexeme; the character itself for CHAR_LITERAL
    int start_row = -1;
    int start_col = -1;

    bool carriesValue() const;

    // "IDENTIFIER(x)", "INTEGER_LITERAL(5)", "SEMICOLON"
    std::string toString() const;
};

using TokenList = std::vector<Token>;

// Single pass scanner. Errors go to the handler and scanning carries on, so
// the returned list always ends with END_OF_FILE.
class Tokenizer {
   public:
    explicit Tokenizer(ErrorHandler& errors)
        : errors(errors) {}

    TokenList tokenize(const std::string& source, const std::string& filename = "<input>");

    static const std::map<std::string, TokenType>& keywords();

   private:
    ErrorHandler& errors;

    void skipWhitespaceAndComments(ScanContext& ctx);
    Token readNumber(ScanContext& ctx);
    Token readWord(ScanContext& ctx);
    bool readCharLiteral(ScanContext& ctx, Token& token);
    bool readOperator(ScanContext& ctx, Token& token);
};

}  // namespace Tokenizer
