#include "tokenizer.hpp"

#include <cctype>
#include <iostream>

namespace Tokenizer {

std::string tokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::INT: return "INT";
        case TokenType::FLOAT: return "FLOAT";
        case TokenType::CHAR: return "CHAR";
        case TokenType::VOID: return "VOID";
        case TokenType::IF: return "IF";
        case TokenType::ELIF: return "ELIF";
        case TokenType::ELSE: return "ELSE";
        case TokenType::LOOP: return "LOOP";
        case TokenType::FROM: return "FROM";
        case TokenType::TO: return "TO";
        case TokenType::STEP: return "STEP";
        case TokenType::SHOW: return "SHOW";
        case TokenType::TELL: return "TELL";
        case TokenType::RETURN: return "RETURN";
        case TokenType::FUNC: return "FUNC";
        case TokenType::IDENTIFIER: return "IDENTIFIER";
        case TokenType::INTEGER_LITERAL: return "INTEGER_LITERAL";
        case TokenType::FLOAT_LITERAL: return "FLOAT_LITERAL";
        case TokenType::CHAR_LITERAL: return "CHAR_LITERAL";
        case TokenType::PLUS: return "PLUS";
        case TokenType::MINUS: return "MINUS";
        case TokenType::MULTIPLY: return "MULTIPLY";
        case TokenType::DIVIDE: return "DIVIDE";
        case TokenType::MODULO: return "MODULO";
        case TokenType::ASSIGN: return "ASSIGN";
        case TokenType::EQ: return "EQ";
        case TokenType::NEQ: return "NEQ";
        case TokenType::LT: return "LT";
        case TokenType::GT: return "GT";
        case TokenType::LTE: return "LTE";
        case TokenType::GTE: return "GTE";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        case TokenType::LPAREN: return "LPAREN";
        case TokenType::RPAREN: return "RPAREN";
        case TokenType::LBRACE: return "LBRACE";
        case TokenType::RBRACE: return "RBRACE";
        case TokenType::SEMICOLON: return "SEMICOLON";
        case TokenType::COMMA: return "COMMA";
        case TokenType::END_OF_FILE: return "EOF";
    }
    return "UNKNOWN";
}

bool Token::carriesValue() const {
    return type == TokenType::IDENTIFIER || type == TokenType::INTEGER_LITERAL ||
           type == TokenType::FLOAT_LITERAL || type == TokenType::CHAR_LITERAL;
}

std::string Token::toString() const {
    if (carriesValue())
        return tokenTypeName(type) + "(" + matched + ")";
    return tokenTypeName(type);
}

const std::map<std::string, TokenType>& Tokenizer::keywords() {
    static const std::map<std::string, TokenType> table = {
        {"int", TokenType::INT},
        {"float", TokenType::FLOAT},
        {"char", TokenType::CHAR},
        {"void", TokenType::VOID},
        {"if", TokenType::IF},
        {"elif", TokenType::ELIF},
        {"else", TokenType::ELSE},
        {"loop", TokenType::LOOP},
        {"from", TokenType::FROM},
        {"to", TokenType::TO},
        {"step", TokenType::STEP},
        {"show", TokenType::SHOW},
        {"tell", TokenType::TELL},
        {"return", TokenType::RETURN},
        {"func", TokenType::FUNC},
    };
    return table;
}

static bool isWordStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

static bool isWordPart(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void Tokenizer::skipWhitespaceAndComments(ScanContext& ctx) {
    while (!ctx.atEnd()) {
        char c = ctx.current();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            ctx.skip();
        } else if (c == '/' && ctx.peek() == '/') {
            while (!ctx.atEnd() && ctx.current() != '\n')
                ctx.skip();
        } else {
            break;
        }
    }
}

Token Tokenizer::readNumber(ScanContext& ctx) {
    Token token{TokenType::INTEGER_LITERAL, "", ctx.row, ctx.column};
    char c;
    while (isDigit(ctx.current()) || ctx.current() == '.') {
        if (ctx.current() == '.') {
            if (token.type == TokenType::FLOAT_LITERAL) {
                // A second point: keep what was read, drop the rest of the run.
                errors.addLexicalError(ctx.row, ctx.column, "Invalid number format");
                while (isDigit(ctx.current()) || ctx.current() == '.')
                    ctx.skip();
                break;
            }
            token.type = TokenType::FLOAT_LITERAL;
        }
        ctx.next(c);
        token.matched += c;
    }
    return token;
}

Token Tokenizer::readWord(ScanContext& ctx) {
    Token token{TokenType::IDENTIFIER, "", ctx.row, ctx.column};
    char c;
    while (isWordPart(ctx.current())) {
        ctx.next(c);
        token.matched += c;
    }
    auto keyword = keywords().find(token.matched);
    if (keyword != keywords().end())
        token.type = keyword->second;
    return token;
}

// Returns false when the literal was malformed; the error is already recorded.
bool Tokenizer::readCharLiteral(ScanContext& ctx, Token& token) {
    token = Token{TokenType::CHAR_LITERAL, "", ctx.row, ctx.column};
    ctx.skip();  // opening quote

    if (ctx.atEnd() || ctx.current() == '\n') {
        errors.addLexicalError(token.start_row, token.start_col, "Unterminated char literal");
        return false;
    }
    if (ctx.current() == '\'') {
        ctx.skip();
        errors.addLexicalError(token.start_row, token.start_col, "Empty char literal");
        return false;
    }

    std::string value = ctx.nextCharacter();
    if (ctx.current() == '\'') {
        ctx.skip();
        token.matched = value;
        return true;
    }

    // Too long: skip to the closing quote on this line, if there is one.
    while (!ctx.atEnd() && ctx.current() != '\'' && ctx.current() != '\n')
        ctx.skip();
    if (ctx.current() == '\'') {
        ctx.skip();
        errors.addLexicalError(token.start_row, token.start_col, "Char literal must be single character");
    } else {
        errors.addLexicalError(token.start_row, token.start_col, "Unterminated char literal");
    }
    return false;
}

bool Tokenizer::readOperator(ScanContext& ctx, Token& token) {
    static const std::map<std::string, TokenType> twoChar = {
        {"==", TokenType::EQ},
        {"!=", TokenType::NEQ},
        {"<=", TokenType::LTE},
        {">=", TokenType::GTE},
        {"&&", TokenType::AND},
        {"||", TokenType::OR},
    };
    static const std::map<char, TokenType> oneChar = {
        {'+', TokenType::PLUS},
        {'-', TokenType::MINUS},
        {'*', TokenType::MULTIPLY},
        {'/', TokenType::DIVIDE},
        {'%', TokenType::MODULO},
        {'=', TokenType::ASSIGN},
        {'<', TokenType::LT},
        {'>', TokenType::GT},
        {'!', TokenType::NOT},
        {'(', TokenType::LPAREN},
        {')', TokenType::RPAREN},
        {'{', TokenType::LBRACE},
        {'}', TokenType::RBRACE},
        {';', TokenType::SEMICOLON},
        {',', TokenType::COMMA},
    };

    token.start_row = ctx.row;
    token.start_col = ctx.column;

    std::string pair{ctx.current(), ctx.peek()};
    auto two = twoChar.find(pair);
    if (two != twoChar.end()) {
        token.type = two->second;
        token.matched = pair;
        ctx.skip();
        ctx.skip();
        return true;
    }
    auto one = oneChar.find(ctx.current());
    if (one != oneChar.end()) {
        token.type = one->second;
        token.matched = std::string(1, ctx.current());
        ctx.skip();
        return true;
    }
    return false;
}

TokenList Tokenizer::tokenize(const std::string& source, const std::string& filename) {
    ScanContext ctx(filename, source);
    TokenList tokens;
    size_t errorsBefore = errors.lexicalErrors().size();

    while (true) {
        skipWhitespaceAndComments(ctx);
        if (ctx.atEnd())
            break;

        char c = ctx.current();
        Token token;
        if (isDigit(c)) {
            tokens.push_back(readNumber(ctx));
        } else if (isWordStart(c)) {
            tokens.push_back(readWord(ctx));
        } else if (c == '\'') {
            if (readCharLiteral(ctx, token))
                tokens.push_back(token);
        } else if (readOperator(ctx, token)) {
            tokens.push_back(token);
        } else {
            int row = ctx.row, column = ctx.column;
            errors.addLexicalError(row, column, "Unknown character '" + ctx.nextCharacter() + "'");
        }
    }

    tokens.push_back(Token{TokenType::END_OF_FILE, "", ctx.row, ctx.column});
    Log::trace() << "[LEXER] " << tokens.size() << " tokens, "
                 << errors.lexicalErrors().size() - errorsBefore << " errors in " << filename << std::endl;
    return tokens;
}

}  // namespace Tokenizer
