#include "parser.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace Parser {

using Tokenizer::Token;
using Tokenizer::TokenType;

std::string normalizeNumber(const std::string& lexeme, bool isFloat) {
    auto stripLeadingZeros = [](const std::string& digits) {
        size_t first = digits.find_first_not_of('0');
        return first == std::string::npos ? std::string("0") : digits.substr(first);
    };
    if (!isFloat)
        return stripLeadingZeros(lexeme);

    size_t point = lexeme.find('.');
    std::string whole = stripLeadingZeros(lexeme.substr(0, point));
    std::string fraction = point == std::string::npos ? "" : lexeme.substr(point + 1);
    size_t last = fraction.find_last_not_of('0');
    fraction = last == std::string::npos ? "0" : fraction.substr(0, last + 1);
    return whole + "." + fraction;
}

static bool isTypeToken(TokenType type) {
    return type == TokenType::INT || type == TokenType::FLOAT || type == TokenType::CHAR;
}

static AST::DataType dataTypeOf(TokenType type) {
    switch (type) {
        case TokenType::INT: return AST::DataType::INT;
        case TokenType::FLOAT: return AST::DataType::FLOAT;
        case TokenType::CHAR: return AST::DataType::CHAR;
        case TokenType::VOID: return AST::DataType::VOID;
        default: throw std::invalid_argument("not a type keyword: " + Tokenizer::tokenTypeName(type));
    }
}

Parser::Parser(const Tokenizer::TokenList& tokens, ErrorHandler& errors)
    : tokens(tokens), errors(errors) {
    if (tokens.empty() || tokens.back().type != TokenType::END_OF_FILE)
        throw std::invalid_argument("token list must end with EOF");
}

const Token& Parser::current() const {
    return tokens[pos];
}

const Token& Parser::peek(size_t ahead) const {
    return tokens[std::min(pos + ahead, tokens.size() - 1)];
}

bool Parser::check(TokenType type) const {
    return current().type == type;
}

bool Parser::checkAny(std::initializer_list<TokenType> types) const {
    for (TokenType type : types) {
        if (check(type))
            return true;
    }
    return false;
}

void Parser::advance() {
    if (pos < tokens.size() - 1)
        pos++;
}

const Token& Parser::expect(TokenType type) {
    if (!check(type))
        fail("Expected " + Tokenizer::tokenTypeName(type) + ", got " + Tokenizer::tokenTypeName(current().type));
    const Token& token = current();
    advance();
    return token;
}

void Parser::fail(const std::string& message) const {
    throw ParseError(current(), message);
}

void Parser::record(const ParseError& error) {
    Log::trace() << "[PARSER] " << error.what() << std::endl;
    errors.addSyntaxError(error.row, error.message);
}

// Skip to the end of the broken statement.
void Parser::synchronize() {
    while (!checkAny({TokenType::SEMICOLON, TokenType::RBRACE, TokenType::END_OF_FILE}))
        advance();
    if (check(TokenType::SEMICOLON))
        advance();
}

AST::ExprPtr Parser::makeExpr(int line, decltype(AST::Expr::node) node) {
    return AST::ExprPtr(new AST::Expr{nextId++, line, std::move(node)});
}

AST::StmtPtr Parser::makeStmt(int line, decltype(AST::Stmt::node) node) {
    return AST::StmtPtr(new AST::Stmt{nextId++, line, std::move(node)});
}

AST::Program Parser::parse() {
    AST::Program program;

    while (check(TokenType::FUNC)) {
        try {
            program.functions.push_back(parseFunctionDecl());
        } catch (const ParseError& e) {
            record(e);
            synchronize();
            if (check(TokenType::RBRACE))
                advance();
        }
    }

    program.statements = parseStmtList();

    if (!check(TokenType::END_OF_FILE))
        errors.addSyntaxError(current().start_row, "Unexpected tokens after program end");

    Log::trace() << "[PARSER] " << program.functions.size() << " functions, "
                 << program.statements.size() << " top-level statements" << std::endl;
    return program;
}

AST::FunctionDecl Parser::parseFunctionDecl() {
    AST::FunctionDecl function;
    function.line = current().start_row;
    advance();  // func

    if (!checkAny({TokenType::INT, TokenType::FLOAT, TokenType::CHAR, TokenType::VOID}))
        fail("Expected return type (int, float, char, or void)");
    function.returnType = dataTypeOf(current().type);
    advance();

    function.name = expect(TokenType::IDENTIFIER).matched;
    expect(TokenType::LPAREN);
    function.params = parseParamList();
    expect(TokenType::RPAREN);
    function.body = parseBlock();
    function.id = nextId++;
    return function;
}

std::vector<AST::Param> Parser::parseParamList() {
    std::vector<AST::Param> params;
    if (!isTypeToken(current().type))
        return params;
    params.push_back(parseParam());
    while (check(TokenType::COMMA)) {
        advance();
        params.push_back(parseParam());
    }
    return params;
}

AST::Param Parser::parseParam() {
    if (!isTypeToken(current().type))
        fail("Expected parameter type");
    AST::DataType type = dataTypeOf(current().type);
    advance();
    return AST::Param{type, expect(TokenType::IDENTIFIER).matched};
}

std::vector<AST::StmtPtr> Parser::parseStmtList() {
    std::vector<AST::StmtPtr> statements;
    while (!checkAny({TokenType::END_OF_FILE, TokenType::RBRACE})) {
        try {
            statements.push_back(parseStmt());
        } catch (const ParseError& e) {
            record(e);
            synchronize();
        }
    }
    return statements;
}

AST::StmtPtr Parser::parseStmt() {
    switch (current().type) {
        case TokenType::INT:
        case TokenType::FLOAT:
        case TokenType::CHAR:
            return parseDeclStmt();
        case TokenType::IDENTIFIER:
            if (peek().type == TokenType::LPAREN) {
                int line = current().start_row;
                AST::FunctionCall call = parseCall();
                expect(TokenType::SEMICOLON);
                return makeStmt(line, std::move(call));
            }
            return parseAssignStmt();
        case TokenType::IF:
            return parseIfStmt();
        case TokenType::LOOP:
            return parseLoopStmt();
        case TokenType::SHOW:
            return parsePrintStmt();
        case TokenType::TELL:
            return parseInputStmt();
        case TokenType::RETURN:
            return parseReturnStmt();
        case TokenType::LBRACE: {
            int line = current().start_row;
            return makeStmt(line, parseBlock());
        }
        default:
            fail("Unexpected token " + Tokenizer::tokenTypeName(current().type));
    }
}

AST::StmtPtr Parser::parseDeclStmt() {
    int line = current().start_row;
    AST::DeclStmt decl;
    decl.type = dataTypeOf(current().type);
    advance();
    decl.name = expect(TokenType::IDENTIFIER).matched;
    if (check(TokenType::ASSIGN)) {
        advance();
        decl.init = parseExpr();
    }
    expect(TokenType::SEMICOLON);
    return makeStmt(line, std::move(decl));
}

AST::StmtPtr Parser::parseAssignStmt() {
    int line = current().start_row;
    AST::AssignStmt assign;
    assign.name = current().matched;
    advance();
    expect(TokenType::ASSIGN);
    assign.value = parseExpr();
    expect(TokenType::SEMICOLON);
    return makeStmt(line, std::move(assign));
}

AST::StmtPtr Parser::parseIfStmt() {
    int line = current().start_row;
    advance();  // if

    AST::IfStmt stmt;
    expect(TokenType::LPAREN);
    stmt.condition = parseCondition();
    expect(TokenType::RPAREN);
    stmt.thenBlock = parseBlock();

    while (check(TokenType::ELIF)) {
        advance();
        AST::ElifClause elif;
        expect(TokenType::LPAREN);
        elif.condition = parseCondition();
        expect(TokenType::RPAREN);
        elif.block = parseBlock();
        stmt.elifs.push_back(std::move(elif));
    }

    if (check(TokenType::ELSE)) {
        advance();
        stmt.elseBlock.reset(new AST::Block(parseBlock()));
    }
    return makeStmt(line, std::move(stmt));
}

AST::StmtPtr Parser::parseLoopStmt() {
    int line = current().start_row;
    advance();  // loop

    if (check(TokenType::LPAREN)) {
        advance();
        AST::ConditionalLoopStmt loop;
        loop.condition = parseCondition();
        expect(TokenType::RPAREN);
        loop.body = parseBlock();
        return makeStmt(line, std::move(loop));
    }

    AST::LoopStmt loop;
    expect(TokenType::FROM);
    loop.variable = expect(TokenType::IDENTIFIER).matched;
    if (check(TokenType::ASSIGN)) {
        advance();
        loop.start = parseExpr();
    } else if (check(TokenType::TO)) {
        loop.reusesVariable = true;
    } else {
        fail("Expected '=' or 'to' after loop variable");
    }
    expect(TokenType::TO);
    loop.end = parseExpr();
    if (check(TokenType::STEP)) {
        advance();
        loop.step = parseExpr();
    }
    loop.body = parseBlock();
    return makeStmt(line, std::move(loop));
}

AST::StmtPtr Parser::parsePrintStmt() {
    int line = current().start_row;
    advance();  // show
    AST::PrintStmt stmt;
    stmt.values.push_back(parseExpr());
    while (check(TokenType::COMMA)) {
        advance();
        stmt.values.push_back(parseExpr());
    }
    expect(TokenType::SEMICOLON);
    return makeStmt(line, std::move(stmt));
}

AST::StmtPtr Parser::parseInputStmt() {
    int line = current().start_row;
    advance();  // tell
    AST::InputStmt stmt{expect(TokenType::IDENTIFIER).matched};
    expect(TokenType::SEMICOLON);
    return makeStmt(line, std::move(stmt));
}

AST::StmtPtr Parser::parseReturnStmt() {
    int line = current().start_row;
    advance();  // return
    AST::ReturnStmt stmt;
    if (!check(TokenType::SEMICOLON))
        stmt.value = parseExpr();
    expect(TokenType::SEMICOLON);
    return makeStmt(line, std::move(stmt));
}

AST::Block Parser::parseBlock() {
    expect(TokenType::LBRACE);
    AST::Block block;
    block.statements = parseStmtList();
    expect(TokenType::RBRACE);
    return block;
}

AST::ExprPtr Parser::parseCondition() {
    return parseLogicalOr();
}

AST::ExprPtr Parser::parseLogicalOr() {
    AST::ExprPtr left = parseLogicalAnd();
    while (check(TokenType::OR)) {
        int line = current().start_row;
        advance();
        AST::ExprPtr right = parseLogicalAnd();
        left = makeExpr(line, AST::BinaryOp{"||", std::move(left), std::move(right)});
    }
    return left;
}

AST::ExprPtr Parser::parseLogicalAnd() {
    AST::ExprPtr left = parseRelational();
    while (check(TokenType::AND)) {
        int line = current().start_row;
        advance();
        AST::ExprPtr right = parseRelational();
        left = makeExpr(line, AST::BinaryOp{"&&", std::move(left), std::move(right)});
    }
    return left;
}

AST::ExprPtr Parser::parseRelational() {
    if (check(TokenType::NOT)) {
        int line = current().start_row;
        advance();
        return makeExpr(line, AST::UnaryOp{"!", parseRelational()});
    }

    if (check(TokenType::LPAREN)) {
        // A parenthesized condition may still be the left operand of
        // arithmetic or a comparison: (a + b) * 2 > c
        advance();
        AST::ExprPtr group = parseCondition();
        expect(TokenType::RPAREN);
        group = continueAdditive(continueMultiplicative(std::move(group)));
        return parseRelationalTail(std::move(group));
    }

    return parseRelationalTail(parseExpr());
}

AST::ExprPtr Parser::parseRelationalTail(AST::ExprPtr left) {
    if (!checkAny({TokenType::EQ, TokenType::NEQ, TokenType::LT, TokenType::GT, TokenType::LTE, TokenType::GTE}))
        return left;
    int line = current().start_row;
    std::string op = current().matched;
    advance();
    AST::ExprPtr right = parseExpr();
    return makeExpr(line, AST::BinaryOp{op, std::move(left), std::move(right)});
}

AST::ExprPtr Parser::parseExpr() {
    return parseAdditive();
}

AST::ExprPtr Parser::parseAdditive() {
    return continueAdditive(parseMultiplicative());
}

AST::ExprPtr Parser::continueAdditive(AST::ExprPtr left) {
    while (checkAny({TokenType::PLUS, TokenType::MINUS})) {
        int line = current().start_row;
        std::string op = current().matched;
        advance();
        AST::ExprPtr right = parseMultiplicative();
        left = makeExpr(line, AST::BinaryOp{op, std::move(left), std::move(right)});
    }
    return left;
}

AST::ExprPtr Parser::parseMultiplicative() {
    return continueMultiplicative(parseUnary());
}

AST::ExprPtr Parser::continueMultiplicative(AST::ExprPtr left) {
    while (checkAny({TokenType::MULTIPLY, TokenType::DIVIDE, TokenType::MODULO})) {
        int line = current().start_row;
        std::string op = current().matched;
        advance();
        AST::ExprPtr right = parseUnary();
        left = makeExpr(line, AST::BinaryOp{op, std::move(left), std::move(right)});
    }
    return left;
}

AST::ExprPtr Parser::parseUnary() {
    if (check(TokenType::MINUS)) {
        int line = current().start_row;
        advance();
        return makeExpr(line, AST::UnaryOp{"-", parseUnary()});
    }
    return parsePrimary();
}

AST::ExprPtr Parser::parsePrimary() {
    const Token& token = current();
    switch (token.type) {
        case TokenType::IDENTIFIER:
            if (peek().type == TokenType::LPAREN)
                return makeExpr(token.start_row, parseCall());
            advance();
            return makeExpr(token.start_row, AST::Identifier{token.matched});
        case TokenType::INTEGER_LITERAL:
            advance();
            return makeExpr(token.start_row, AST::Literal{normalizeNumber(token.matched, false), AST::DataType::INT});
        case TokenType::FLOAT_LITERAL:
            advance();
            return makeExpr(token.start_row, AST::Literal{normalizeNumber(token.matched, true), AST::DataType::FLOAT});
        case TokenType::CHAR_LITERAL:
            advance();
            return makeExpr(token.start_row, AST::Literal{token.matched, AST::DataType::CHAR});
        case TokenType::LPAREN: {
            advance();
            AST::ExprPtr inner = parseExpr();
            expect(TokenType::RPAREN);
            return inner;
        }
        default:
            fail("Unexpected token in expression: " + Tokenizer::tokenTypeName(token.type));
    }
}

AST::FunctionCall Parser::parseCall() {
    AST::FunctionCall call;
    call.name = expect(TokenType::IDENTIFIER).matched;
    expect(TokenType::LPAREN);
    if (!check(TokenType::RPAREN)) {
        call.arguments.push_back(parseExpr());
        while (check(TokenType::COMMA)) {
            advance();
            call.arguments.push_back(parseExpr());
        }
    }
    expect(TokenType::RPAREN);
    return call;
}

}  // namespace Parser
