#pragma once
#include <string>
#include <vector>

namespace querylab {

enum class TokenType { IDENT, NUMBER, STRING, STAR, COMMA, DOT, LPAREN, RPAREN, SEMICOLON, OP, KW, END };

struct Token{ TokenType type; std::string text; int pos; };

const std::vector<std::string>& sql_keywords();
bool is_keyword(const std::string &word);

class Lexer{
    std::string s; int i=0; int n=0;
public:
    explicit Lexer(std::string input): s(std::move(input)), n((int)s.size()) {}
    std::vector<Token> tokenize();
};

} // namespace querylab
