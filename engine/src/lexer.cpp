#include "querylab/lexer.h"
#include "querylab/utils.h"
#include <cctype>

using namespace querylab;

static bool is_ident_start(char c){ return std::isalpha((unsigned char)c) || c=='_'; }
static bool is_ident_char(char c){ return std::isalnum((unsigned char)c) || c=='_' || c=='$'; }

const std::vector<std::string>& querylab::sql_keywords(){
    static const std::vector<std::string> kws={"select","from","where","join","on","inner","left","right","full","cross","outer",
        "group","by","order","asc","desc","limit","offset","as","and","or","not","having","between","in","like","is","null",
        "true","false","distinct","with","recursive","union","all","exists","case","when","then","else","end",
        "insert","update","delete","into","set","values","create","drop","alter","table","index"};
    return kws;
}

bool querylab::is_keyword(const std::string &word){
    std::string low = to_lower(word);
    for(const auto &kw: sql_keywords()){ if(low==kw) return true; }
    return false;
}

std::vector<Token> Lexer::tokenize(){
    std::vector<Token> out; int start=0;
    auto push=[&](TokenType t, const std::string &tx, int at){ out.push_back({t,tx,at}); };
    while(i<n){
        char c=s[i];
        if(std::isspace((unsigned char)c)){ ++i; continue; }
        if(c=='-' && i+1<n && s[i+1]=='-'){ while(i<n && s[i]!='\n') ++i; continue; }
        if(c=='/' && i+1<n && s[i+1]=='*'){
            i+=2; while(i+1<n && !(s[i]=='*' && s[i+1]=='/')) ++i;
            i = (i+1<n) ? i+2 : n; continue;
        }
        if(c=='*'){ push(TokenType::STAR, "*", i); ++i; continue; }
        if(c==','){ push(TokenType::COMMA, ",", i); ++i; continue; }
        if(c=='.' && !(i+1<n && std::isdigit((unsigned char)s[i+1]))){ push(TokenType::DOT, ".", i); ++i; continue; }
        if(c=='('){ push(TokenType::LPAREN, "(", i); ++i; continue; }
        if(c==')'){ push(TokenType::RPAREN, ")", i); ++i; continue; }
        if(c==';'){ push(TokenType::SEMICOLON, ";", i); ++i; continue; }
        if(c=='\'' || c=='\"'){
            char q=c; start=i; ++i; std::string val;
            while(i<n){
                if(s[i]==q){ if(i+1<n && s[i+1]==q){ val.push_back(q); i+=2; continue; } break; }
                if(s[i]=='\\' && i+1<n){ val.push_back(s[i+1]); i+=2; } else { val.push_back(s[i++]); }
            }
            if(i<n && s[i]==q) ++i;
            push(TokenType::STRING, val, start); continue;
        }
        if(c=='`'){
            start=i; ++i; std::string val;
            while(i<n && s[i]!='`') val.push_back(s[i++]);
            if(i<n) ++i;
            push(TokenType::IDENT, val, start); continue;
        }
        if(std::isdigit((unsigned char)c) || c=='.'){
            start=i; bool dot=false;
            while(i<n && (std::isdigit((unsigned char)s[i]) || (s[i]=='.' && !dot))){ if(s[i]=='.') dot=true; ++i; }
            push(TokenType::NUMBER, s.substr(start,i-start), start); continue;
        }
        if(is_ident_start(c)){
            start=i; while(i<n && is_ident_char(s[i])) ++i;
            std::string id = s.substr(start,i-start);
            push(is_keyword(id)?TokenType::KW:TokenType::IDENT, id, start);
            continue;
        }
        if(c=='<'){
            start=i; ++i;
            if(i<n && (s[i]=='=' || s[i]=='>')) ++i;
            push(TokenType::OP, s.substr(start,i-start), start); continue;
        }
        if(c=='>' || c=='!' || c=='='){
            start=i; ++i; if(i<n && s[i]=='=') ++i;
            push(TokenType::OP, s.substr(start,i-start), start); continue;
        }
        if(std::string("+-/%|").find(c)!=std::string::npos){
            start=i; ++i; if(c=='|' && i<n && s[i]=='|') ++i;
            push(TokenType::OP, s.substr(start,i-start), start); continue;
        }
        start=i; ++i; push(TokenType::IDENT, s.substr(start,1), start);
    }
    out.push_back({TokenType::END,"",i});
    return out;
}
