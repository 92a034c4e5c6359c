#include "cdp/cdecl_parser.h"

#include <cctype>
#include <ostream>
#include <sstream>
#include <string_view>
#include <unordered_map>

#include "vbg/parser.h"
#include "vbg/scanner.h"
#include "vbg/string.h"

namespace cdp {
namespace {

struct Token {
  enum Kind {
    END,
    IDENTIFIER,
    NUMBER,

    // brackets
    LBRACK,
    RBRACK,
    LPAREN,
    RPAREN,

    // keywords
    CONST,
    STRUCT,
    TYPEDEF,

    // punct
    ASTERISK,
    COMMA,
    SEMICOLON,
    COLON,
  };

  Token(Kind kind) : kind(kind){};
  Token(Kind kind, const std::string& spelling)
      : kind(kind), spelling(spelling) {}

  Kind kind;
  std::string spelling;
};

bool operator==(const Token& token, Token::Kind kind) {
  return token.kind == kind;
}
bool operator!=(const Token& a, Token::Kind b) { return !(a == b); }

std::string_view token_kind_to_string(Token::Kind kind) {
  switch (kind) {
    case Token::END:
      return "END";
    case Token::LBRACK:
      return "LBRACK";
    case Token::RBRACK:
      return "RBRACK";
    case Token::LPAREN:
      return "LPAREN";
    case Token::RPAREN:
      return "RPAREN";
    case Token::CONST:
      return "CONST";
    case Token::STRUCT:
      return "STRUCT";
    case Token::TYPEDEF:
      return "TYPEDEF";
    case Token::ASTERISK:
      return "ASTERISK";
    case Token::COMMA:
      return "COMMA";
    case Token::IDENTIFIER:
      return "IDENTIFIER";
    case Token::NUMBER:
      return "NUMBER";
    case Token::SEMICOLON:
      return "SEMICOLON";
    case Token::COLON:
      return "COLON";
  }
  return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& o, const Token& tok) {
  o << token_kind_to_string(tok.kind);
  if (!tok.spelling.empty()) o << ':' << tok.spelling;
  return o;
}

struct CScanner : vbg::scanner {
  using vbg::scanner::scanner;

  std::string parse_word() {
    std::ostringstream oss;
    while (true) {
      char c = peek();
      if (!std::isalnum((unsigned char)c) && c != '_') break;
      incr();
      oss.write(&c, 1);
    }
    return oss.str();
  }

  void skip_whitespace() {
    while (std::isspace((unsigned char)peek())) incr();
  }

  Token parse_next_token() {
    static const std::unordered_map<char, Token::Kind> punctuation = {
        {'[', Token::LBRACK}, {']', Token::RBRACK},    {'*', Token::ASTERISK},
        {'(', Token::LPAREN}, {')', Token::RPAREN},    {',', Token::COMMA},
        {':', Token::COLON},  {';', Token::SEMICOLON}};

    static const std::unordered_map<std::string, Token::Kind> keywords = {
        {"const", Token::CONST},
        {"struct", Token::STRUCT},
        {"typedef", Token::TYPEDEF}};

    skip_whitespace();

    char c = peek();

    if (c == vbg::scanner::eof) return {Token::END};

    auto it = punctuation.find(c);
    if (it != punctuation.end()) {
      incr();
      return {it->second};
    }

    if (std::isdigit((unsigned char)c)) return {Token::NUMBER, parse_word()};

    if (std::isalpha((unsigned char)c) || c == '_') {
      std::string identifier = parse_word();
      auto it = keywords.find(identifier);
      if (it != keywords.end())
        return {it->second, identifier};
      else
        return {Token::IDENTIFIER, identifier};
    }

    fail("unexpected character '", c, "'");
  }
};

class CParser : public vbg::parser<Token> {
 public:
  using vbg::parser<Token>::parser;

  Declaration parse_declaration_end() {
    Declaration decl = parse_declaration();
    expect(peek() == Token::END, "trailing tokens after declaration: ",
           peek());
    return decl;
  }

  Declaration parse_typedef_end() {
    expect(pop() == Token::TYPEDEF, "expected typedef");
    Declaration decl = parse_declaration();
    expect(!decl.bitfield_width, "bit-field in typedef");
    expect(pop() == Token::SEMICOLON, "expected ;");
    expect(peek() == Token::END, "trailing tokens after typedef: ", peek());
    return decl;
  }

  // decl-specifiers followed by pointer declarators.
  std::unique_ptr<Type> parse_type() {
    std::optional<std::string> root;
    bool elaborated = false;
    bool const_ = false;
    while (true) {
      switch (peek().kind) {
        case Token::STRUCT:
          expect(!root, "struct after type name");
          incr();
          expect(peek() == Token::IDENTIFIER, "expected struct tag");
          elaborated = true;
          root = pop().spelling;
          break;
        case Token::IDENTIFIER:
          if (root) goto done_specifiers;
          root = pop().spelling;
          break;
        case Token::CONST:
          expect(!const_, "duplicate const");
          const_ = true;
          incr();
          break;
        default:
          expect(root.has_value(), "unexpected token: ", peek());
          goto done_specifiers;
      }
    }
  done_specifiers:;

    std::unique_ptr<Type> t = std::make_unique<Name>(*root, elaborated);

    if (const_) t = std::make_unique<Const>(std::move(t));

    while (peek() == Token::ASTERISK) {
      t = std::make_unique<Pointer>(std::move(t));
      incr();
      if (peek() == Token::CONST) {
        t = std::make_unique<Const>(std::move(t));
        incr();
      }
    }
    return t;
  }

  Declaration parse_declaration() {
    Declaration decl;
    decl.type = parse_type();

    expect(peek() == Token::IDENTIFIER, "expected declarator name, got ",
           peek());
    decl.name = pop().spelling;

    std::vector<std::unique_ptr<Expr>> extents;
    while (peek() == Token::LBRACK) {
      incr();
      expect(peek() == Token::IDENTIFIER || peek() == Token::NUMBER,
             "bad array extent: ", peek());
      if (peek() == Token::IDENTIFIER)
        extents.push_back(std::make_unique<Reference>(pop().spelling));
      else
        extents.push_back(std::make_unique<Number>(pop().spelling));
      expect(pop() == Token::RBRACK, "expected ]");
    }
    for (size_t i = extents.size(); i > 0; i--)
      decl.type =
          std::make_unique<Array>(std::move(decl.type), std::move(extents[i - 1]));

    if (peek() == Token::COLON) {
      incr();
      expect(peek() == Token::NUMBER, "expected bit-field width");
      decl.bitfield_width = std::stoi(pop().spelling);
    }

    return decl;
  }

  FunctionPrototype parse_function_prototype() {
    FunctionPrototype function_prototype;
    expect(pop() == Token::TYPEDEF, "expected typedef");
    function_prototype.return_type = parse_type();

    expect(pop() == Token::LPAREN, "expected (");
    expect(peek() == Token::IDENTIFIER && peek().spelling == "VKAPI_PTR",
           "expected VKAPI_PTR");
    incr();
    expect(pop() == Token::ASTERISK, "expected *");
    expect(peek() == Token::IDENTIFIER, "expected function pointer name");
    function_prototype.name = pop().spelling;
    expect(pop() == Token::RPAREN, "expected )");
    expect(pop() == Token::LPAREN, "expected (");
    if (peek() == Token::IDENTIFIER && peek().spelling == "void" &&
        peek(1) == Token::RPAREN) {
      incr(2);
    } else {
      while (true) {
        function_prototype.params.push_back(parse_declaration());
        if (peek() == Token::COMMA) {
          incr();
          continue;
        }
        expect(pop() == Token::RPAREN, "expected , or ) got ", peek());
        break;
      }
    }
    expect(pop() == Token::SEMICOLON, "expected ;");
    expect(peek() == Token::END, "trailing tokens after prototype");
    return function_prototype;
  }
};

std::vector<Token> tokenize(const std::string& code,
                            const std::string& location) {
  CScanner scanner(location, code);
  std::vector<Token> tokens;
  while (true) {
    Token token = scanner.parse_next_token();
    tokens.push_back(token);
    if (token == Token::END) break;
  }
  return tokens;
}

template <typename F>
auto parse(const std::string& code, const std::string& location, F f) {
  CParser parser(location, code, tokenize(code, location));
  return (parser.*f)();
}

}  // namespace

Declaration parse_declaration(const std::string& code,
                              const std::string& location) {
  return parse(code, location, &CParser::parse_declaration_end);
}

Declaration parse_typedef(const std::string& code,
                          const std::string& location) {
  return parse(code, location, &CParser::parse_typedef_end);
}

FunctionPrototype parse_function_prototype(const std::string& code,
                                           const std::string& location) {
  return parse(code, location, &CParser::parse_function_prototype);
}

std::optional<std::string> parse_opaque_struct(const std::string& code) {
  std::vector<std::string> words = vbg::split_nonempty(" ", vbg::squeeze(code));
  if (words.size() == 2 && words[0] == "struct" && vbg::endswith(words[1], ";"))
    return words[1].substr(0, words[1].size() - 1);
  if (words.size() == 3 && words[0] == "struct" && words[2] == ";")
    return words[1];
  return std::nullopt;
}

}  // namespace cdp
