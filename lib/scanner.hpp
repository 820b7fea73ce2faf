#ifndef __KERNVAL_SCANNER_HPP__
#define __KERNVAL_SCANNER_HPP__

// The flex generated class is named yyFlexLexer unless it is renamed through
// the preprocessor before <FlexLexer.h> is seen. See the "Generating C++
// Scanners" section of the GNU Flex manual, and the prefix option of
// scanner.l.
#if !defined(yyFlexLexerOnce)
#undef yyFlexLexer
#define yyFlexLexer Kernval_FlexLexer
#include <FlexLexer.h>
#endif

// bison 3 parsers consume symbol_type, not the int that yylex() returns
#undef YY_DECL
#define YY_DECL Kernval::Parser::symbol_type Kernval::Scanner::get_next_token()

#include <istream>
#include <string>

#include "loc.hpp"
#include "parser.tab.hh" // symbol_type

namespace Kernval {

class Scanner : public yyFlexLexer {
private:
  location loc; // position of the current token

public:
  explicit Scanner(const std::string& filename = "") {
    loc.initialize(filename);
  }
  virtual ~Scanner() {}

  virtual Parser::symbol_type get_next_token();

  // restart scanning on a new stream
  void Reset(std::istream& is, const std::string& filename) {
    yyrestart(is);
    loc.initialize(filename);
  }

  const location& Location() const { return loc; }
};

} // end namespace Kernval

#endif // __KERNVAL_SCANNER_HPP__
