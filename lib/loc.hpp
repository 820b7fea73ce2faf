#ifndef __KERNVAL_LOCATION_HPP__
#define __KERNVAL_LOCATION_HPP__

// Source positions of the contract description files. The layout (begin/end
// positions, step/columns/lines) is what the bison C++ skeleton expects from
// its location type.

#include <ostream>
#include <string>

namespace Kernval {

class position {
public:
  using filename_type = std::string;
  using counter_type = int;

  // line 0 means "no source position", e.g. contracts built in memory
  explicit position(const filename_type& file = "", counter_type line = 0,
                    counter_type column = 0)
      : filename(file), line(line), column(column) {}

  void initialize(const filename_type& file, counter_type line = 1,
                  counter_type column = 1) {
    filename = file;
    this->line = line;
    this->column = column;
  }

  void lines(counter_type count = 1) {
    if (count) {
      column = 1;
      line = add_(line, count, 1);
    }
  }

  void columns(counter_type count = 1) { column = add_(column, count, 1); }

  bool Known() const { return line > 0; }

public:
  filename_type filename;
  counter_type line;
  counter_type column;

private:
  static counter_type add_(counter_type lhs, counter_type rhs,
                           counter_type min) {
    return lhs + rhs < min ? min : lhs + rhs;
  }
};

inline bool operator==(const position& l, const position& r) {
  return l.line == r.line && l.column == r.column && l.filename == r.filename;
}

inline bool operator!=(const position& l, const position& r) {
  return !(l == r);
}

template <typename YYChar>
inline std::basic_ostream<YYChar>& operator<<(std::basic_ostream<YYChar>& ostr,
                                              const position& pos) {
  if (!pos.filename.empty()) ostr << pos.filename << ':';
  return ostr << pos.line << '.' << pos.column;
}

class location {
public:
  typedef position::filename_type filename_type;
  typedef position::counter_type counter_type;

public:
  position begin;
  position end;

public:
  location(const position& b, const position& e) : begin(b), end(e) {}
  explicit location(const position& p = position()) : begin(p), end(p) {}
  explicit location(filename_type f, counter_type l = 1, counter_type c = 1)
      : begin(f, l, c), end(f, l, c) {}

  void initialize(const filename_type& file, counter_type line = 1,
                  counter_type column = 1) {
    begin.initialize(file, line, column);
    end = begin;
  }

  void step() { begin = end; }
  void columns(counter_type count = 1) { end.columns(count); }
  void lines(counter_type count = 1) { end.lines(count); }

  bool Known() const { return begin.Known(); }
};

inline bool operator==(const location& l, const location& r) {
  return l.begin == r.begin && l.end == r.end;
}

inline bool operator!=(const location& l, const location& r) {
  return !(l == r);
}

// only the beginning position is printed
template <typename YYChar>
inline std::basic_ostream<YYChar>& operator<<(std::basic_ostream<YYChar>& ostr,
                                              const location& loc) {
  return ostr << loc.begin;
}

} // end namespace Kernval

#endif // __KERNVAL_LOCATION_HPP__
