// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <limits>
#include <optional>
#include <ostream>
#include <regex>
#include <string>
#include <string_view>
#include <type_traits>

// {fmt} formatting library
// https://github.com/fmtlib/fmt
#include <fmt/format.h>

namespace yodec {

  // A YAML number: an exact 64-bit integer or an IEEE-754 double. A double
  // that was recovered from an integer literal too wide for 64 bits remembers
  // that it looked like an integer so it is written back the same way.
  class Number {
  public:

    enum class Kind { PosInt, NegInt, Float };

    inline Number() : kind_( Kind::PosInt ) {}

    template < typename T, typename std::enable_if< std::is_integral< T >::value
      && !std::is_same< T, bool >::value, int >::type = 0 >
    inline Number( T i ) : kind_( Kind::PosInt ) {
      if constexpr ( std::is_signed< T >::value ) {
        if ( i < 0 ) {
          kind_ = Kind::NegInt;
          neg_ = static_cast< std::int64_t >( i );
          return;
        }
      }
      pos_ = static_cast< std::uint64_t >( i );
    }

    inline Number( double f ) : kind_( Kind::Float ), float_( f ) {}

    // Float recovered from an overflowing integer literal
    static Number integral_float( double f );

    inline Kind kind() const { return kind_; }

    bool is_i64() const;
    inline bool is_u64() const { return kind_ == Kind::PosInt; }
    inline bool is_f64() const { return kind_ == Kind::Float; }
    inline bool is_nan() const { return is_f64() && std::isnan( float_ ); }
    inline bool is_infinite() const {
      return is_f64() && std::isinf( float_ );
    }
    inline bool is_finite() const { return !is_f64() || std::isfinite( float_ ); }

    // True for floats that came from an integer literal
    inline bool looks_integral() const { return is_f64() && integral_; }

    std::optional< std::int64_t > as_i64() const;
    std::optional< std::uint64_t > as_u64() const;
    double as_f64() const;

    // Shortest text that parses back to this exact number
    std::string to_string() const;

    // Core-schema number grammar. Returns nothing for text that is not a
    // number (it is then a string).
    static std::optional< Number > parse( std::string_view text );

    // Numbers are equal when they have the same kind and the same value. NaN
    // equals NaN, and 0.0 differs from -0.0.
    bool operator==( const Number& other ) const;
    inline bool operator!=( const Number& other ) const {
      return !( *this == other );
    }

    std::size_t hash() const;

  private:

    Kind kind_;
    std::uint64_t pos_ = 0;
    std::int64_t neg_ = 0;
    double float_ = 0.;
    bool integral_ = false;
  };

  inline std::ostream& operator<<( std::ostream& os, const Number& n ) {
    return os << n.to_string();
  }

namespace internal {

  // Integer literal as written: sign, magnitude and, when the magnitude does
  // not fit in 64 bits, its nearest double
  struct IntegerLiteral {
    bool negative = false;
    bool overflow = false;
    std::uint64_t magnitude = 0;
    double approx = 0.;
  };

  inline int digit_value( char c, int radix ) {
    int d = -1;
    if ( c >= '0' && c <= '9' ) d = c - '0';
    else if ( c >= 'a' && c <= 'f' ) d = c - 'a' + 10;
    else if ( c >= 'A' && c <= 'F' ) d = c - 'A' + 10;
    return ( d >= 0 && d < radix ) ? d : -1;
  }

  // Leading zero(s) followed by more digits is a string according to
  // YAML 1.2, e.g. "0123"
  inline bool digits_but_not_number( std::string_view digits ) {
    if ( digits.size() < 2 || digits[0] != '0' ) return false;
    for ( char c : digits.substr(1) ) {
      if ( c < '0' || c > '9' ) return false;
    }
    return true;
  }

  inline std::optional< IntegerLiteral > scan_integer( std::string_view text ) {
    IntegerLiteral lit;
    std::string_view rest = text;
    if ( !rest.empty() && ( rest[0] == '+' || rest[0] == '-' ) ) {
      lit.negative = ( rest[0] == '-' );
      rest.remove_prefix( 1 );
    }

    int radix = 10;
    if ( rest.size() > 2 && rest[0] == '0' ) {
      if ( rest[1] == 'x' ) radix = 16;
      else if ( rest[1] == 'o' ) radix = 8;
      else if ( rest[1] == 'b' ) radix = 2;
      if ( radix != 10 ) rest.remove_prefix( 2 );
    }

    if ( rest.empty() ) return std::nullopt;
    if ( radix == 10 && digits_but_not_number(rest) ) return std::nullopt;

    constexpr std::uint64_t max = std::numeric_limits< std::uint64_t >::max();
    long double approx = 0.;
    for ( char c : rest ) {
      int d = digit_value( c, radix );
      if ( d < 0 ) return std::nullopt;
      approx = approx * radix + d;
      if ( !lit.overflow ) {
        if ( lit.magnitude > ( max - d ) / radix ) lit.overflow = true;
        else lit.magnitude = lit.magnitude * radix + d;
      }
    }

    if ( lit.overflow ) {
      // Decimal text goes through strtod, which rounds correctly
      lit.approx = ( radix == 10 )
        ? std::strtod( std::string(rest).c_str(), nullptr )
        : static_cast< double >( approx );
    }
    return lit;
  }

  inline std::optional< double > parse_special_float( std::string_view text ) {
    std::string_view rest = text;
    bool negative = false;
    if ( !rest.empty() && ( rest[0] == '+' || rest[0] == '-' ) ) {
      negative = ( rest[0] == '-' );
      rest.remove_prefix( 1 );
    }
    if ( rest == ".inf" || rest == ".Inf" || rest == ".INF" ) {
      return negative ? -std::numeric_limits< double >::infinity()
        : std::numeric_limits< double >::infinity();
    }
    // NaN takes no sign
    if ( rest.size() == text.size()
      && ( rest == ".nan" || rest == ".NaN" || rest == ".NAN" ) )
    {
      return std::numeric_limits< double >::quiet_NaN();
    }
    return std::nullopt;
  }

  inline std::optional< double > parse_float( std::string_view text ) {
    if ( auto special = parse_special_float(text) ) return special;

    static const std::regex FLOAT_GRAMMAR(
      "[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?" );
    if ( !std::regex_match( text.begin(), text.end(), FLOAT_GRAMMAR ) ) {
      return std::nullopt;
    }

    double f = std::strtod( std::string(text).c_str(), nullptr );
    // Out-of-range literals such as 1e999 stay strings
    if ( !std::isfinite(f) ) return std::nullopt;
    return f;
  }

  inline std::string format_float( double f, bool integral ) {
    if ( std::isnan(f) ) return ".nan";
    if ( std::isinf(f) ) return f > 0 ? ".inf" : "-.inf";

    // An integral float outside the 64-bit integer range is written as an
    // integer literal; reading it back overflows to the same double again
    if ( integral && std::trunc(f) == f
      && ( f >= 18446744073709551616. || f < -9223372036854775808. ) )
    {
      return fmt::format( "{:.0f}", f );
    }
    // -2^63 itself would read back as an int64; one less rounds to it
    if ( integral && f == -9223372036854775808. ) {
      return "-9223372036854775809";
    }

    std::string s = fmt::format( "{}", f );
    if ( s.find_first_of(".eE") == std::string::npos ) s += ".0";
    return s;
  }

} // namespace yodec::internal

} // namespace yodec

inline yodec::Number yodec::Number::integral_float( double f ) {
  Number n( f );
  n.integral_ = true;
  return n;
}

inline bool yodec::Number::is_i64() const {
  switch ( kind_ ) {
    case Kind::PosInt:
      return pos_ <= static_cast< std::uint64_t >(
        std::numeric_limits< std::int64_t >::max() );
    case Kind::NegInt: return true;
    case Kind::Float: return false;
  }
  return false;
}

inline std::optional< std::int64_t > yodec::Number::as_i64() const {
  if ( !this->is_i64() ) return std::nullopt;
  if ( kind_ == Kind::NegInt ) return neg_;
  return static_cast< std::int64_t >( pos_ );
}

inline std::optional< std::uint64_t > yodec::Number::as_u64() const {
  if ( kind_ != Kind::PosInt ) return std::nullopt;
  return pos_;
}

inline double yodec::Number::as_f64() const {
  switch ( kind_ ) {
    case Kind::PosInt: return static_cast< double >( pos_ );
    case Kind::NegInt: return static_cast< double >( neg_ );
    case Kind::Float: return float_;
  }
  return float_;
}

inline std::string yodec::Number::to_string() const {
  switch ( kind_ ) {
    case Kind::PosInt: return fmt::format_int( pos_ ).str();
    case Kind::NegInt: return fmt::format_int( neg_ ).str();
    case Kind::Float: return internal::format_float( float_, integral_ );
  }
  return std::string();
}

inline std::optional< yodec::Number >
  yodec::Number::parse( std::string_view text )
{
  // Neither grammar may take "0123" or "-007"
  std::string_view unsigned_text = text;
  if ( !unsigned_text.empty()
    && ( unsigned_text[0] == '+' || unsigned_text[0] == '-' ) )
  {
    unsigned_text.remove_prefix( 1 );
  }
  if ( internal::digits_but_not_number(unsigned_text) ) return std::nullopt;

  if ( auto lit = internal::scan_integer(text) ) {
    if ( lit->overflow ) {
      return integral_float( lit->negative ? -lit->approx : lit->approx );
    }
    if ( !lit->negative || lit->magnitude == 0 ) return Number( lit->magnitude );

    // Magnitudes up to 2^63 are representable as negative int64
    constexpr std::uint64_t min_magnitude = static_cast< std::uint64_t >(
      std::numeric_limits< std::int64_t >::max() ) + 1;
    if ( lit->magnitude < min_magnitude ) {
      return Number( -static_cast< std::int64_t >( lit->magnitude ) );
    }
    if ( lit->magnitude == min_magnitude ) {
      return Number( std::numeric_limits< std::int64_t >::min() );
    }
    return integral_float( -static_cast< double >( lit->magnitude ) );
  }

  if ( auto f = internal::parse_float(text) ) return Number( *f );
  return std::nullopt;
}

inline bool yodec::Number::operator==( const Number& other ) const {
  if ( kind_ != other.kind_ ) return false;
  switch ( kind_ ) {
    case Kind::PosInt: return pos_ == other.pos_;
    case Kind::NegInt: return neg_ == other.neg_;
    case Kind::Float:
      if ( std::isnan(float_) || std::isnan(other.float_) ) {
        return std::isnan( float_ ) && std::isnan( other.float_ );
      }
      return float_ == other.float_
        && std::signbit( float_ ) == std::signbit( other.float_ );
  }
  return false;
}

inline std::size_t yodec::Number::hash() const {
  std::size_t h = static_cast< std::size_t >( kind_ );
  switch ( kind_ ) {
    case Kind::PosInt: return h ^ std::hash< std::uint64_t >()( pos_ );
    case Kind::NegInt: return h ^ std::hash< std::int64_t >()( neg_ );
    case Kind::Float: {
      if ( std::isnan(float_) ) return h;
      std::uint64_t bits = 0;
      std::memcpy( &bits, &float_, sizeof(bits) );
      return h ^ std::hash< std::uint64_t >()( bits );
    }
  }
  return h;
}
