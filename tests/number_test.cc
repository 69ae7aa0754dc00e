// Standard library includes
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

#include <gtest/gtest.h>

#include "number.hh"

using yodec::Number;

namespace {

  std::uint64_t bits_of( double f ) {
    std::uint64_t bits = 0;
    std::memcpy( &bits, &f, sizeof(bits) );
    return bits;
  }

}

TEST( Number, IntegersUseMinimalDigits ) {
  EXPECT_EQ( Number(0).to_string(), "0" );
  EXPECT_EQ( Number(42).to_string(), "42" );
  EXPECT_EQ( Number(-17).to_string(), "-17" );
  EXPECT_EQ( Number( std::numeric_limits< std::uint64_t >::max() ).to_string(),
    "18446744073709551615" );
  EXPECT_EQ( Number( std::numeric_limits< std::int64_t >::min() ).to_string(),
    "-9223372036854775808" );
}

TEST( Number, FloatsAlwaysLookLikeFloats ) {
  EXPECT_EQ( Number(1.0).to_string(), "1.0" );
  EXPECT_EQ( Number(-3.0).to_string(), "-3.0" );
  EXPECT_EQ( Number(0.1).to_string(), "0.1" );
  EXPECT_EQ( Number(2.5).to_string(), "2.5" );
}

TEST( Number, SpecialFloats ) {
  EXPECT_EQ( Number( std::numeric_limits< double >::infinity() ).to_string(),
    ".inf" );
  EXPECT_EQ( Number( -std::numeric_limits< double >::infinity() ).to_string(),
    "-.inf" );
  EXPECT_EQ( Number( std::numeric_limits< double >::quiet_NaN() ).to_string(),
    ".nan" );

  EXPECT_TRUE( Number::parse(".inf")->is_infinite() );
  EXPECT_TRUE( Number::parse("-.Inf")->is_infinite() );
  EXPECT_TRUE( Number::parse(".NaN")->is_nan() );
  EXPECT_FALSE( Number::parse("-.nan").has_value() );
}

TEST( Number, ShortestTextParsesBackBitExact ) {
  const double samples[] = { 0.1, 1. / 3., 1e-300, 6.02214076e23,
    -0.0, 123456789.125, std::numeric_limits< double >::max(),
    std::numeric_limits< double >::denorm_min() };
  for ( double f : samples ) {
    const std::string text = Number( f ).to_string();
    auto back = Number::parse( text );
    ASSERT_TRUE( back.has_value() ) << text;
    ASSERT_TRUE( back->is_f64() ) << text;
    EXPECT_EQ( bits_of( back->as_f64() ), bits_of(f) ) << text;
  }
}

TEST( Number, IntegerGrammar ) {
  EXPECT_EQ( *Number::parse("0x1F"), Number(31) );
  EXPECT_EQ( *Number::parse("0o17"), Number(15) );
  EXPECT_EQ( *Number::parse("0b101"), Number(5) );
  EXPECT_EQ( *Number::parse("-12"), Number(-12) );
  EXPECT_EQ( *Number::parse("+12"), Number(12) );
  EXPECT_TRUE( Number::parse("-0")->is_u64() );

  // Leading zeros make a string
  EXPECT_FALSE( Number::parse("0123").has_value() );
  EXPECT_FALSE( Number::parse("-0123").has_value() );
  EXPECT_FALSE( Number::parse("007").has_value() );
  EXPECT_FALSE( Number::parse("00").has_value() );
  EXPECT_EQ( *Number::parse("0"), Number(0) );
  EXPECT_EQ( *Number::parse("0.5"), Number(0.5) );
  EXPECT_FALSE( Number::parse("12abc").has_value() );
  EXPECT_FALSE( Number::parse("0x").has_value() );
  EXPECT_FALSE( Number::parse("").has_value() );
}

TEST( Number, FloatGrammar ) {
  EXPECT_EQ( *Number::parse("1.5"), Number(1.5) );
  EXPECT_EQ( *Number::parse(".5"), Number(0.5) );
  EXPECT_EQ( *Number::parse("1."), Number(1.0) );
  EXPECT_EQ( *Number::parse("1e3"), Number(1000.0) );
  EXPECT_EQ( *Number::parse("-2.5E-1"), Number(-0.25) );
  EXPECT_FALSE( Number::parse("1e").has_value() );
  EXPECT_FALSE( Number::parse("1.2.3").has_value() );
  EXPECT_FALSE( Number::parse("1e999").has_value() );
}

TEST( Number, OverflowingIntegerFallsBackToFloat ) {
  auto n = Number::parse( "99999999999999999999" );
  ASSERT_TRUE( n.has_value() );
  EXPECT_TRUE( n->is_f64() );
  EXPECT_TRUE( n->looks_integral() );
  EXPECT_DOUBLE_EQ( n->as_f64(), 1e20 );

  // Written back as an integer literal that overflows the same way
  const std::string text = n->to_string();
  EXPECT_EQ( text.find_first_of(".eE"), std::string::npos );
  EXPECT_EQ( *Number::parse(text), *n );

  auto negative = Number::parse( "-9223372036854775809" );
  ASSERT_TRUE( negative.has_value() );
  EXPECT_TRUE( negative->looks_integral() );

  // Rounds to exactly -2^63, which must not come back as an int64
  const std::string negative_text = negative->to_string();
  auto negative_back = Number::parse( negative_text );
  ASSERT_TRUE( negative_back.has_value() ) << negative_text;
  EXPECT_TRUE( negative_back->is_f64() ) << negative_text;
  EXPECT_TRUE( negative_back->looks_integral() ) << negative_text;
  EXPECT_EQ( *negative_back, *negative );
}

TEST( Number, EqualityIsBitExact ) {
  EXPECT_EQ( Number(1), Number(1) );
  EXPECT_NE( Number(1), Number(1.0) );
  EXPECT_NE( Number(0.0), Number(-0.0) );
  EXPECT_EQ( Number( std::nan("") ), Number( std::nan("") ) );
  EXPECT_EQ( Number(0.1).hash(), Number(0.1).hash() );
}

TEST( Number, Accessors ) {
  EXPECT_EQ( Number(5).as_i64(), 5 );
  EXPECT_EQ( Number(-5).as_u64(), std::nullopt );
  EXPECT_EQ( Number( std::numeric_limits< std::uint64_t >::max() ).as_i64(),
    std::nullopt );
  EXPECT_DOUBLE_EQ( Number(-5).as_f64(), -5. );
  EXPECT_EQ( Number(2.5).as_i64(), std::nullopt );
}
