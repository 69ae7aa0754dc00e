// Standard library includes
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_util.hh"
#include "value.hh"
#include "value_serde.hh"

using namespace yodec;
using yodec::test::error_kind;

TEST( Value, TypeQueriesAndAccessors ) {
  EXPECT_TRUE( Value().is_null() );
  EXPECT_EQ( Value(true).as_bool(), true );
  EXPECT_EQ( Value(-3).as_i64(), -3 );
  EXPECT_EQ( Value(3u).as_u64(), 3u );
  EXPECT_EQ( Value(2.5).as_f64(), 2.5 );
  EXPECT_EQ( *Value("x").as_str(), "x" );
  EXPECT_EQ( Value("x").as_i64(), std::nullopt );
  EXPECT_EQ( Value(1).as_str(), nullptr );
  EXPECT_EQ( Value(1).as_mapping(), nullptr );

  EXPECT_TRUE( Value(-3).is_i64() );
  EXPECT_FALSE( Value(-3).is_u64() );
  EXPECT_TRUE( Value(3u).is_u64() );
  EXPECT_TRUE( Value(3u).is_i64() );
  EXPECT_FALSE( Value( std::numeric_limits< std::uint64_t >::max() ).is_i64() );
  EXPECT_TRUE( Value(2.5).is_f64() );
  EXPECT_FALSE( Value(2.5).is_i64() );
  EXPECT_FALSE( Value("2").is_f64() );
  EXPECT_TRUE( Value( TaggedValue( "!N", 1.5 ) ).is_f64() );
}

TEST( Value, AccessorsLookThroughTags ) {
  Value v( TaggedValue( "!Port", Value(8080) ) );
  EXPECT_TRUE( v.is_tagged() );
  EXPECT_TRUE( v.is_number() );
  EXPECT_EQ( v.as_u64(), 8080u );
  EXPECT_EQ( v.as_tagged()->tag(), "!Port" );
  EXPECT_EQ( v.untag(), Value(8080) );
}

TEST( Value, IndexingMissesAreAbsent ) {
  const Value v( Mapping{ { "a", Sequence{ 1, 2 } } } );
  EXPECT_EQ( v.get("missing"), nullptr );
  EXPECT_EQ( v["a"][1], Value(2) );
  EXPECT_TRUE( v["a"][7].is_null() );
  EXPECT_TRUE( v["nope"]["deeper"].is_null() );
  EXPECT_EQ( v["a"].get(std::size_t(5)), nullptr );
  EXPECT_EQ( Value(1).get("a"), nullptr );
}

TEST( Value, IntegerLiteralIndices ) {
  const Value v( Sequence{ Mapping{ { "x", 1 } }, 2 } );
  EXPECT_EQ( v[0]["x"], Value(1) );
  EXPECT_EQ( v[1], Value(2) );
  EXPECT_EQ( *v.get(0), Value( Mapping{ { "x", 1 } } ) );
  EXPECT_EQ( v.get(-1), nullptr );
  EXPECT_TRUE( v[-1].is_null() );
  EXPECT_TRUE( v[2u].is_null() );

  // Integer keys of a mapping
  const Value m( Mapping{ { 0, "zero" } } );
  EXPECT_EQ( m[0], Value("zero") );
}

TEST( Value, MutableIndexingInserts ) {
  Value data;
  data["a"]["b"] = 1;
  EXPECT_EQ( data, Value( Mapping{ { "a", Mapping{ { "b", 1 } } } } ) );

  // Existing keys are overwritten in place, keeping their position
  data["z"] = "last";
  data["a"] = Sequence{ 1, 2 };
  EXPECT_EQ( *data.as_mapping()->begin()->first.as_str(), "a" );
  data["a"][1] = 20;
  EXPECT_EQ( data["a"], Value( Sequence{ 1, 20 } ) );

  // Looking up a missing key leaves a null entry behind
  EXPECT_TRUE( data["missing"].is_null() );
  EXPECT_TRUE( data.as_mapping()->contains( "missing" ) );

  // Tags are looked through
  Value tagged( TaggedValue( "!T", Mapping() ) );
  tagged["k"] = true;
  EXPECT_EQ( tagged.untag(), Value( Mapping{ { "k", true } } ) );
}

TEST( Value, MutableIndexingRejectsOtherShapes ) {
  Value seq( Sequence{ 1 } );
  EXPECT_EQ( error_kind( [&]() { seq["key"] = 1; } ), ErrorKind::InvalidType );
  EXPECT_EQ( error_kind( [&]() { seq[3] = 1; } ), ErrorKind::InvalidValue );
  EXPECT_EQ( error_kind( [&]() { seq[-1] = 1; } ), ErrorKind::InvalidType );

  Value scalar( "text" );
  EXPECT_EQ( error_kind( [&]() { scalar["key"] = 1; } ),
    ErrorKind::InvalidType );
  EXPECT_EQ( error_kind( [&]() { scalar[0] = 1; } ), ErrorKind::InvalidType );

  // Null becomes a mapping only for keys
  Value null;
  EXPECT_EQ( error_kind( [&]() { null[0] = 1; } ), ErrorKind::InvalidType );
}

TEST( Value, MappingEqualityIgnoresOrder ) {
  Value a( Mapping{ { "x", 1 }, { "y", 2 } } );
  Value b( Mapping{ { "y", 2 }, { "x", 1 } } );
  EXPECT_EQ( a, b );
  EXPECT_EQ( a.hash(), b.hash() );
  EXPECT_NE( a, Value( Mapping{ { "x", 1 }, { "y", 3 } } ) );
  EXPECT_NE( a, Value( Mapping{ { "x", 1 } } ) );
}

TEST( Value, IntegersNeverEqualFloats ) {
  EXPECT_NE( Value(1), Value(1.0) );
  EXPECT_NE( Value(0.0), Value(-0.0) );
  EXPECT_NE( Value("1"), Value(1) );
  EXPECT_NE( Value(), Value(false) );
}

TEST( Value, DuplicateInsertIsAnError ) {
  Mapping m;
  m.insert( "a", 1 );
  EXPECT_EQ( error_kind( [&]() { m.insert( "a", 2 ); } ),
    ErrorKind::DuplicateMapKey );
  EXPECT_FALSE( m.try_insert( "a", 3 ) );
  EXPECT_EQ( *m.get("a"), Value(1) );
  EXPECT_TRUE( m.try_insert( 1, "int key" ) );
  EXPECT_EQ( m.size(), 2u );
}

TEST( Value, MappingPreservesInsertionOrder ) {
  Mapping m;
  for ( const char* k : { "zeta", "alpha", "mid" } ) m.insert( k, Value() );
  std::string order;
  for ( const auto& [k, v] : m ) order += *k.as_str() + ' ';
  EXPECT_EQ( order, "zeta alpha mid " );

  auto removed = m.erase( "alpha" );
  ASSERT_TRUE( removed.has_value() );
  EXPECT_FALSE( m.contains("alpha") );
  EXPECT_TRUE( m.contains("mid") );
  EXPECT_EQ( m.erase("alpha"), std::nullopt );
}

TEST( Value, CopiesAreIndependent ) {
  Value original( Mapping{ { "list", Sequence{ 1 } } } );
  Value copy = original;
  copy.get_mut( "list" )->as_sequence_mut()->push_back( 2 );
  EXPECT_EQ( original["list"].as_sequence()->size(), 1u );
  EXPECT_EQ( copy["list"].as_sequence()->size(), 2u );

  Value tagged( TaggedValue( "!T", Sequence{ 1 } ) );
  Value tagged_copy = tagged;
  tagged_copy.untag_mut().as_sequence_mut()->clear();
  EXPECT_EQ( tagged.as_sequence()->size(), 1u );
}

TEST( Value, ApplyMergeHonorsPrecedence ) {
  Value v( Mapping{
    { "<<", Sequence{ Mapping{ { "a", 1 }, { "b", 2 } },
      Mapping{ { "b", 3 }, { "c", 4 } } } },
    { "a", 10 }
  } );
  v.apply_merge();
  EXPECT_EQ( v, Value( Mapping{ { "a", 10 }, { "b", 2 }, { "c", 4 } } ) );
}

TEST( Value, ApplyMergeNested ) {
  Value v( Mapping{
    { "outer", Mapping{ { "<<", Mapping{ { "x", 1 } } }, { "y", 2 } } }
  } );
  v.apply_merge();
  EXPECT_EQ( v["outer"], Value( Mapping{ { "x", 1 }, { "y", 2 } } ) );
}

TEST( Value, ApplyMergeRejectsNonMappings ) {
  Value scalar( Mapping{ { "<<", 1 } } );
  EXPECT_EQ( error_kind( [&]() { scalar.apply_merge(); } ),
    ErrorKind::UnexpectedEvent );

  Value list( Mapping{ { "<<", Sequence{ 1 } } } );
  EXPECT_EQ( error_kind( [&]() { list.apply_merge(); } ),
    ErrorKind::UnexpectedEvent );

  Value tagged( Mapping{ { "<<", TaggedValue( "!T", Mapping() ) } } );
  EXPECT_EQ( error_kind( [&]() { tagged.apply_merge(); } ),
    ErrorKind::InvalidTag );
}

TEST( Value, DebugOutput ) {
  std::ostringstream oss;
  oss << Value( Mapping{ { "a", Sequence{ 1, "x" } } } );
  EXPECT_NE( oss.str().find( "a" ), std::string::npos );
}

TEST( ValueBridge, ToValueAndBack ) {
  std::map< std::string, std::vector< int > > m{ { "a", { 1, 2 } },
    { "b", {} } };
  Value v = to_value( m );
  EXPECT_EQ( v, Value( Mapping{ { "a", Sequence{ 1, 2 } },
    { "b", Sequence{} } } ) );
  EXPECT_EQ( ( from_value< std::map< std::string, std::vector< int > > >(v) ),
    m );
}

TEST( ValueBridge, OptionalAndRanges ) {
  EXPECT_EQ( to_value( std::optional< int >() ), Value() );
  EXPECT_EQ( from_value< std::optional< int > >( Value(4) ), 4 );
  EXPECT_EQ( from_value< std::optional< int > >( Value() ), std::nullopt );
  EXPECT_EQ( error_kind( [&]() { from_value< std::uint8_t >( Value(300) ); } ),
    ErrorKind::InvalidValue );
  EXPECT_EQ( error_kind( [&]() { from_value< unsigned >( Value(-1) ); } ),
    ErrorKind::InvalidValue );
  EXPECT_EQ( error_kind( [&]() { from_value< int >( Value("x") ); } ),
    ErrorKind::InvalidType );
}

TEST( ValueBridge, IntegralFloatIsKept ) {
  Value big( *Number::parse("99999999999999999999") );
  EXPECT_EQ( to_value( big ), big );
  EXPECT_EQ( error_kind( [&]() { from_value< std::uint64_t >( big ); } ),
    ErrorKind::NumberOverflow );
  EXPECT_DOUBLE_EQ( from_value< double >( big ), 1e20 );
}

TEST( ValueBridge, EmptyTagIsRejected ) {
  ValueSerializer ser;
  EXPECT_EQ( error_kind( [&]() { ser.begin_tagged( "" ); } ),
    ErrorKind::InvalidTag );
}

TEST( ValueBridge, UnbalancedCalls ) {
  ValueSerializer ser;
  EXPECT_EQ( error_kind( [&]() { ser.end_seq(); } ),
    ErrorKind::UnexpectedEvent );
  ValueSerializer open;
  open.begin_map( std::nullopt );
  EXPECT_EQ( error_kind( [&]() { open.take(); } ),
    ErrorKind::UnexpectedEvent );
}
