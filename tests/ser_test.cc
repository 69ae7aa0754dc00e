// Standard library includes
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "test_util.hh"
#include "yodec.hh"

using namespace yodec;
using yodec::test::error_kind;

namespace {

  std::string emit( const Value& v, PrettyPolicy policy = PrettyPolicy() ) {
    return Encoder( policy ).encode( v );
  }

  // Drives an EventSerializer by hand and returns the text
  template < typename F >
  std::string drive( F&& fn ) {
    std::string out;
    EventSerializer ser( out, PrettyPolicy() );
    fn( ser );
    ser.finish();
    return out;
  }

}

TEST( Serializer, BlockMappings ) {
  EXPECT_EQ( emit( Value( Mapping{ { "a", 1 } } ) ), "a: 1\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "a", Sequence{ 1, 2 } } } ) ),
    "a:\n- 1\n- 2\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "a", Mapping{ { "b", true } } },
    { "c", Value() } } ) ), "a:\n  b: true\nc: null\n" );
}

TEST( Serializer, KeyOrderIsInsertionOrder ) {
  EXPECT_EQ( emit( Value( Mapping{ { "z", 1 }, { "a", 2 }, { "m", 3 } } ) ),
    "z: 1\na: 2\nm: 3\n" );
}

TEST( Serializer, FlowContainers ) {
  PrettyPolicy policy;
  policy.container_style = ContainerStyle::Flow;
  EXPECT_EQ( emit( Value( Mapping{ { "a", 1 }, { "b", Sequence{ 1, 2 } } } ),
    policy ), "{a: 1, b: [1, 2]}\n" );
}

TEST( Serializer, EmptyContainers ) {
  const Value v( Mapping{ { "a", Sequence{} }, { "b", Mapping{} } } );
  EXPECT_EQ( emit( v ), "a: []\nb: {}\n" );
}

TEST( Serializer, IndentWidth ) {
  PrettyPolicy policy;
  policy.indent_width = 4;
  EXPECT_EQ( emit( Value( Mapping{ { "a", Mapping{ { "b", 1 } } } } ),
    policy ), "a:\n    b: 1\n" );
}

TEST( Serializer, StringQuoting ) {
  EXPECT_EQ( emit( Value( Mapping{ { "text", "line1\nline2" } } ) ),
    "text: |-\n  line1\n  line2\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "text", "line1\nline2\n" } } ) ),
    "text: |\n  line1\n  line2\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "a", "null" } } ) ), "a: 'null'\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "a", "yes" } } ) ), "a: 'yes'\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "a", "" } } ) ), "a: ''\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "a", "123" } } ) ), "a: '123'\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "<<", 1 } } ) ), "'<<': 1\n" );
}

TEST( Serializer, Numbers ) {
  EXPECT_EQ( emit( Value( Mapping{ { "x", 0.1 } } ) ), "x: 0.1\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "x", 1.0 } } ) ), "x: 1.0\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "x", -7 } } ) ), "x: -7\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "x",
    std::numeric_limits< std::uint64_t >::max() } } ) ),
    "x: 18446744073709551615\n" );
  EXPECT_EQ( emit( Value( Mapping{ { "x",
    std::numeric_limits< double >::infinity() } } ) ), "x: .inf\n" );
}

TEST( Serializer, MultipleDocuments ) {
  std::vector< Value > docs = { Value( Mapping{ { "a", 1 } } ),
    Value( Mapping{ { "b", 2 } } ) };
  EXPECT_EQ( serialize_all( docs ), "a: 1\n---\nb: 2\n" );
  EXPECT_EQ( serialize_all( std::vector< Value >() ), "" );
}

TEST( Serializer, Variants ) {
  std::string out = drive( []( EventSerializer& s ) {
    s.begin_variant( "Text" );
    s.serialize_str( "hello" );
    s.end_variant();
  } );
  EXPECT_EQ( out, "Text: hello\n" );

  std::string unit = drive( []( EventSerializer& s ) {
    s.begin_map( 1 );
    s.serialize_str( "cmd" );
    s.serialize_unit_variant( "Quit" );
    s.end_map();
  } );
  EXPECT_EQ( unit, "cmd: Quit\n" );
}

TEST( Serializer, TaggedValues ) {
  const Value v( Mapping{ { "p",
    TaggedValue( "!Point", Mapping{ { "x", 1 } } ) } } );
  const std::string out = emit( v );
  EXPECT_NE( out.find( "!Point" ), std::string::npos );
  EXPECT_EQ( deserialize< Value >( out ), v );
}

TEST( Serializer, TagErrors ) {
  EXPECT_EQ( error_kind( [&]() {
    drive( []( EventSerializer& s ) { s.begin_tagged( "" ); } ); } ),
    ErrorKind::InvalidTag );
  EXPECT_EQ( error_kind( [&]() {
    drive( []( EventSerializer& s ) {
      s.begin_tagged( "!A" );
      s.begin_tagged( "!B" );
    } ); } ),
    ErrorKind::InvalidTag );
}

TEST( Serializer, UnbalancedCalls ) {
  EXPECT_EQ( error_kind( [&]() {
    drive( []( EventSerializer& s ) { s.end_seq(); } ); } ),
    ErrorKind::UnexpectedEvent );
  EXPECT_EQ( error_kind( [&]() {
    drive( []( EventSerializer& s ) { s.begin_seq( std::nullopt ); } ); } ),
    ErrorKind::UnexpectedEvent );
  EXPECT_EQ( error_kind( [&]() {
    drive( []( EventSerializer& s ) {
      s.begin_map( std::nullopt );
      s.end_seq();
    } ); } ),
    ErrorKind::UnexpectedEvent );
}

TEST( Serializer, InvalidUtf8IsReported ) {
  auto scalar = yodec::test::thrown_error( [&]() {
    emit( Value( Mapping{ { "a", "ab\xff" } } ) ); } );
  ASSERT_TRUE( scalar.has_value() );
  EXPECT_EQ( scalar->kind(), ErrorKind::Emitter );
  EXPECT_EQ( scalar->message(), "invalid UTF-8 in scalar" );

  auto tag = yodec::test::thrown_error( [&]() {
    emit( Value( TaggedValue( "!a\xff", 1 ) ) ); } );
  ASSERT_TRUE( tag.has_value() );
  EXPECT_EQ( tag->kind(), ErrorKind::Emitter );
  EXPECT_EQ( tag->message(), "invalid UTF-8 in tag" );

  // Overlong and truncated sequences
  EXPECT_EQ( error_kind( [&]() {
    emit( Value( Mapping{ { "a", "\xc0\xaf" } } ) ); } ),
    ErrorKind::Emitter );
  EXPECT_EQ( error_kind( [&]() {
    emit( Value( Mapping{ { "a", "\xe2\x82" } } ) ); } ),
    ErrorKind::Emitter );

  EXPECT_TRUE( internal::is_valid_utf8( "caf\xc3\xa9 \xf0\x9f\x98\x80" ) );
}

TEST( Serializer, BytesAreUnsupported ) {
  EXPECT_EQ( error_kind( [&]() {
    drive( []( EventSerializer& s ) {
      s.serialize_bytes( std::vector< std::uint8_t >{ 1, 2 } );
    } ); } ),
    ErrorKind::Custom );
}

TEST( Serializer, TypedValues ) {
  std::map< std::string, std::vector< int > > m = { { "ports", { 80, 443 } } };
  EXPECT_EQ( serialize( m ), "ports:\n- 80\n- 443\n" );
}
