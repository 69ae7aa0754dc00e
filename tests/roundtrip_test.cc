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

  // Enum with one unit variant and one carrying a string
  struct Message {
    enum class Kind { Quit, Text };
    Kind kind = Kind::Quit;
    std::string text;

    bool operator==( const Message& other ) const {
      return kind == other.kind && text == other.text;
    }
  };

}

template <>
struct yodec::data_converter< Message > {
  static void serialize( Serializer& s, const Message& m ) {
    if ( m.kind == Message::Kind::Quit ) {
      s.serialize_unit_variant( "Quit" );
      return;
    }
    s.begin_variant( "Text" );
    s.serialize_str( m.text );
    s.end_variant();
  }

  static void deserialize( Deserializer& d, Message& out ) {
    struct MessageVisitor : Visitor {
      Message& out;
      explicit MessageVisitor( Message& o ) : out( o ) {}
      std::string expecting() const override { return "enum Message"; }
      void visit_enum( EnumAccess& e ) override {
        if ( e.variant() == "Quit" ) {
          e.unit_variant();
          out = Message();
        }
        else if ( e.variant() == "Text" ) {
          Deserializer* payload = e.payload();
          if ( !payload ) {
            internal::throw_error( ErrorKind::InvalidType,
              "invalid type: unit variant, expected newtype variant" );
          }
          out.kind = Message::Kind::Text;
          data_converter< std::string >::deserialize( *payload, out.text );
        }
        else {
          internal::throw_error( ErrorKind::InvalidValue,
            "unknown variant '" + e.variant() + "'" );
        }
      }
    } visitor( out );
    d.deserialize_enum( visitor );
  }
};

namespace {

  void expect_round_trip( const Value& v ) {
    const std::string text = serialize( v );
    EXPECT_EQ( deserialize< Value >( text ), v ) << text;
    // Writing the decoded tree again gives the same text
    EXPECT_EQ( serialize( deserialize< Value >( text ) ), text );
  }

}

TEST( RoundTrip, Scalars ) {
  expect_round_trip( Value() );
  expect_round_trip( Value(true) );
  expect_round_trip( Value(-12) );
  expect_round_trip( Value( std::numeric_limits< std::uint64_t >::max() ) );
  expect_round_trip( Value( std::numeric_limits< std::int64_t >::min() ) );
  expect_round_trip( Value(0.1) );
  expect_round_trip( Value(1.0) );
  expect_round_trip( Value( -std::numeric_limits< double >::infinity() ) );
  expect_round_trip( Value( "plain text" ) );
}

TEST( RoundTrip, StringsThatNeedQuoting ) {
  for ( const char* s : { "", "null", "~", "true", "no", "0x1F", "1e3",
    "- dash", "key: value", "#hash", "<<", "two\nlines", "trailing\n",
    " lead", "tab\there", "quote'd", "\"dq\"", "\x01\x02", "caf\xC3\xA9" } )
  {
    expect_round_trip( Value( Mapping{ { "s", s } } ) );
  }
}

TEST( RoundTrip, IntegralFloatOutsideIntegerRange ) {
  const Value big( Number::integral_float( 1e20 ) );
  const Value back = deserialize< Value >( serialize( big ) );
  ASSERT_NE( back.as_number(), nullptr );
  EXPECT_TRUE( back.as_number()->looks_integral() );
  EXPECT_EQ( back, big );
}

TEST( RoundTrip, NaNReadsBackAsNaN ) {
  const Value nan( std::numeric_limits< double >::quiet_NaN() );
  const Value back = deserialize< Value >( serialize( nan ) );
  ASSERT_TRUE( back.as_f64().has_value() );
  EXPECT_NE( *back.as_f64(), *back.as_f64() );
}

TEST( RoundTrip, Collections ) {
  expect_round_trip( Value( Mapping{
    { "name", "server" },
    { "ports", Sequence{ 80, 443 } },
    { "limits", Mapping{ { "cpu", 1.5 }, { "mem", Value() } } },
    { "empty", Sequence{} },
    { "nested", Sequence{ Sequence{ 1 }, Mapping{ { "k", "v" } } } } } ) );

  // Non-string keys
  expect_round_trip( Value( Mapping{ { 1, "one" }, { true, "yes" },
    { Sequence{ 1, 2 }, "pair" } } ) );
}

TEST( RoundTrip, TaggedValues ) {
  expect_round_trip( Value( Mapping{
    { "p", TaggedValue( "!Point", Mapping{ { "x", 1 }, { "y", 2 } } ) },
    { "s", TaggedValue( "!Name", "bob" ) },
    { "b", TaggedValue( "tag:yaml.org,2002:binary", "aGVsbG8=" ) } } ) );
}

TEST( RoundTrip, FlowAndIndentPolicies ) {
  const Value v( Mapping{ { "a", Mapping{ { "b", Sequence{ 1, "x y" } } } } } );

  PrettyPolicy flow;
  flow.container_style = ContainerStyle::Flow;
  EXPECT_EQ( deserialize< Value >( Encoder( flow ).encode( v ) ), v );

  PrettyPolicy wide;
  wide.indent_width = 6;
  EXPECT_EQ( deserialize< Value >( Encoder( wide ).encode( v ) ), v );
}

TEST( RoundTrip, MultipleDocuments ) {
  std::vector< Value > docs = { Value(1), Value( Mapping{ { "a", "b" } } ),
    Value() };
  EXPECT_EQ( deserialize_all< Value >( serialize_all( docs ) ), docs );
}

TEST( RoundTrip, EnumVariants ) {
  const Message quit;
  Message text;
  text.kind = Message::Kind::Text;
  text.text = "hello";

  EXPECT_EQ( deserialize< Message >( serialize( quit ) ), quit );
  EXPECT_EQ( serialize( text ), "Text: hello\n" );
  EXPECT_EQ( deserialize< Message >( serialize( text ) ), text );

  // Tag form and null payload form
  EXPECT_EQ( deserialize< Message >( "!Text hello" ), text );
  EXPECT_EQ( deserialize< Message >( "Quit: ~" ), quit );

  EXPECT_EQ( error_kind( [&]() { deserialize< Message >( "Quit: 1" ); } ),
    ErrorKind::InvalidType );
  EXPECT_EQ( error_kind( [&]() { deserialize< Message >( "[1]" ); } ),
    ErrorKind::InvalidType );

  // Enums embedded in a Value Tree keep their variant
  std::vector< Message > messages = { quit, text };
  const Value tree = to_value( messages );
  EXPECT_EQ( from_value< std::vector< Message > >( tree ), messages );
}

TEST( RoundTrip, TypedStructures ) {
  using Config = std::map< std::string, std::vector< std::uint16_t > >;
  const Config config = { { "web", { 80, 443 } }, { "db", { 5432 } } };
  EXPECT_EQ( deserialize< Config >( serialize( config ) ), config );
}
