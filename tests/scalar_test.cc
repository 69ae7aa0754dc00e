#include <gtest/gtest.h>

#include "scalar.hh"

using namespace yodec;

TEST( ScalarResolver, NullLiterals ) {
  for ( const char* text : { "", "~", "null", "Null", "NULL" } ) {
    EXPECT_EQ( resolve_plain(text).kind, ScalarKind::Null ) << text;
  }
  EXPECT_EQ( resolve_plain("nULL").kind, ScalarKind::String );
}

TEST( ScalarResolver, CoreSchemaBooleansOnly ) {
  EXPECT_EQ( resolve_plain("true").kind, ScalarKind::Bool );
  EXPECT_TRUE( resolve_plain("True").boolean );
  EXPECT_FALSE( resolve_plain("FALSE").boolean );
  EXPECT_EQ( resolve_plain("yes").kind, ScalarKind::String );
  EXPECT_EQ( resolve_plain("on").kind, ScalarKind::String );
  EXPECT_EQ( resolve_plain("tRUE").kind, ScalarKind::String );
}

TEST( ScalarResolver, Numbers ) {
  ResolvedScalar r = resolve_plain( "-42" );
  EXPECT_EQ( r.kind, ScalarKind::Number );
  EXPECT_EQ( r.number, Number(-42) );
  EXPECT_EQ( resolve_plain("3.25").number, Number(3.25) );
  EXPECT_EQ( resolve_plain("0123").kind, ScalarKind::String );
  EXPECT_EQ( resolve_plain("-0123").kind, ScalarKind::String );
  EXPECT_EQ( resolve_plain("007").kind, ScalarKind::String );
  EXPECT_EQ( resolve_plain("1.2.3").kind, ScalarKind::String );
}

TEST( ScalarResolver, StringsThatNeedQuoting ) {
  EXPECT_FALSE( plain_reads_as_string("null") );
  EXPECT_FALSE( plain_reads_as_string("12") );
  EXPECT_FALSE( plain_reads_as_string("true") );
  EXPECT_FALSE( plain_reads_as_string("yes") );
  EXPECT_FALSE( plain_reads_as_string("N") );
  EXPECT_TRUE( plain_reads_as_string("hello") );
  EXPECT_TRUE( plain_reads_as_string("yesterday") );
}

TEST( ScalarResolver, ClassifyTags ) {
  EXPECT_EQ( classify_tag(""), CoreTag::Absent );
  EXPECT_EQ( classify_tag("!"), CoreTag::NonSpecific );
  EXPECT_EQ( classify_tag("tag:yaml.org,2002:int"), CoreTag::Int );
  EXPECT_EQ( classify_tag("tag:yaml.org,2002:merge"), CoreTag::Merge );
  EXPECT_EQ( classify_tag("tag:yaml.org,2002:binary"), CoreTag::Custom );
  EXPECT_EQ( classify_tag("!Point"), CoreTag::Custom );
}

TEST( ScalarResolver, TagsNarrowResolution ) {
  EXPECT_EQ( resolve_tagged("5", CoreTag::Str)->kind, ScalarKind::String );
  EXPECT_EQ( resolve_tagged("true", CoreTag::NonSpecific)->kind,
    ScalarKind::String );
  EXPECT_EQ( resolve_tagged("5", CoreTag::Int)->number, Number(5) );
  EXPECT_FALSE( resolve_tagged("5.5", CoreTag::Int).has_value() );
  EXPECT_FALSE( resolve_tagged("abc", CoreTag::Int).has_value() );

  // !!float accepts integer text
  EXPECT_EQ( resolve_tagged("5", CoreTag::Float)->number, Number(5.0) );
  EXPECT_EQ( resolve_tagged("~", CoreTag::Null)->kind, ScalarKind::Null );
  EXPECT_FALSE( resolve_tagged("nil", CoreTag::Null).has_value() );
  EXPECT_FALSE( resolve_tagged("yes", CoreTag::Bool).has_value() );
  EXPECT_FALSE( resolve_tagged("x", CoreTag::Seq).has_value() );
}
