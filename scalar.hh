// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <optional>
#include <string>
#include <string_view>

#include "number.hh"

namespace yodec {

  // Data-model shape of a resolved scalar
  enum class ScalarKind { Null, Bool, Number, String };

  struct ResolvedScalar {
    ScalarKind kind = ScalarKind::String;
    bool boolean = false;
    Number number;
  };

  // Tags with a meaning in the YAML 1.2 core schema. Everything else is
  // Custom and kept verbatim on the node.
  enum class CoreTag {
    Absent, // No tag on the node
    NonSpecific, // "!" forces a scalar to be a string
    Null, Bool, Int, Float, Str, Seq, Map, Merge,
    Custom
  };

namespace internal {

  inline const std::string CORE_TAG_PREFIX = "tag:yaml.org,2002:";
  inline const std::string NON_SPECIFIC_TAG = "!";
  inline const std::string MERGE_KEY = "<<";

} // namespace yodec::internal

  inline bool is_null_literal( std::string_view text ) {
    return text.empty() || text == "~" || text == "null" || text == "Null"
      || text == "NULL";
  }

  inline std::optional< bool > parse_bool( std::string_view text ) {
    if ( text == "true" || text == "True" || text == "TRUE" ) return true;
    if ( text == "false" || text == "False" || text == "FALSE" ) return false;
    return std::nullopt;
  }

  // Implicit typing of a plain, untagged scalar
  inline ResolvedScalar resolve_plain( std::string_view text ) {
    ResolvedScalar r;
    if ( is_null_literal(text) ) {
      r.kind = ScalarKind::Null;
    }
    else if ( auto b = parse_bool(text) ) {
      r.kind = ScalarKind::Bool;
      r.boolean = *b;
    }
    else if ( auto n = Number::parse(text) ) {
      r.kind = ScalarKind::Number;
      r.number = *n;
    }
    return r;
  }

  // Words that YAML 1.1 consumers read as booleans. They are plain strings
  // in the core schema but get quoted on output.
  inline bool is_yaml11_bool_word( std::string_view text ) {
    static const char* const WORDS[] = {
      "y", "Y", "yes", "Yes", "YES", "n", "N", "no", "No", "NO",
      "on", "On", "ON", "off", "Off", "OFF"
    };
    for ( const char* w : WORDS ) {
      if ( text == w ) return true;
    }
    return false;
  }

  // True if the text, written plain, would be read back as the same string
  inline bool plain_reads_as_string( std::string_view text ) {
    return resolve_plain( text ).kind == ScalarKind::String
      && !is_yaml11_bool_word( text );
  }

  inline CoreTag classify_tag( const std::string& tag ) {
    using internal::CORE_TAG_PREFIX;
    if ( tag.empty() ) return CoreTag::Absent;
    if ( tag == internal::NON_SPECIFIC_TAG ) return CoreTag::NonSpecific;
    if ( tag.compare(0, CORE_TAG_PREFIX.size(), CORE_TAG_PREFIX) != 0 ) {
      return CoreTag::Custom;
    }
    const std::string name = tag.substr( CORE_TAG_PREFIX.size() );
    if ( name == "null" ) return CoreTag::Null;
    if ( name == "bool" ) return CoreTag::Bool;
    if ( name == "int" ) return CoreTag::Int;
    if ( name == "float" ) return CoreTag::Float;
    if ( name == "str" ) return CoreTag::Str;
    if ( name == "seq" ) return CoreTag::Seq;
    if ( name == "map" ) return CoreTag::Map;
    if ( name == "merge" ) return CoreTag::Merge;
    // e.g. !!binary, !!timestamp: outside the core schema
    return CoreTag::Custom;
  }

  inline bool is_scalar_tag( CoreTag t ) {
    return t == CoreTag::Null || t == CoreTag::Bool || t == CoreTag::Int
      || t == CoreTag::Float || t == CoreTag::Str;
  }

  // Resolution of a scalar narrowed by a core-schema scalar tag. Returns
  // nothing when the text does not match the tag's type.
  inline std::optional< ResolvedScalar > resolve_tagged( std::string_view text,
    CoreTag tag )
  {
    ResolvedScalar r;
    switch ( tag ) {
      case CoreTag::Null:
        if ( !is_null_literal(text) ) return std::nullopt;
        r.kind = ScalarKind::Null;
        return r;
      case CoreTag::Bool: {
        auto b = parse_bool( text );
        if ( !b ) return std::nullopt;
        r.kind = ScalarKind::Bool;
        r.boolean = *b;
        return r;
      }
      case CoreTag::Int: {
        auto n = Number::parse( text );
        if ( !n || ( n->is_f64() && !n->looks_integral() ) ) return std::nullopt;
        r.kind = ScalarKind::Number;
        r.number = *n;
        return r;
      }
      case CoreTag::Float: {
        auto n = Number::parse( text );
        if ( !n ) return std::nullopt;
        r.kind = ScalarKind::Number;
        r.number = n->is_f64() ? *n : Number( n->as_f64() );
        return r;
      }
      case CoreTag::Str:
      case CoreTag::NonSpecific:
        return r;
      default:
        return std::nullopt;
    }
  }

} // namespace yodec
