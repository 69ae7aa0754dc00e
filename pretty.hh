// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

#include "error.hh"
#include "policy.hh"
#include "scalar.hh"
#include "value.hh"

namespace yodec {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the key order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

namespace internal {

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Tag in the shorthand notation fkYAML writes verbatim
  inline std::string shorthand_tag( const std::string& tag ) {
    if ( tag.compare(0, CORE_TAG_PREFIX.size(), CORE_TAG_PREFIX) == 0 ) {
      return "!!" + tag.substr( CORE_TAG_PREFIX.size() );
    }
    if ( !tag.empty() && tag[0] == '!' ) return tag;
    return "!<" + tag + '>';
  }

  // Node holding the same content as the Value Tree, or nothing when the
  // tree uses something ordered_node cannot store exactly (integers above
  // the int64 range, integer-looking floats, non-string keys)
  inline std::optional< ordered_node > to_node( const Value& v ) {
    switch ( v.type() ) {
      case Value::Type::Null:
        return ordered_node();
      case Value::Type::Bool:
        return make_node_from( *v.as_bool() );
      case Value::Type::Number: {
        const Number& n = *v.as_number();
        if ( n.looks_integral() ) return std::nullopt;
        if ( n.is_f64() ) return make_node_from( n.as_f64() );
        if ( auto i = n.as_i64() ) return make_node_from( *i );
        return std::nullopt;
      }
      case Value::Type::String:
        return make_node_from( *v.as_str() );
      case Value::Type::Sequence: {
        std::vector< ordered_node > elements;
        for ( const auto& element : *v.as_sequence() ) {
          auto node = to_node( element );
          if ( !node ) return std::nullopt;
          elements.push_back( std::move(*node) );
        }
        if ( elements.empty() ) return ordered_node::sequence();
        return make_node_from( elements );
      }
      case Value::Type::Mapping: {
        ordered_node m = ordered_node::mapping();
        for ( const auto& [key, value] : *v.as_mapping() ) {
          if ( key.type() != Value::Type::String ) return std::nullopt;
          auto node = to_node( value );
          if ( !node ) return std::nullopt;
          m[ *key.as_str() ] = std::move( *node );
        }
        return m;
      }
      case Value::Type::Tagged: {
        const TaggedValue& tagged = *v.as_tagged();
        if ( tagged.value().is_tagged() ) return std::nullopt;
        auto node = to_node( tagged.value() );
        if ( !node ) return std::nullopt;
        node->add_tag_name( shorthand_tag(tagged.tag()) );
        return node;
      }
    }
    return std::nullopt;
  }

  // Writes the documents with fkYAML. Returns nothing if the policy asks
  // for layout fkYAML does not offer or the content does not fit in an
  // ordered_node.
  inline std::optional< std::string > pretty_print(
    const std::vector< Value >& docs, const PrettyPolicy& policy )
  {
    if ( policy.indent_width != PrettyPolicy::DEFAULT_INDENT_WIDTH
      || policy.container_style == ContainerStyle::Flow )
    {
      return std::nullopt;
    }

    if ( docs.empty() ) return std::string();

    std::vector< ordered_node > nodes;
    nodes.reserve( docs.size() );
    for ( const auto& doc : docs ) {
      auto node = to_node( doc );
      if ( !node ) return std::nullopt;
      nodes.push_back( std::move(*node) );
    }

    try {
      if ( nodes.size() == 1 ) return ordered_node::serialize( nodes.front() );
      return ordered_node::serialize_docs( nodes );
    }
    catch ( const fkyaml::exception& ex ) {
      internal::throw_error( ErrorKind::Emitter, ex.what() );
    }
  }

} // namespace yodec::internal

} // namespace yodec
