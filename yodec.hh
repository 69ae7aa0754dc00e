// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "datamodel.hh"
#include "de.hh"
#include "error.hh"
#include "loader.hh"
#include "number.hh"
#include "policy.hh"
#include "pretty.hh"
#include "scalar.hh"
#include "ser.hh"
#include "value.hh"
#include "value_serde.hh"

namespace yodec {

  // YAML text --> typed values
  class Decoder {
  public:

    // Constructor optionally takes a non-default ceiling on the nesting of
    // collections and alias expansions
    inline explicit Decoder( int recursion_limit = DEFAULT_RECURSION_LIMIT )
      : recursion_limit_( recursion_limit ) {}

    // Single document. An empty stream reads as a null document; a stream
    // with more than one document is rejected.
    template < typename T > T decode( std::string_view text ) const;
    template < typename T > T decode( std::istream& in ) const;

    // One value per document, in order
    template < typename T >
    std::vector< T > decode_all( std::string_view text ) const;
    template < typename T >
    std::vector< T > decode_all( std::istream& in ) const;

    inline int recursion_limit() const { return recursion_limit_; }

  private:

    int recursion_limit_;
  };

  // Typed values --> YAML text
  class Encoder {
  public:

    inline explicit Encoder( PrettyPolicy policy = PrettyPolicy() )
      : policy_( std::move(policy) ) {}

    template < typename T > std::string encode( const T& value ) const;

    // Each value becomes one document, separated by "---"
    template < typename T >
    std::string encode_all( const std::vector< T >& values ) const;

    inline const PrettyPolicy& policy() const { return policy_; }

  private:

    std::string encode_values( const std::vector< Value >& docs ) const;

    PrettyPolicy policy_;
  };

  template < typename T >
  std::string serialize( const T& value ) {
    return Encoder().encode( value );
  }

  template < typename T >
  std::string serialize_all( const std::vector< T >& values ) {
    return Encoder().encode_all( values );
  }

  template < typename T >
  T deserialize( std::string_view text ) {
    return Decoder().decode< T >( text );
  }

  template < typename T >
  std::vector< T > deserialize_all( std::string_view text ) {
    return Decoder().decode_all< T >( text );
  }

namespace internal {

  inline std::string read_all( std::istream& in ) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

} // namespace yodec::internal

} // namespace yodec

// Decoder

template < typename T >
T yodec::Decoder::decode( std::string_view text ) const {
  Loader loader( text );
  auto doc = loader.next_document();
  if ( !doc ) return from_value< T >( Value() );

  T result = internal::deserialize_document< T >( *doc, recursion_limit_ );
  if ( loader.next_document() ) {
    internal::throw_error( ErrorKind::MoreThanOneDocument,
      "deserializing from YAML containing more than one document is not "
      "supported" );
  }
  return result;
}

template < typename T >
T yodec::Decoder::decode( std::istream& in ) const {
  return this->decode< T >( internal::read_all(in) );
}

template < typename T >
std::vector< T > yodec::Decoder::decode_all( std::string_view text ) const {
  Loader loader( text );
  std::vector< T > out;
  while ( auto doc = loader.next_document() ) {
    out.push_back( internal::deserialize_document< T >( *doc,
      recursion_limit_ ) );
  }
  return out;
}

template < typename T >
std::vector< T > yodec::Decoder::decode_all( std::istream& in ) const {
  return this->decode_all< T >( internal::read_all(in) );
}

// Encoder

template < typename T >
std::string yodec::Encoder::encode( const T& value ) const {
  if ( policy_.backend == Backend::Pretty ) {
    return this->encode_values( { to_value(value) } );
  }
  return internal::serialize_documents< T >( &value, &value + 1, policy_ );
}

template < typename T >
std::string yodec::Encoder::encode_all( const std::vector< T >& values ) const
{
  if ( policy_.backend == Backend::Pretty ) {
    std::vector< Value > docs;
    docs.reserve( values.size() );
    for ( const auto& v : values ) docs.push_back( to_value(v) );
    return this->encode_values( docs );
  }
  return internal::serialize_documents< T >( values.begin(), values.end(),
    policy_ );
}

// The pretty backend's output is kept only if it reads back as the same
// documents; otherwise the emitter writes them
inline std::string yodec::Encoder::encode_values(
  const std::vector< Value >& docs ) const
{
  policy_.validate();
  std::string emitted = internal::serialize_documents< Value >( docs.begin(),
    docs.end(), policy_ );

  try {
    auto pretty = internal::pretty_print( docs, policy_ );
    if ( pretty && Decoder().decode_all< Value >( *pretty ) == docs ) {
      return *pretty;
    }
  }
  catch ( const Error& ) {
    // fkYAML failed or wrote unreadable text: keep the emitter's text
  }
  return emitted;
}
