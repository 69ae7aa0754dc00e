// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// libyaml event-based YAML emitter
// https://github.com/yaml/libyaml
#include <yaml.h>

#include "datamodel.hh"
#include "error.hh"
#include "number.hh"
#include "policy.hh"

namespace yodec {

  // Owns a libyaml emitter writing into a string
  class Emitter {
  public:

    Emitter( std::string& out, int indent_width );
    ~Emitter();

    Emitter( const Emitter& ) = delete;
    Emitter& operator=( const Emitter& ) = delete;

    // Hands the event to libyaml, which takes ownership of it
    void emit( yaml_event_t& event );

    void stream_start();
    void stream_end();
    void document_start();
    void document_end();
    void scalar( const std::string& tag, std::string_view value,
      yaml_scalar_style_t style );
    void sequence_start( const std::string& tag, yaml_sequence_style_t style );
    void sequence_end();
    void mapping_start( const std::string& tag, yaml_mapping_style_t style );
    void mapping_end();

  private:

    static int write( void* data, unsigned char* buffer, std::size_t size );
    [[noreturn]] void fail( const char* what );

    yaml_emitter_t emitter_;
  };

  // Turns data-model calls into emitter events. Each top-level value is
  // written as one document.
  class EventSerializer : public Serializer {
  public:

    EventSerializer( std::string& out, const PrettyPolicy& policy );

    // Ends the stream. Throws if a value is still open.
    void finish();

    void serialize_null() override;
    void serialize_bool( bool v ) override;
    void serialize_i64( std::int64_t v ) override;
    void serialize_u64( std::uint64_t v ) override;
    void serialize_f64( double v ) override;
    void serialize_number( const Number& n ) override;
    void serialize_str( std::string_view v ) override;

    void begin_seq( std::optional< std::size_t > len ) override;
    void end_seq() override;
    void begin_map( std::optional< std::size_t > len ) override;
    void end_map() override;

    void serialize_unit_variant( std::string_view variant ) override;
    void begin_variant( std::string_view variant ) override;
    void end_variant() override;

    void begin_tagged( std::string_view tag ) override;
    void end_tagged() override;

  private:

    enum class FrameKind { Seq, Map, Variant, Tagged };

    struct Frame {
      FrameKind kind;
      std::size_t items = 0;
    };

    // A collection whose start event is held back until its first item
    // shows whether it is empty
    struct PendingStart {
      bool mapping;
      std::string tag;
    };

    void begin_node();
    void end_node();
    void flush_pending( bool empty );
    void plain_scalar( const std::string& text );
    void string_scalar( std::string_view text );
    std::string take_tag();
    void close( FrameKind kind, const char* what );

    yaml_sequence_style_t sequence_style( bool empty ) const;
    yaml_mapping_style_t mapping_style( bool empty ) const;

    PrettyPolicy policy_;
    Emitter emitter_;
    std::vector< Frame > stack_;
    std::optional< PendingStart > pending_;
    std::string tag_;
    bool in_document_ = false;
    bool finished_ = false;
  };

namespace internal {

  inline const yaml_char_t* yaml_chars( const std::string& s ) {
    return s.empty() ? nullptr
      : reinterpret_cast< const yaml_char_t* >( s.c_str() );
  }

  // Same acceptance rule libyaml applies when an event is created:
  // shortest-form sequences of code points up to U+10FFFF
  inline bool is_valid_utf8( std::string_view text ) {
    std::size_t i = 0;
    while ( i < text.size() ) {
      const unsigned char lead = text[ i ];
      std::size_t width = 0;
      std::uint32_t cp = 0;
      if ( ( lead & 0x80 ) == 0x00 ) { width = 1; cp = lead; }
      else if ( ( lead & 0xE0 ) == 0xC0 ) { width = 2; cp = lead & 0x1F; }
      else if ( ( lead & 0xF0 ) == 0xE0 ) { width = 3; cp = lead & 0x0F; }
      else if ( ( lead & 0xF8 ) == 0xF0 ) { width = 4; cp = lead & 0x07; }
      else return false;

      if ( i + width > text.size() ) return false;
      for ( std::size_t k = 1; k < width; ++k ) {
        const unsigned char c = text[ i + k ];
        if ( ( c & 0xC0 ) != 0x80 ) return false;
        cp = ( cp << 6 ) + ( c & 0x3F );
      }
      if ( !( width == 1 || ( width == 2 && cp >= 0x80 )
        || ( width == 3 && cp >= 0x800 ) || ( width == 4 && cp >= 0x10000 ) ) )
      {
        return false;
      }
      if ( cp > 0x10FFFF ) return false;
      i += width;
    }
    return true;
  }

  inline void check_utf8( std::string_view text, const char* what ) {
    if ( !is_valid_utf8(text) ) {
      throw_error( ErrorKind::Emitter, std::string( "invalid UTF-8 in " )
        + what );
    }
  }

  inline yaml_scalar_style_t to_yaml_style( QuoteStyle style ) {
    switch ( style ) {
      case QuoteStyle::Plain: return YAML_PLAIN_SCALAR_STYLE;
      case QuoteStyle::Literal: return YAML_LITERAL_SCALAR_STYLE;
      case QuoteStyle::SingleQuoted: return YAML_SINGLE_QUOTED_SCALAR_STYLE;
      case QuoteStyle::DoubleQuoted: return YAML_DOUBLE_QUOTED_SCALAR_STYLE;
    }
    return YAML_ANY_SCALAR_STYLE;
  }

  // Writes every value of the range as one document of a stream
  template < typename T, typename It >
  std::string serialize_documents( It begin, It end,
    const PrettyPolicy& policy )
  {
    policy.validate();
    std::string out;
    EventSerializer ser( out, policy );
    for ( It it = begin; it != end; ++it ) {
      data_converter< T >::serialize( ser, *it );
    }
    ser.finish();
    return out;
  }

} // namespace yodec::internal

} // namespace yodec

// Emitter

inline yodec::Emitter::Emitter( std::string& out, int indent_width ) {
  if ( !yaml_emitter_initialize(&emitter_) ) {
    internal::throw_error( ErrorKind::Emitter,
      "failed to initialize the YAML emitter" );
  }
  yaml_emitter_set_output( &emitter_, &Emitter::write, &out );
  yaml_emitter_set_indent( &emitter_, indent_width );
  yaml_emitter_set_width( &emitter_, -1 );
  yaml_emitter_set_unicode( &emitter_, 1 );
}

inline yodec::Emitter::~Emitter() {
  yaml_emitter_delete( &emitter_ );
}

inline int yodec::Emitter::write( void* data, unsigned char* buffer,
  std::size_t size )
{
  static_cast< std::string* >( data )->append(
    reinterpret_cast< const char* >( buffer ), size );
  return 1;
}

[[noreturn]] inline void yodec::Emitter::fail( const char* what ) {
  internal::throw_error( ErrorKind::Emitter, emitter_.problem
    ? std::string( emitter_.problem ) : std::string( what ) );
}

inline void yodec::Emitter::emit( yaml_event_t& event ) {
  if ( !yaml_emitter_emit(&emitter_, &event) ) {
    this->fail( "failed to emit YAML event" );
  }
}

inline void yodec::Emitter::stream_start() {
  yaml_event_t event;
  if ( !yaml_stream_start_event_initialize(&event, YAML_UTF8_ENCODING) ) {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

inline void yodec::Emitter::stream_end() {
  yaml_event_t event;
  if ( !yaml_stream_end_event_initialize(&event) ) {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

// Documents after the first always get a "---" marker from libyaml
inline void yodec::Emitter::document_start() {
  yaml_event_t event;
  if ( !yaml_document_start_event_initialize(&event, nullptr, nullptr, nullptr,
    1) )
  {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

inline void yodec::Emitter::document_end() {
  yaml_event_t event;
  if ( !yaml_document_end_event_initialize(&event, 1) ) {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

inline void yodec::Emitter::scalar( const std::string& tag,
  std::string_view value, yaml_scalar_style_t style )
{
  // Without a tag the scalar's style alone carries its type
  internal::check_utf8( tag, "tag" );
  internal::check_utf8( value, "scalar" );
  const int implicit = tag.empty() ? 1 : 0;
  yaml_event_t event;
  if ( !yaml_scalar_event_initialize(&event, nullptr, internal::yaml_chars(tag),
    reinterpret_cast< const yaml_char_t* >( value.empty() ? "" : value.data() ),
    static_cast< int >( value.size() ), implicit, implicit, style) )
  {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

inline void yodec::Emitter::sequence_start( const std::string& tag,
  yaml_sequence_style_t style )
{
  internal::check_utf8( tag, "tag" );
  yaml_event_t event;
  if ( !yaml_sequence_start_event_initialize(&event, nullptr,
    internal::yaml_chars(tag), tag.empty() ? 1 : 0, style) )
  {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

inline void yodec::Emitter::sequence_end() {
  yaml_event_t event;
  if ( !yaml_sequence_end_event_initialize(&event) ) {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

inline void yodec::Emitter::mapping_start( const std::string& tag,
  yaml_mapping_style_t style )
{
  internal::check_utf8( tag, "tag" );
  yaml_event_t event;
  if ( !yaml_mapping_start_event_initialize(&event, nullptr,
    internal::yaml_chars(tag), tag.empty() ? 1 : 0, style) )
  {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

inline void yodec::Emitter::mapping_end() {
  yaml_event_t event;
  if ( !yaml_mapping_end_event_initialize(&event) ) {
    this->fail( "failed to create YAML event" );
  }
  this->emit( event );
}

// EventSerializer

inline yodec::EventSerializer::EventSerializer( std::string& out,
  const PrettyPolicy& policy ) : policy_( policy ),
  emitter_( out, policy.indent_width )
{
  emitter_.stream_start();
}

inline void yodec::EventSerializer::finish() {
  if ( !stack_.empty() || pending_ || !tag_.empty() ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "stream ended inside an unfinished value" );
  }
  if ( finished_ ) return;
  emitter_.stream_end();
  finished_ = true;
}

inline yaml_sequence_style_t yodec::EventSerializer::sequence_style(
  bool empty ) const
{
  if ( policy_.container_style == ContainerStyle::Flow
    || ( empty && policy_.prefer_flow_for_empty ) )
  {
    return YAML_FLOW_SEQUENCE_STYLE;
  }
  return YAML_BLOCK_SEQUENCE_STYLE;
}

inline yaml_mapping_style_t yodec::EventSerializer::mapping_style(
  bool empty ) const
{
  if ( policy_.container_style == ContainerStyle::Flow
    || ( empty && policy_.prefer_flow_for_empty ) )
  {
    return YAML_FLOW_MAPPING_STYLE;
  }
  return YAML_BLOCK_MAPPING_STYLE;
}

inline std::string yodec::EventSerializer::take_tag() {
  std::string tag;
  tag.swap( tag_ );
  return tag;
}

inline void yodec::EventSerializer::flush_pending( bool empty ) {
  if ( !pending_ ) return;
  PendingStart p = std::move( *pending_ );
  pending_.reset();
  if ( p.mapping ) emitter_.mapping_start( p.tag, this->mapping_style(empty) );
  else emitter_.sequence_start( p.tag, this->sequence_style(empty) );
}

// Called before any node is written
inline void yodec::EventSerializer::begin_node() {
  if ( finished_ ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "value serialized after the end of the stream" );
  }
  this->flush_pending( false );
  if ( !in_document_ ) {
    emitter_.document_start();
    in_document_ = true;
  }
}

// Called after a complete node has been written
inline void yodec::EventSerializer::end_node() {
  if ( stack_.empty() ) {
    emitter_.document_end();
    in_document_ = false;
    return;
  }
  Frame& top = stack_.back();
  ++top.items;
  if ( top.kind == FrameKind::Variant && top.items > 1 ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "more than one value inside an enum variant" );
  }
  if ( top.kind == FrameKind::Tagged && top.items > 1 ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "more than one value inside a tagged value" );
  }
}

inline void yodec::EventSerializer::plain_scalar( const std::string& text ) {
  this->begin_node();
  emitter_.scalar( this->take_tag(), text, YAML_PLAIN_SCALAR_STYLE );
  this->end_node();
}

inline void yodec::EventSerializer::string_scalar( std::string_view text ) {
  this->begin_node();
  const QuoteStyle style = select_quote_style( policy_, text );
  emitter_.scalar( this->take_tag(), text, internal::to_yaml_style(style) );
  this->end_node();
}

inline void yodec::EventSerializer::serialize_null() {
  this->plain_scalar( "null" );
}

inline void yodec::EventSerializer::serialize_bool( bool v ) {
  this->plain_scalar( v ? "true" : "false" );
}

inline void yodec::EventSerializer::serialize_i64( std::int64_t v ) {
  this->plain_scalar( Number(v).to_string() );
}

inline void yodec::EventSerializer::serialize_u64( std::uint64_t v ) {
  this->plain_scalar( Number(v).to_string() );
}

inline void yodec::EventSerializer::serialize_f64( double v ) {
  this->plain_scalar( Number(v).to_string() );
}

inline void yodec::EventSerializer::serialize_number( const Number& n ) {
  this->plain_scalar( n.to_string() );
}

inline void yodec::EventSerializer::serialize_str( std::string_view v ) {
  this->string_scalar( v );
}

inline void yodec::EventSerializer::begin_seq( std::optional< std::size_t > ) {
  this->begin_node();
  pending_ = PendingStart{ false, this->take_tag() };
  stack_.push_back( Frame{ FrameKind::Seq } );
}

inline void yodec::EventSerializer::begin_map( std::optional< std::size_t > ) {
  this->begin_node();
  pending_ = PendingStart{ true, this->take_tag() };
  stack_.push_back( Frame{ FrameKind::Map } );
}

inline void yodec::EventSerializer::close( FrameKind kind, const char* what ) {
  if ( stack_.empty() || stack_.back().kind != kind ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      std::string( "unbalanced call: end of " ) + what + " without a start" );
  }
}

inline void yodec::EventSerializer::end_seq() {
  this->close( FrameKind::Seq, "sequence" );
  this->flush_pending( true );
  emitter_.sequence_end();
  stack_.pop_back();
  this->end_node();
}

inline void yodec::EventSerializer::end_map() {
  this->close( FrameKind::Map, "mapping" );
  if ( stack_.back().items % 2 != 0 ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "mapping ended after a key without a value" );
  }
  this->flush_pending( true );
  emitter_.mapping_end();
  stack_.pop_back();
  this->end_node();
}

inline void yodec::EventSerializer::serialize_unit_variant(
  std::string_view variant )
{
  this->string_scalar( variant );
}

// Variant: payload is written as a one-entry mapping
inline void yodec::EventSerializer::begin_variant( std::string_view variant ) {
  this->begin_node();
  emitter_.mapping_start( this->take_tag(), this->mapping_style(false) );
  const QuoteStyle style = select_quote_style( policy_, variant );
  emitter_.scalar( "", variant, internal::to_yaml_style(style) );
  stack_.push_back( Frame{ FrameKind::Variant } );
}

inline void yodec::EventSerializer::end_variant() {
  this->close( FrameKind::Variant, "variant" );
  if ( stack_.back().items != 1 ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "enum variant ended without a value" );
  }
  emitter_.mapping_end();
  stack_.pop_back();
  this->end_node();
}

inline void yodec::EventSerializer::begin_tagged( std::string_view tag ) {
  if ( tag.empty() ) {
    internal::throw_error( ErrorKind::InvalidTag,
      "empty YAML tag is not allowed" );
  }
  if ( !tag_.empty() ) {
    internal::throw_error( ErrorKind::InvalidTag, "tag " + std::string(tag)
      + " applied to the already tagged value " + tag_ );
  }
  tag_ = std::string( tag );
  stack_.push_back( Frame{ FrameKind::Tagged } );
}

inline void yodec::EventSerializer::end_tagged() {
  this->close( FrameKind::Tagged, "tagged value" );
  if ( stack_.back().items != 1 ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "tagged value ended without a value" );
  }
  stack_.pop_back();
  this->end_node();
}
