// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// libyaml event-based YAML parser
// https://github.com/yaml/libyaml
#include <yaml.h>

#include "error.hh"

namespace yodec {

  enum class EventType {
    Alias, Scalar, SequenceStart, SequenceEnd, MappingStart, MappingEnd
  };

  enum class ScalarStyle { Plain, SingleQuoted, DoubleQuoted, Literal, Folded };

  // One node event of a document, copied out of libyaml
  struct Event {
    EventType type = EventType::Scalar;
    Mark mark;
    std::string anchor; // anchor declared on this node, if any
    std::string tag; // tag as reported by the scanner, shorthands expanded
    std::string value; // scalar text, or the anchor name of an alias
    ScalarStyle style = ScalarStyle::Plain;
    std::size_t end = 0; // index past the last event of this node
    std::size_t target = 0; // aliases only: start of the aliased node
  };

  struct Document {
    std::vector< Event > events;
    Mark start;
  };

  // Anchor id -> position of the completed node in the document's event
  // buffer. Scoped to a single document.
  class AnchorTable {
  public:

    inline void bind( const std::string& id, std::size_t pos ) {
      bindings_[ id ] = pos;
    }

    // Drop a binding while a node declaring the same id is still open
    inline void unbind( const std::string& id ) { bindings_.erase( id ); }

    inline std::optional< std::size_t > resolve( const std::string& id ) const {
      auto it = bindings_.find( id );
      if ( it == bindings_.end() ) return std::nullopt;
      return it->second;
    }

    inline void clear() { bindings_.clear(); }
    inline std::size_t size() const { return bindings_.size(); }

  private:

    std::unordered_map< std::string, std::size_t > bindings_;
  };

  // Reads a YAML stream one document at a time, resolving every alias to
  // the position of its anchored node
  class Loader {
  public:

    explicit Loader( std::string_view input );
    ~Loader();

    Loader( const Loader& ) = delete;
    Loader& operator=( const Loader& ) = delete;

    // Next document of the stream, or nothing once the stream has ended
    std::optional< Document > next_document();

  private:

    // Owns one libyaml event
    struct ParsedEvent {
      yaml_event_t event{};
      ~ParsedEvent() { yaml_event_delete( &event ); }
    };

    void parse( ParsedEvent& out );
    [[noreturn]] void syntax_error();

    yaml_parser_t parser_;
    std::string input_;
    bool stream_started_ = false;
    bool stream_ended_ = false;
  };

namespace internal {

  inline Mark to_mark( const yaml_mark_t& m ) {
    return Mark{ m.index, m.line, m.column };
  }

  // Position of a byte offset into the input. Columns count characters,
  // as libyaml's marks do.
  inline Mark mark_at_offset( std::string_view input, std::size_t offset ) {
    Mark m;
    m.index = offset;
    if ( offset > input.size() ) offset = input.size();
    for ( std::size_t i = 0; i < offset; ++i ) {
      const unsigned char c = input[ i ];
      if ( c == '\n' ) {
        ++m.line;
        m.column = 0;
      }
      else if ( ( c & 0xC0 ) != 0x80 ) {
        ++m.column;
      }
    }
    return m;
  }

  inline std::string to_string( const yaml_char_t* s ) {
    if ( !s ) return std::string();
    return std::string( reinterpret_cast< const char* >( s ) );
  }

  inline ScalarStyle to_scalar_style( yaml_scalar_style_t style ) {
    switch ( style ) {
      case YAML_SINGLE_QUOTED_SCALAR_STYLE: return ScalarStyle::SingleQuoted;
      case YAML_DOUBLE_QUOTED_SCALAR_STYLE: return ScalarStyle::DoubleQuoted;
      case YAML_LITERAL_SCALAR_STYLE: return ScalarStyle::Literal;
      case YAML_FOLDED_SCALAR_STYLE: return ScalarStyle::Folded;
      default: return ScalarStyle::Plain;
    }
  }

} // namespace yodec::internal

} // namespace yodec

inline yodec::Loader::Loader( std::string_view input ) : input_( input ) {
  if ( !yaml_parser_initialize(&parser_) ) {
    internal::throw_error( ErrorKind::Syntax,
      "failed to initialize the YAML parser" );
  }
  yaml_parser_set_input_string( &parser_,
    reinterpret_cast< const unsigned char* >( input_.data() ), input_.size() );
}

inline yodec::Loader::~Loader() {
  yaml_parser_delete( &parser_ );
}

inline void yodec::Loader::parse( ParsedEvent& out ) {
  if ( !yaml_parser_parse(&parser_, &out.event) ) {
    // Nothing was allocated on failure
    out.event.type = YAML_NO_EVENT;
    this->syntax_error();
  }
}

[[noreturn]] inline void yodec::Loader::syntax_error() {
  std::ostringstream oss;
  oss << ( parser_.problem ? parser_.problem : "unknown YAML syntax error" );
  if ( parser_.context ) {
    oss << ", " << parser_.context << " at line "
      << parser_.context_mark.line + 1 << " column "
      << parser_.context_mark.column + 1;
  }
  // Reader errors (bad encoding, forbidden characters) carry a byte offset
  // instead of a mark
  if ( parser_.error == YAML_READER_ERROR ) {
    if ( parser_.problem_value != -1 ) {
      oss << " (byte 0x" << std::hex << parser_.problem_value << ')';
    }
    internal::throw_error( ErrorKind::Syntax, oss.str(),
      internal::mark_at_offset( input_, parser_.problem_offset ) );
  }
  internal::throw_error( ErrorKind::Syntax, oss.str(),
    internal::to_mark( parser_.problem_mark ) );
}

inline std::optional< yodec::Document > yodec::Loader::next_document() {
  if ( stream_ended_ ) return std::nullopt;

  if ( !stream_started_ ) {
    ParsedEvent first;
    this->parse( first );
    if ( first.event.type != YAML_STREAM_START_EVENT ) {
      internal::throw_error( ErrorKind::UnexpectedEvent,
        "expected the start of the YAML stream",
        internal::to_mark( first.event.start_mark ) );
    }
    stream_started_ = true;
  }

  ParsedEvent start;
  this->parse( start );
  if ( start.event.type == YAML_STREAM_END_EVENT ) {
    stream_ended_ = true;
    return std::nullopt;
  }
  if ( start.event.type != YAML_DOCUMENT_START_EVENT ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "expected the start of a YAML document",
      internal::to_mark( start.event.start_mark ) );
  }

  Document doc;
  doc.start = internal::to_mark( start.event.start_mark );

  AnchorTable anchors;
  // Positions of the collections not yet closed
  std::vector< std::size_t > open;

  auto complete = [&]( std::size_t pos ) {
    Event& e = doc.events[ pos ];
    e.end = doc.events.size();
    if ( !e.anchor.empty() ) anchors.bind( e.anchor, pos );
  };

  while ( true ) {
    ParsedEvent pe;
    this->parse( pe );
    const yaml_event_t& ev = pe.event;

    if ( ev.type == YAML_DOCUMENT_END_EVENT ) break;

    Event e;
    e.mark = internal::to_mark( ev.start_mark );
    const std::size_t pos = doc.events.size();

    switch ( ev.type ) {
      case YAML_ALIAS_EVENT: {
        e.type = EventType::Alias;
        e.value = internal::to_string( ev.data.alias.anchor );
        auto target = anchors.resolve( e.value );
        if ( !target ) {
          internal::throw_error( ErrorKind::UnknownAnchor,
            "unknown anchor '" + e.value + '\'', e.mark );
        }
        e.target = *target;
        doc.events.push_back( std::move(e) );
        doc.events.back().end = pos + 1;
        break;
      }
      case YAML_SCALAR_EVENT:
        e.type = EventType::Scalar;
        e.anchor = internal::to_string( ev.data.scalar.anchor );
        e.tag = internal::to_string( ev.data.scalar.tag );
        e.value.assign( reinterpret_cast< const char* >( ev.data.scalar.value ),
          ev.data.scalar.length );
        e.style = internal::to_scalar_style( ev.data.scalar.style );
        doc.events.push_back( std::move(e) );
        complete( pos );
        break;
      case YAML_SEQUENCE_START_EVENT:
        e.type = EventType::SequenceStart;
        e.anchor = internal::to_string( ev.data.sequence_start.anchor );
        e.tag = internal::to_string( ev.data.sequence_start.tag );
        if ( !e.anchor.empty() ) anchors.unbind( e.anchor );
        doc.events.push_back( std::move(e) );
        open.push_back( pos );
        break;
      case YAML_MAPPING_START_EVENT:
        e.type = EventType::MappingStart;
        e.anchor = internal::to_string( ev.data.mapping_start.anchor );
        e.tag = internal::to_string( ev.data.mapping_start.tag );
        if ( !e.anchor.empty() ) anchors.unbind( e.anchor );
        doc.events.push_back( std::move(e) );
        open.push_back( pos );
        break;
      case YAML_SEQUENCE_END_EVENT:
      case YAML_MAPPING_END_EVENT:
        e.type = ( ev.type == YAML_SEQUENCE_END_EVENT )
          ? EventType::SequenceEnd : EventType::MappingEnd;
        doc.events.push_back( std::move(e) );
        if ( open.empty() ) {
          internal::throw_error( ErrorKind::UnexpectedEvent,
            "unbalanced end of collection", doc.events.back().mark );
        }
        complete( open.back() );
        open.pop_back();
        break;
      default:
        internal::throw_error( ErrorKind::UnexpectedEvent,
          "unexpected event inside a YAML document", e.mark );
    }
  }

  return doc;
}
