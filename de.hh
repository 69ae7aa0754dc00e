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
#include <utility>
#include <vector>

#include "datamodel.hh"
#include "error.hh"
#include "loader.hh"
#include "scalar.hh"
#include "value_serde.hh"

namespace yodec {

  // Nesting ceiling for sequences, mappings and alias expansions
  inline constexpr int DEFAULT_RECURSION_LIMIT = 128;

  // Alias replays allowed per document event
  inline constexpr std::size_t REPETITION_FACTOR = 100;

  // Location of a node below the document root, e.g. servers[1].port
  struct Path {
    enum class Kind { Root, Seq, Map };

    Kind kind = Kind::Root;
    const Path* parent = nullptr;
    std::size_t index = 0;
    std::string key;

    std::string to_string() const;
  };

  // Budgets shared by all deserializers of one document
  struct DocumentState {
    const Document& doc;
    std::size_t jumps_left;
  };

  // Walks the event buffer of one document and drives visitors
  class EventDeserializer : public Deserializer {
  public:

    EventDeserializer( DocumentState& state, std::size_t pos, int depth,
      Path path, bool ignore_tag = false );

    void deserialize_any( Visitor& v ) override;
    void deserialize_string( Visitor& v ) override;
    void deserialize_integer( Visitor& v ) override;
    void deserialize_enum( Visitor& v ) override;
    void deserialize_ignored() override {}
    bool is_null() override;

    inline const Path& path() const { return path_; }

  private:

    // Position of the node after alias expansion and the depth left there
    struct Resolved {
      std::size_t pos;
      int depth;
    };

    Resolved resolve();
    Resolved follow( std::size_t pos, int depth );
    std::size_t peek() const;

    const Event& event( std::size_t pos ) const {
      return state_.doc.events[ pos ];
    }

    // Runs fn, attaching this node's position to errors that have none
    template < typename F > void located( F&& fn );

    void visit_any( Visitor& v );
    void visit_scalar( const Event& e, Visitor& v );
    void visit_tagged( std::size_t pos, int depth, Visitor& v );
    [[noreturn]] void fail( ErrorKind kind, const std::string& msg,
      std::size_t pos ) const;

    DocumentState& state_;
    std::size_t pos_;
    int depth_;
    Path path_;
    bool ignore_tag_;
  };

namespace internal {

  inline bool is_merge_key( const Event& e );

  // Key of a planned mapping entry, its value and the depth left for both
  struct PlannedEntry {
    std::size_t key_pos;
    std::size_t value_pos;
    int depth;
    std::string key_text;
  };

  class EventSeqAccess : public SeqAccess {
  public:
    EventSeqAccess( DocumentState& state, std::size_t start, int depth,
      const Path& parent ) : state_( state ), cursor_( start + 1 ),
      last_( state.doc.events[ start ].end - 1 ), depth_( depth ),
      parent_( parent ) {}

    Deserializer* next_element() override {
      if ( cursor_ >= last_ ) return nullptr;
      Path p{ Path::Kind::Seq, &parent_, index_++, std::string() };
      current_.emplace( state_, cursor_, depth_, std::move(p) );
      cursor_ = state_.doc.events[ cursor_ ].end;
      return &*current_;
    }

  private:
    DocumentState& state_;
    std::size_t cursor_;
    std::size_t last_;
    int depth_;
    const Path& parent_;
    std::size_t index_ = 0;
    std::optional< EventDeserializer > current_;
  };

  class EventMapAccess : public MapAccess {
  public:
    EventMapAccess( DocumentState& state, std::vector< PlannedEntry > entries,
      const Path& parent ) : state_( state ), entries_( std::move(entries) ),
      parent_( parent ) {}

    Deserializer* next_key() override {
      if ( next_ >= entries_.size() ) return nullptr;
      const PlannedEntry& e = entries_[ next_ ];
      key_.emplace( state_, e.key_pos, e.depth, parent_ );
      return &*key_;
    }

    Deserializer& next_value() override {
      const PlannedEntry& e = entries_[ next_++ ];
      Path p{ Path::Kind::Map, &parent_, 0, e.key_text };
      value_.emplace( state_, e.value_pos, e.depth, std::move(p) );
      return *value_;
    }

    std::optional< std::size_t > size_hint() const override {
      return entries_.size() - next_;
    }

  private:
    DocumentState& state_;
    std::vector< PlannedEntry > entries_;
    const Path& parent_;
    std::size_t next_ = 0;
    std::optional< EventDeserializer > key_;
    std::optional< EventDeserializer > value_;
  };

  class EventEnumAccess : public EnumAccess {
  public:
    EventEnumAccess( std::string variant, std::string tag )
      : variant_( std::move(variant) ), tag_( std::move(tag) ) {}

    const std::string& variant() const override { return variant_; }
    const std::string& tag() const override { return tag_; }
    Deserializer* payload() override {
      return payload_ ? &*payload_ : nullptr;
    }

    std::optional< EventDeserializer > payload_;

  private:
    std::string variant_;
    std::string tag_;
  };

  // Orders the entries of one mapping: explicit keys in document order,
  // then keys spliced in by merge keys that are not already present.
  // Structurally equal explicit keys are rejected.
  class MappingPlanner {
  public:
    MappingPlanner( DocumentState& state, const Path& path )
      : state_( state ), path_( path ) {}

    std::vector< PlannedEntry > plan( std::size_t start, int depth );

  private:

    struct Collected {
      std::vector< PlannedEntry > explicit_entries;
      std::vector< std::pair< std::size_t, int > > merges; // value pos, depth
    };

    Collected collect( std::size_t start, int depth );
    void merge_mapping( std::size_t start, int depth,
      std::vector< PlannedEntry >& out, Mapping& seen );
    void merge_value( std::size_t pos, int depth,
      std::vector< PlannedEntry >& out, Mapping& seen );
    std::pair< std::size_t, int > follow( std::size_t pos, int depth );
    Value key_value( const PlannedEntry& entry );

    [[noreturn]] void fail( ErrorKind kind, const std::string& msg,
      std::size_t pos ) const
    {
      throw_error( kind, msg, state_.doc.events[ pos ].mark,
        path_.to_string() );
    }

    DocumentState& state_;
    const Path& path_;
  };

  // Deserializes one loaded document into T
  template < typename T >
  T deserialize_document( const Document& doc, int recursion_limit ) {
    DocumentState state{ doc, doc.events.size() * REPETITION_FACTOR };
    EventDeserializer de( state, 0, recursion_limit, Path() );
    T t{};
    data_converter< T >::deserialize( de, t );
    return t;
  }

} // namespace yodec::internal

} // namespace yodec

// Path

inline std::string yodec::Path::to_string() const {
  std::vector< const Path* > chain;
  for ( const Path* p = this; p; p = p->parent ) chain.push_back( p );

  std::string out;
  for ( auto it = chain.rbegin(); it != chain.rend(); ++it ) {
    const Path& p = **it;
    if ( p.kind == Kind::Seq ) {
      out += '[' + std::to_string( p.index ) + ']';
    }
    else if ( p.kind == Kind::Map ) {
      if ( !out.empty() ) out += '.';
      out += p.key;
    }
  }
  return out;
}

// EventDeserializer

inline yodec::EventDeserializer::EventDeserializer( DocumentState& state,
  std::size_t pos, int depth, Path path, bool ignore_tag ) : state_( state ),
  pos_( pos ), depth_( depth ), path_( std::move(path) ),
  ignore_tag_( ignore_tag )
{
}

[[noreturn]] inline void yodec::EventDeserializer::fail( ErrorKind kind,
  const std::string& msg, std::size_t pos ) const
{
  internal::throw_error( kind, msg, this->event( pos ).mark,
    path_.to_string() );
}

inline yodec::EventDeserializer::Resolved yodec::EventDeserializer::follow(
  std::size_t pos, int depth )
{
  while ( this->event(pos).type == EventType::Alias ) {
    if ( depth <= 0 ) {
      this->fail( ErrorKind::RecursionLimitExceeded, "recursion limit exceeded",
        pos );
    }
    if ( state_.jumps_left == 0 ) {
      this->fail( ErrorKind::RepetitionLimitExceeded,
        "repetition limit exceeded", pos );
    }
    --state_.jumps_left;
    --depth;
    pos = this->event( pos ).target;
  }
  return Resolved{ pos, depth };
}

inline yodec::EventDeserializer::Resolved yodec::EventDeserializer::resolve() {
  return this->follow( pos_, depth_ );
}

inline std::size_t yodec::EventDeserializer::peek() const {
  std::size_t pos = pos_;
  while ( this->event(pos).type == EventType::Alias ) {
    pos = this->event( pos ).target;
  }
  return pos;
}

template < typename F >
void yodec::EventDeserializer::located( F&& fn ) {
  try {
    fn();
  }
  catch ( const Error& err ) {
    throw err.located( this->event( pos_ ).mark, path_.to_string() );
  }
}

inline bool yodec::EventDeserializer::is_null() {
  const Event& e = this->event( this->peek() );
  if ( e.type != EventType::Scalar ) return false;
  const CoreTag tag = ignore_tag_ ? CoreTag::Absent : classify_tag( e.tag );
  if ( tag == CoreTag::Null ) return true;
  return tag == CoreTag::Absent && e.style == ScalarStyle::Plain
    && is_null_literal( e.value );
}

inline void yodec::EventDeserializer::deserialize_any( Visitor& v ) {
  this->located( [&]() { this->visit_any( v ); } );
}

inline void yodec::EventDeserializer::visit_any( Visitor& v ) {
  const Resolved r = this->resolve();
  const Event& e = this->event( r.pos );

  const CoreTag tag = ignore_tag_ ? CoreTag::Absent : classify_tag( e.tag );
  if ( tag == CoreTag::Custom ) {
    this->visit_tagged( r.pos, r.depth, v );
    return;
  }

  switch ( e.type ) {
    case EventType::Scalar:
      this->visit_scalar( e, v );
      return;

    case EventType::SequenceStart: {
      if ( tag != CoreTag::Absent && tag != CoreTag::NonSpecific
        && tag != CoreTag::Seq )
      {
        this->fail( ErrorKind::InvalidTag, "invalid tag " + e.tag
          + " on a sequence", r.pos );
      }
      if ( r.depth <= 0 ) {
        this->fail( ErrorKind::RecursionLimitExceeded,
          "recursion limit exceeded", r.pos );
      }
      internal::EventSeqAccess seq( state_, r.pos, r.depth - 1, path_ );
      v.visit_seq( seq );
      return;
    }

    case EventType::MappingStart: {
      if ( tag != CoreTag::Absent && tag != CoreTag::NonSpecific
        && tag != CoreTag::Map )
      {
        this->fail( ErrorKind::InvalidTag, "invalid tag " + e.tag
          + " on a mapping", r.pos );
      }
      if ( r.depth <= 0 ) {
        this->fail( ErrorKind::RecursionLimitExceeded,
          "recursion limit exceeded", r.pos );
      }
      internal::MappingPlanner planner( state_, path_ );
      internal::EventMapAccess map( state_, planner.plan(r.pos, r.depth - 1),
        path_ );
      v.visit_map( map );
      return;
    }

    default:
      this->fail( ErrorKind::UnexpectedEvent, "unexpected end of collection",
        r.pos );
  }
}

inline void yodec::EventDeserializer::visit_scalar( const Event& e,
  Visitor& v )
{
  const CoreTag tag = ignore_tag_ ? CoreTag::Absent : classify_tag( e.tag );

  ResolvedScalar scalar;
  if ( tag == CoreTag::Absent ) {
    // Quoted and block scalars are always strings
    if ( e.style == ScalarStyle::Plain ) scalar = resolve_plain( e.value );
  }
  else if ( is_scalar_tag(tag) || tag == CoreTag::NonSpecific ) {
    auto narrowed = resolve_tagged( e.value, tag );
    if ( !narrowed ) {
      internal::throw_error( ErrorKind::InvalidTag, "invalid value for tag "
        + e.tag + ": " + e.value, e.mark, path_.to_string() );
    }
    scalar = *narrowed;
  }
  else if ( tag == CoreTag::Seq || tag == CoreTag::Map ) {
    internal::throw_error( ErrorKind::InvalidTag, "invalid tag " + e.tag
      + " on a scalar", e.mark, path_.to_string() );
  }
  // !!merge outside key position reads as its text

  switch ( scalar.kind ) {
    case ScalarKind::Null: v.visit_null(); break;
    case ScalarKind::Bool: v.visit_bool( scalar.boolean ); break;
    case ScalarKind::Number: v.visit_number( scalar.number ); break;
    case ScalarKind::String: v.visit_str( e.value ); break;
  }
}

// A node carrying a tag outside the core schema is an enum variant named
// by the tag, whose payload is the node itself
inline void yodec::EventDeserializer::visit_tagged( std::size_t pos, int depth,
  Visitor& v )
{
  const Event& e = this->event( pos );
  internal::EventEnumAccess access( internal::variant_from_tag(e.tag), e.tag );
  access.payload_.emplace( state_, pos, depth, path_, true );
  v.visit_enum( access );
}

inline void yodec::EventDeserializer::deserialize_string( Visitor& v ) {
  this->located( [&]() {
    const std::size_t pos = this->peek();
    const Event& e = this->event( pos );
    const CoreTag tag = ignore_tag_ ? CoreTag::Absent : classify_tag( e.tag );
    if ( e.type == EventType::Scalar && tag != CoreTag::Custom ) {
      this->resolve();
      v.visit_str( e.value );
    }
    else {
      this->visit_any( v );
    }
  } );
}

inline void yodec::EventDeserializer::deserialize_integer( Visitor& v ) {
  this->located( [&]() {
    const Event& e = this->event( this->peek() );
    const CoreTag tag = ignore_tag_ ? CoreTag::Absent : classify_tag( e.tag );
    const bool plain = ( tag == CoreTag::Absent
      && e.style == ScalarStyle::Plain ) || tag == CoreTag::Int;
    if ( e.type == EventType::Scalar && plain ) {
      auto n = Number::parse( e.value );
      if ( n && n->looks_integral() ) {
        internal::throw_error( ErrorKind::NumberOverflow,
          "number too large to fit in target type: " + e.value, e.mark,
          path_.to_string() );
      }
    }
    this->visit_any( v );
  } );
}

inline void yodec::EventDeserializer::deserialize_enum( Visitor& v ) {
  this->located( [&]() {
    const Resolved r = this->resolve();
    const Event& e = this->event( r.pos );
    const CoreTag tag = ignore_tag_ ? CoreTag::Absent : classify_tag( e.tag );

    if ( tag == CoreTag::Custom ) {
      this->visit_tagged( r.pos, r.depth, v );
      return;
    }

    if ( e.type == EventType::Scalar ) {
      internal::EventEnumAccess access( e.value, "" );
      v.visit_enum( access );
      return;
    }

    if ( e.type == EventType::MappingStart ) {
      // { Variant: payload } with exactly one entry
      const std::size_t key_pos = r.pos + 1;
      const std::size_t last = e.end - 1;
      if ( key_pos < last ) {
        const std::size_t value_pos = this->event( key_pos ).end;
        const std::size_t key_target = this->follow( key_pos, r.depth ).pos;
        const Event& key = this->event( key_target );
        if ( this->event( value_pos ).end == last
          && key.type == EventType::Scalar )
        {
          if ( r.depth <= 0 ) {
            this->fail( ErrorKind::RecursionLimitExceeded,
              "recursion limit exceeded", r.pos );
          }
          internal::EventEnumAccess access( key.value, "" );
          Path p{ Path::Kind::Map, &path_, 0, key.value };
          access.payload_.emplace( state_, value_pos, r.depth - 1,
            std::move(p) );
          v.visit_enum( access );
          return;
        }
      }
    }

    this->fail( ErrorKind::InvalidType, std::string( "invalid type: " )
      + ( e.type == EventType::MappingStart ? "map" : "sequence" )
      + ", expected " + v.expecting(), r.pos );
  } );
}

// MappingPlanner

inline bool yodec::internal::is_merge_key( const Event& e ) {
  if ( e.type != EventType::Scalar ) return false;
  const CoreTag tag = classify_tag( e.tag );
  if ( tag == CoreTag::Merge ) return true;
  return tag == CoreTag::Absent && e.style == ScalarStyle::Plain
    && e.value == MERGE_KEY;
}

inline std::pair< std::size_t, int > yodec::internal::MappingPlanner::follow(
  std::size_t pos, int depth )
{
  const auto& events = state_.doc.events;
  while ( events[ pos ].type == EventType::Alias ) {
    if ( depth <= 0 ) {
      this->fail( ErrorKind::RecursionLimitExceeded, "recursion limit exceeded",
        pos );
    }
    if ( state_.jumps_left == 0 ) {
      this->fail( ErrorKind::RepetitionLimitExceeded,
        "repetition limit exceeded", pos );
    }
    --state_.jumps_left;
    --depth;
    pos = events[ pos ].target;
  }
  return { pos, depth };
}

inline yodec::Value yodec::internal::MappingPlanner::key_value(
  const PlannedEntry& entry )
{
  EventDeserializer de( state_, entry.key_pos, entry.depth, path_ );
  Value key;
  data_converter< Value >::deserialize( de, key );
  return key;
}

inline yodec::internal::MappingPlanner::Collected
  yodec::internal::MappingPlanner::collect( std::size_t start, int depth )
{
  const auto& events = state_.doc.events;
  Collected c;
  const std::size_t last = events[ start ].end - 1;
  std::size_t pos = start + 1;
  while ( pos < last ) {
    const std::size_t value_pos = events[ pos ].end;
    const Event& key = events[ pos ];
    if ( is_merge_key(key) ) {
      c.merges.emplace_back( value_pos, depth );
    }
    else {
      std::string text;
      const std::size_t target = this->follow( pos, depth ).first;
      if ( events[ target ].type == EventType::Scalar ) {
        text = events[ target ].value;
      }
      else {
        text = "?";
      }
      c.explicit_entries.push_back( PlannedEntry{ pos, value_pos, depth,
        std::move(text) } );
    }
    pos = events[ value_pos ].end;
  }
  return c;
}

inline std::vector< yodec::internal::PlannedEntry >
  yodec::internal::MappingPlanner::plan( std::size_t start, int depth )
{
  Collected c = this->collect( start, depth );

  Mapping seen;
  for ( const auto& entry : c.explicit_entries ) {
    Value key = this->key_value( entry );
    if ( !seen.try_insert( key, Value() ) ) {
      std::ostringstream oss;
      oss << "duplicate entry with key " << key;
      this->fail( ErrorKind::DuplicateMapKey, oss.str(), entry.key_pos );
    }
  }

  std::vector< PlannedEntry > out = std::move( c.explicit_entries );
  for ( const auto& [value_pos, d] : c.merges ) {
    this->merge_value( value_pos, d, out, seen );
  }
  return out;
}

// Value of a merge key: a mapping, or a sequence of mappings where earlier
// mappings take precedence
inline void yodec::internal::MappingPlanner::merge_value( std::size_t pos,
  int depth, std::vector< PlannedEntry >& out, Mapping& seen )
{
  const auto& events = state_.doc.events;
  auto [target, d] = this->follow( pos, depth );
  const Event& e = events[ target ];
  const CoreTag tag = classify_tag( e.tag );

  if ( tag == CoreTag::Custom ) {
    this->fail( ErrorKind::InvalidTag, "unexpected tagged value in merge",
      target );
  }
  if ( e.type == EventType::MappingStart ) {
    this->merge_mapping( target, d, out, seen );
    return;
  }
  if ( e.type != EventType::SequenceStart ) {
    this->fail( ErrorKind::UnexpectedEvent,
      "expected a mapping or list of mappings for merging, but found scalar",
      target );
  }
  if ( d <= 0 ) {
    this->fail( ErrorKind::RecursionLimitExceeded, "recursion limit exceeded",
      target );
  }

  const std::size_t last = e.end - 1;
  for ( std::size_t p = target + 1; p < last; p = events[ p ].end ) {
    auto [element, ed] = this->follow( p, d - 1 );
    const Event& el = events[ element ];
    if ( classify_tag(el.tag) == CoreTag::Custom ) {
      this->fail( ErrorKind::InvalidTag, "unexpected tagged value in merge",
        element );
    }
    if ( el.type != EventType::MappingStart ) {
      this->fail( ErrorKind::UnexpectedEvent, std::string( "expected a mapping "
        "for merging, but found " ) + ( el.type == EventType::Scalar
          ? "scalar" : "sequence" ), element );
    }
    this->merge_mapping( element, ed, out, seen );
  }
}

// Splices the entries of a merged mapping, its own merges expanded, into
// out. Keys already present win.
inline void yodec::internal::MappingPlanner::merge_mapping( std::size_t start,
  int depth, std::vector< PlannedEntry >& out, Mapping& seen )
{
  if ( depth <= 0 ) {
    this->fail( ErrorKind::RecursionLimitExceeded, "recursion limit exceeded",
      start );
  }

  Collected c = this->collect( start, depth - 1 );
  std::vector< PlannedEntry > local = std::move( c.explicit_entries );
  Mapping local_seen;
  for ( const auto& entry : local ) {
    Value key = this->key_value( entry );
    if ( !local_seen.try_insert( key, Value() ) ) {
      std::ostringstream oss;
      oss << "duplicate entry with key " << key;
      this->fail( ErrorKind::DuplicateMapKey, oss.str(), entry.key_pos );
    }
  }
  for ( const auto& [value_pos, d] : c.merges ) {
    this->merge_value( value_pos, d, local, local_seen );
  }

  for ( auto& entry : local ) {
    Value key = this->key_value( entry );
    if ( seen.try_insert( std::move(key), Value() ) ) {
      out.push_back( std::move(entry) );
    }
  }
}
