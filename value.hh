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
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "error.hh"
#include "number.hh"
#include "scalar.hh"

namespace yodec {

  class Value;

namespace internal {

  // Integer types other than std::size_t (and bool) used as sequence
  // indices, so that v[0] is not ambiguous with v[const char*]
  template < typename I >
  using enable_if_index = typename std::enable_if< std::is_integral< I >::value
    && !std::is_same< I, bool >::value
    && !std::is_same< I, std::size_t >::value, int >::type;

  template < typename I >
  inline std::optional< std::size_t > to_index( I index ) {
    if constexpr ( std::is_signed< I >::value ) {
      if ( index < 0 ) return std::nullopt;
    }
    return static_cast< std::size_t >( index );
  }

  inline const Value& null_value();

} // namespace yodec::internal

  // A YAML sequence of values
  using Sequence = std::vector< Value >;

  // A YAML mapping. Entries keep their insertion order and keys are compared
  // structurally, so a key may be any Value. A mapping never holds two equal
  // keys; inserting one is an error rather than an overwrite.
  class Mapping {
  public:

    using Entry = std::pair< Value, Value >;
    using iterator = std::vector< Entry >::iterator;
    using const_iterator = std::vector< Entry >::const_iterator;

    Mapping();
    Mapping( std::initializer_list< Entry > entries );
    Mapping( const Mapping& other );
    Mapping( Mapping&& other ) noexcept;
    Mapping& operator=( const Mapping& other );
    Mapping& operator=( Mapping&& other ) noexcept;
    ~Mapping();

    inline std::size_t size() const { return entries_.size(); }
    inline bool empty() const { return entries_.empty(); }

    // Throws DuplicateMapKey if an equal key is already present
    void insert( Value key, Value value );

    // Returns false (and leaves the mapping unchanged) if an equal key is
    // already present
    bool try_insert( Value key, Value value );

    // Absent keys yield a null pointer; probing is not an error
    const Value* get( const Value& key ) const;
    Value* get_mut( const Value& key );
    bool contains( const Value& key ) const;

    // Removes the entry and returns its value, preserving the order of the
    // remaining entries
    std::optional< Value > erase( const Value& key );

    inline iterator begin() { return entries_.begin(); }
    inline iterator end() { return entries_.end(); }
    inline const_iterator begin() const { return entries_.begin(); }
    inline const_iterator end() const { return entries_.end(); }

    // Same key set with equal values; insertion order is irrelevant
    bool operator==( const Mapping& other ) const;
    inline bool operator!=( const Mapping& other ) const {
      return !( *this == other );
    }

    std::size_t hash() const;

  private:

    std::optional< std::size_t > find( const Value& key ) const;
    void reindex();

    std::vector< Entry > entries_;

    // Structural hash of a key -> position in entries_
    std::unordered_multimap< std::size_t, std::size_t > index_;
  };

  // A node with an explicit YAML tag, e.g. !Point {x: 1, y: 2}
  class TaggedValue {
  public:

    TaggedValue( std::string tag, Value value );
    TaggedValue( const TaggedValue& other );
    TaggedValue( TaggedValue&& other ) noexcept;
    TaggedValue& operator=( const TaggedValue& other );
    TaggedValue& operator=( TaggedValue&& other ) noexcept;
    ~TaggedValue();

    inline const std::string& tag() const { return tag_; }
    inline const Value& value() const { return *value_; }
    inline Value& value() { return *value_; }

    bool operator==( const TaggedValue& other ) const;

  private:

    std::string tag_;
    std::unique_ptr< Value > value_;
  };

  // Represents any valid YAML value
  class Value {
  public:

    enum class Type { Null, Bool, Number, String, Sequence, Mapping, Tagged };

    inline Value() : data_( std::monostate() ) {}
    inline Value( std::nullptr_t ) : data_( std::monostate() ) {}
    inline Value( bool b ) : data_( b ) {}

    template < typename T, typename std::enable_if< std::is_integral< T >::value
      && !std::is_same< T, bool >::value, int >::type = 0 >
    inline Value( T i ) : data_( Number(i) ) {}

    inline Value( double f ) : data_( Number(f) ) {}
    inline Value( Number n ) : data_( n ) {}
    inline Value( std::string s ) : data_( std::move(s) ) {}
    inline Value( const char* s ) : data_( std::string(s) ) {}
    inline Value( Sequence seq ) : data_( std::move(seq) ) {}
    inline Value( Mapping map ) : data_( std::move(map) ) {}
    inline Value( TaggedValue tagged ) : data_( std::move(tagged) ) {}

    Type type() const;

    // The queries below look through Tagged wrappers
    inline bool is_null() const { return untag().type() == Type::Null; }
    inline bool is_bool() const { return untag().type() == Type::Bool; }
    inline bool is_number() const { return untag().type() == Type::Number; }
    inline bool is_string() const { return untag().type() == Type::String; }
    inline bool is_sequence() const {
      return untag().type() == Type::Sequence;
    }
    inline bool is_mapping() const { return untag().type() == Type::Mapping; }
    inline bool is_tagged() const { return type() == Type::Tagged; }

    // Number queries; false for anything that is not a number
    bool is_i64() const;
    bool is_u64() const;
    bool is_f64() const;

    std::optional< bool > as_bool() const;
    std::optional< std::int64_t > as_i64() const;
    std::optional< std::uint64_t > as_u64() const;
    std::optional< double > as_f64() const;
    const Number* as_number() const;
    const std::string* as_str() const;
    const Sequence* as_sequence() const;
    Sequence* as_sequence_mut();
    const Mapping* as_mapping() const;
    Mapping* as_mapping_mut();
    const TaggedValue* as_tagged() const;

    // Innermost non-tagged value
    const Value& untag() const;
    Value& untag_mut();

    // Index into a mapping by key or into a sequence by position. A missing
    // entry (or a value of the wrong shape) yields a null pointer.
    const Value* get( const Value& key ) const;
    const Value* get( const char* key ) const;
    const Value* get( const std::string& key ) const;
    const Value* get( std::size_t index ) const;
    Value* get_mut( const Value& key );
    Value* get_mut( std::size_t index );

    template < typename I, internal::enable_if_index< I > = 0 >
    inline const Value* get( I index ) const {
      auto i = internal::to_index( index );
      return i ? this->get( *i ) : nullptr;
    }

    template < typename I, internal::enable_if_index< I > = 0 >
    inline Value* get_mut( I index ) {
      auto i = internal::to_index( index );
      return i ? this->get_mut( *i ) : nullptr;
    }

    // Like get(...), but a missing entry yields a shared null Value
    const Value& operator[]( const Value& key ) const;
    const Value& operator[]( const char* key ) const;
    const Value& operator[]( const std::string& key ) const;
    const Value& operator[]( std::size_t index ) const;

    template < typename I, internal::enable_if_index< I > = 0 >
    inline const Value& operator[]( I index ) const {
      const Value* v = this->get( index );
      return v ? *v : internal::null_value();
    }

    // Mutable indexing. A missing mapping key is inserted with a null
    // value, and a null receiver first becomes an empty mapping. Sequence
    // positions must already exist. Any other receiver throws InvalidType.
    Value& operator[]( const Value& key );
    Value& operator[]( const char* key );
    Value& operator[]( const std::string& key );
    Value& operator[]( std::size_t index );

    template < typename I, internal::enable_if_index< I > = 0 >
    inline Value& operator[]( I index ) {
      auto i = internal::to_index( index );
      if ( !i ) {
        internal::throw_error( ErrorKind::InvalidType,
          "cannot access negative index " + std::to_string( index ) );
      }
      return ( *this )[ *i ];
    }

    // Expands "<<" merge keys throughout this tree. Keys already present
    // in a mapping win over merged ones; among merged mappings, earlier ones
    // win.
    void apply_merge();

    bool operator==( const Value& other ) const;
    inline bool operator!=( const Value& other ) const {
      return !( *this == other );
    }

    std::size_t hash() const;

  private:

    std::variant< std::monostate, bool, Number, std::string, Sequence,
      Mapping, TaggedValue > data_;
  };

  inline std::ostream& operator<<( std::ostream& os, const Value& v );

namespace internal {

  // Short description of a value's shape for error messages, e.g.
  // "integer `5`" or "string \"abc\""
  inline std::string describe( const Value& v );

  inline const Value& null_value() {
    static const Value null;
    return null;
  }

} // namespace yodec::internal

} // namespace yodec

// Mapping

inline yodec::Mapping::Mapping() = default;

inline yodec::Mapping::Mapping( std::initializer_list< Entry > entries ) {
  for ( const auto& e : entries ) this->insert( e.first, e.second );
}

inline yodec::Mapping::Mapping( const Mapping& other ) = default;
inline yodec::Mapping::Mapping( Mapping&& other ) noexcept
  : entries_( std::move(other.entries_) ), index_( std::move(other.index_) )
{
}

inline yodec::Mapping&
  yodec::Mapping::operator=( const Mapping& other ) = default;

inline yodec::Mapping& yodec::Mapping::operator=( Mapping&& other ) noexcept {
  entries_ = std::move( other.entries_ );
  index_ = std::move( other.index_ );
  return *this;
}
inline yodec::Mapping::~Mapping() = default;

inline std::optional< std::size_t >
  yodec::Mapping::find( const Value& key ) const
{
  auto range = index_.equal_range( key.hash() );
  for ( auto it = range.first; it != range.second; ++it ) {
    if ( entries_[ it->second ].first == key ) return it->second;
  }
  return std::nullopt;
}

inline void yodec::Mapping::reindex() {
  index_.clear();
  for ( std::size_t i = 0; i < entries_.size(); ++i ) {
    index_.emplace( entries_[ i ].first.hash(), i );
  }
}

inline bool yodec::Mapping::try_insert( Value key, Value value ) {
  if ( this->find(key) ) return false;
  const std::size_t h = key.hash();
  entries_.emplace_back( std::move(key), std::move(value) );
  index_.emplace( h, entries_.size() - 1 );
  return true;
}

inline void yodec::Mapping::insert( Value key, Value value ) {
  if ( this->find(key) ) {
    std::ostringstream oss;
    oss << "duplicate entry with key " << key;
    internal::throw_error( ErrorKind::DuplicateMapKey, oss.str() );
  }
  this->try_insert( std::move(key), std::move(value) );
}

inline const yodec::Value* yodec::Mapping::get( const Value& key ) const {
  auto pos = this->find( key );
  return pos ? &entries_[ *pos ].second : nullptr;
}

inline yodec::Value* yodec::Mapping::get_mut( const Value& key ) {
  auto pos = this->find( key );
  return pos ? &entries_[ *pos ].second : nullptr;
}

inline bool yodec::Mapping::contains( const Value& key ) const {
  return this->find( key ).has_value();
}

inline std::optional< yodec::Value > yodec::Mapping::erase( const Value& key ) {
  auto pos = this->find( key );
  if ( !pos ) return std::nullopt;
  Value removed = std::move( entries_[ *pos ].second );
  entries_.erase( entries_.begin() + *pos );
  this->reindex();
  return removed;
}

inline bool yodec::Mapping::operator==( const Mapping& other ) const {
  if ( entries_.size() != other.entries_.size() ) return false;
  for ( const auto& [k, v] : entries_ ) {
    const Value* ov = other.get( k );
    if ( !ov || *ov != v ) return false;
  }
  return true;
}

// Order-independent, consistent with operator==
inline std::size_t yodec::Mapping::hash() const {
  std::size_t h = entries_.size();
  for ( const auto& [k, v] : entries_ ) {
    h += k.hash() * 31 ^ v.hash();
  }
  return h;
}

// TaggedValue

inline yodec::TaggedValue::TaggedValue( std::string tag, Value value )
  : tag_( std::move(tag) ), value_( std::make_unique< Value >( std::move(value) ) )
{
}

inline yodec::TaggedValue::TaggedValue( const TaggedValue& other )
  : tag_( other.tag_ ), value_( std::make_unique< Value >( *other.value_ ) )
{
}

inline yodec::TaggedValue::TaggedValue( TaggedValue&& other ) noexcept
  : tag_( std::move(other.tag_) ), value_( std::move(other.value_) )
{
}

inline yodec::TaggedValue&
  yodec::TaggedValue::operator=( const TaggedValue& other )
{
  if ( this != &other ) {
    tag_ = other.tag_;
    value_ = std::make_unique< Value >( *other.value_ );
  }
  return *this;
}

inline yodec::TaggedValue&
  yodec::TaggedValue::operator=( TaggedValue&& other ) noexcept
{
  tag_ = std::move( other.tag_ );
  value_ = std::move( other.value_ );
  return *this;
}

inline yodec::TaggedValue::~TaggedValue() = default;

inline bool yodec::TaggedValue::operator==( const TaggedValue& other ) const {
  return tag_ == other.tag_ && *value_ == *other.value_;
}

// Value

inline yodec::Value::Type yodec::Value::type() const {
  return static_cast< Type >( data_.index() );
}

inline const yodec::Value& yodec::Value::untag() const {
  const Value* v = this;
  while ( auto t = std::get_if< TaggedValue >( &v->data_ ) ) v = &t->value();
  return *v;
}

inline yodec::Value& yodec::Value::untag_mut() {
  Value* v = this;
  while ( auto t = std::get_if< TaggedValue >( &v->data_ ) ) v = &t->value();
  return *v;
}

inline std::optional< bool > yodec::Value::as_bool() const {
  if ( auto b = std::get_if< bool >( &untag().data_ ) ) return *b;
  return std::nullopt;
}

inline const yodec::Number* yodec::Value::as_number() const {
  return std::get_if< Number >( &untag().data_ );
}

inline bool yodec::Value::is_i64() const {
  const Number* n = this->as_number();
  return n && n->is_i64();
}

inline bool yodec::Value::is_u64() const {
  const Number* n = this->as_number();
  return n && n->is_u64();
}

inline bool yodec::Value::is_f64() const {
  const Number* n = this->as_number();
  return n && n->is_f64();
}

inline std::optional< std::int64_t > yodec::Value::as_i64() const {
  if ( auto n = this->as_number() ) return n->as_i64();
  return std::nullopt;
}

inline std::optional< std::uint64_t > yodec::Value::as_u64() const {
  if ( auto n = this->as_number() ) return n->as_u64();
  return std::nullopt;
}

inline std::optional< double > yodec::Value::as_f64() const {
  if ( auto n = this->as_number() ) return n->as_f64();
  return std::nullopt;
}

inline const std::string* yodec::Value::as_str() const {
  return std::get_if< std::string >( &untag().data_ );
}

inline const yodec::Sequence* yodec::Value::as_sequence() const {
  return std::get_if< Sequence >( &untag().data_ );
}

inline yodec::Sequence* yodec::Value::as_sequence_mut() {
  return std::get_if< Sequence >( &untag_mut().data_ );
}

inline const yodec::Mapping* yodec::Value::as_mapping() const {
  return std::get_if< Mapping >( &untag().data_ );
}

inline yodec::Mapping* yodec::Value::as_mapping_mut() {
  return std::get_if< Mapping >( &untag_mut().data_ );
}

inline const yodec::TaggedValue* yodec::Value::as_tagged() const {
  return std::get_if< TaggedValue >( &data_ );
}

inline const yodec::Value* yodec::Value::get( const Value& key ) const {
  if ( auto m = this->as_mapping() ) return m->get( key );
  return nullptr;
}

inline const yodec::Value* yodec::Value::get( const char* key ) const {
  return this->get( Value(key) );
}

inline const yodec::Value* yodec::Value::get( const std::string& key ) const {
  return this->get( Value(key) );
}

inline const yodec::Value* yodec::Value::get( std::size_t index ) const {
  if ( auto s = this->as_sequence() ) {
    return index < s->size() ? &( *s )[ index ] : nullptr;
  }
  // A mapping may use integers as keys
  if ( auto m = this->as_mapping() ) return m->get( Value(index) );
  return nullptr;
}

inline yodec::Value* yodec::Value::get_mut( const Value& key ) {
  if ( auto m = this->as_mapping_mut() ) return m->get_mut( key );
  return nullptr;
}

inline yodec::Value* yodec::Value::get_mut( std::size_t index ) {
  if ( auto s = this->as_sequence_mut() ) {
    return index < s->size() ? &( *s )[ index ] : nullptr;
  }
  if ( auto m = this->as_mapping_mut() ) return m->get_mut( Value(index) );
  return nullptr;
}

inline const yodec::Value& yodec::Value::operator[]( const Value& key ) const {
  const Value* v = this->get( key );
  return v ? *v : internal::null_value();
}

inline const yodec::Value& yodec::Value::operator[]( const char* key ) const {
  return ( *this )[ Value(key) ];
}

inline const yodec::Value&
  yodec::Value::operator[]( const std::string& key ) const
{
  return ( *this )[ Value(key) ];
}

inline const yodec::Value& yodec::Value::operator[]( std::size_t index ) const {
  const Value* v = this->get( index );
  return v ? *v : internal::null_value();
}

inline yodec::Value& yodec::Value::operator[]( const Value& key ) {
  Value& target = this->untag_mut();
  if ( target.type() == Type::Null ) target.data_ = Mapping();
  Mapping* m = target.as_mapping_mut();
  if ( !m ) {
    std::ostringstream oss;
    oss << "cannot access key " << key << " in YAML "
      << internal::describe( target );
    internal::throw_error( ErrorKind::InvalidType, oss.str() );
  }
  m->try_insert( key, Value() );
  return *m->get_mut( key );
}

inline yodec::Value& yodec::Value::operator[]( const char* key ) {
  return ( *this )[ Value(key) ];
}

inline yodec::Value& yodec::Value::operator[]( const std::string& key ) {
  return ( *this )[ Value(key) ];
}

inline yodec::Value& yodec::Value::operator[]( std::size_t index ) {
  Value& target = this->untag_mut();
  if ( auto s = target.as_sequence_mut() ) {
    if ( index >= s->size() ) {
      internal::throw_error( ErrorKind::InvalidValue, "cannot access index "
        + std::to_string( index ) + " of YAML sequence of length "
        + std::to_string( s->size() ) );
    }
    return ( *s )[ index ];
  }
  // A mapping may use integers as keys
  if ( target.as_mapping_mut() ) return target[ Value(index) ];

  std::ostringstream oss;
  oss << "cannot access index " << index << " of YAML "
    << internal::describe( target );
  internal::throw_error( ErrorKind::InvalidType, oss.str() );
}

inline void yodec::Value::apply_merge() {
  const Value merge_key( internal::MERGE_KEY );

  auto merge_into = []( Mapping& target, Mapping& source ) {
    for ( auto& [k, v] : source ) {
      target.try_insert( std::move(k), std::move(v) );
    }
  };

  std::vector< Value* > stack{ this };
  while ( !stack.empty() ) {
    Value* node = stack.back();
    stack.pop_back();

    if ( auto mapping = std::get_if< Mapping >( &node->data_ ) ) {
      if ( auto merged = mapping->erase(merge_key) ) {
        if ( auto source = std::get_if< Mapping >( &merged->data_ ) ) {
          merge_into( *mapping, *source );
        }
        else if ( auto seq = std::get_if< Sequence >( &merged->data_ ) ) {
          for ( auto& element : *seq ) {
            if ( auto source = std::get_if< Mapping >( &element.data_ ) ) {
              merge_into( *mapping, *source );
            }
            else if ( element.is_tagged() ) {
              internal::throw_error( ErrorKind::InvalidTag,
                "unexpected tagged value in merge" );
            }
            else {
              internal::throw_error( ErrorKind::UnexpectedEvent,
                "expected a mapping for merging, but found "
                  + internal::describe(element) );
            }
          }
        }
        else if ( merged->is_tagged() ) {
          internal::throw_error( ErrorKind::InvalidTag,
            "unexpected tagged value in merge" );
        }
        else {
          internal::throw_error( ErrorKind::UnexpectedEvent,
            "expected a mapping or list of mappings for merging, but found "
              + internal::describe(*merged) );
        }
      }
      for ( auto& entry : *mapping ) stack.push_back( &entry.second );
    }
    else if ( auto seq = std::get_if< Sequence >( &node->data_ ) ) {
      for ( auto& element : *seq ) stack.push_back( &element );
    }
    else if ( auto tagged = std::get_if< TaggedValue >( &node->data_ ) ) {
      stack.push_back( &tagged->value() );
    }
  }
}

inline bool yodec::Value::operator==( const Value& other ) const {
  if ( data_.index() != other.data_.index() ) return false;
  switch ( this->type() ) {
    case Type::Null: return true;
    case Type::Bool:
      return std::get< bool >( data_ ) == std::get< bool >( other.data_ );
    case Type::Number:
      return std::get< Number >( data_ ) == std::get< Number >( other.data_ );
    case Type::String:
      return std::get< std::string >( data_ )
        == std::get< std::string >( other.data_ );
    case Type::Sequence:
      return std::get< Sequence >( data_ ) == std::get< Sequence >( other.data_ );
    case Type::Mapping:
      return std::get< Mapping >( data_ ) == std::get< Mapping >( other.data_ );
    case Type::Tagged:
      return std::get< TaggedValue >( data_ )
        == std::get< TaggedValue >( other.data_ );
  }
  return false;
}

inline std::size_t yodec::Value::hash() const {
  std::size_t h = data_.index() * 0x9e3779b9u;
  switch ( this->type() ) {
    case Type::Null: return h;
    case Type::Bool: return h ^ std::get< bool >( data_ );
    case Type::Number: return h ^ std::get< Number >( data_ ).hash();
    case Type::String:
      return h ^ std::hash< std::string >()( std::get< std::string >(data_) );
    case Type::Sequence:
      for ( const auto& element : std::get< Sequence >( data_ ) ) {
        h = h * 31 + element.hash();
      }
      return h;
    case Type::Mapping: return h ^ std::get< Mapping >( data_ ).hash();
    case Type::Tagged: {
      const auto& t = std::get< TaggedValue >( data_ );
      return h ^ std::hash< std::string >()( t.tag() ) ^ t.value().hash();
    }
  }
  return h;
}

// Compact flow-style rendering for diagnostics and test output
inline std::ostream& yodec::operator<<( std::ostream& os, const Value& v ) {
  switch ( v.type() ) {
    case Value::Type::Null: return os << "null";
    case Value::Type::Bool: return os << ( *v.as_bool() ? "true" : "false" );
    case Value::Type::Number: return os << *v.as_number();
    case Value::Type::String: {
      os << '"';
      for ( char c : *v.as_str() ) {
        if ( c == '"' || c == '\\' ) os << '\\' << c;
        else if ( c == '\n' ) os << "\\n";
        else os << c;
      }
      return os << '"';
    }
    case Value::Type::Sequence: {
      os << '[';
      bool first = true;
      for ( const auto& element : *v.as_sequence() ) {
        if ( !first ) os << ", ";
        first = false;
        os << element;
      }
      return os << ']';
    }
    case Value::Type::Mapping: {
      os << '{';
      bool first = true;
      for ( const auto& [k, mv] : *v.as_mapping() ) {
        if ( !first ) os << ", ";
        first = false;
        os << k << ": " << mv;
      }
      return os << '}';
    }
    case Value::Type::Tagged: {
      const TaggedValue* t = v.as_tagged();
      return os << t->tag() << ' ' << t->value();
    }
  }
  return os;
}

inline std::string yodec::internal::describe( const Value& v ) {
  std::ostringstream oss;
  switch ( v.type() ) {
    case Value::Type::Null: oss << "null"; break;
    case Value::Type::Bool:
      oss << "boolean `" << ( *v.as_bool() ? "true" : "false" ) << '`';
      break;
    case Value::Type::Number: {
      const Number* n = v.as_number();
      oss << ( n->is_f64() ? "floating point `" : "integer `" ) << *n << '`';
      break;
    }
    case Value::Type::String: oss << "string " << v; break;
    case Value::Type::Sequence: oss << "sequence"; break;
    case Value::Type::Mapping: oss << "map"; break;
    case Value::Type::Tagged: oss << "tagged value"; break;
  }
  return oss.str();
}
