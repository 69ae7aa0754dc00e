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
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "datamodel.hh"
#include "value.hh"

namespace yodec {

  template <>
  struct data_converter< Value > {
    static void serialize( Serializer& s, const Value& v );
    static void deserialize( Deserializer& d, Value& out );
  };

  // Builds a Value Tree from data-model calls
  class ValueSerializer : public Serializer {
  public:

    ValueSerializer() = default;

    // The finished value. Throws if the calls did not describe exactly one
    // complete value.
    Value take();

    void serialize_null() override { this->push( Value() ); }
    void serialize_bool( bool v ) override { this->push( Value(v) ); }
    void serialize_i64( std::int64_t v ) override { this->push( Value(v) ); }
    void serialize_u64( std::uint64_t v ) override { this->push( Value(v) ); }
    void serialize_f64( double v ) override { this->push( Value(v) ); }
    void serialize_number( const Number& n ) override { this->push( Value(n) ); }
    void serialize_str( std::string_view v ) override {
      this->push( Value( std::string(v) ) );
    }

    void begin_seq( std::optional< std::size_t > len ) override;
    void end_seq() override;
    void begin_map( std::optional< std::size_t > len ) override;
    void end_map() override;

    void serialize_unit_variant( std::string_view variant ) override {
      this->push( Value( std::string(variant) ) );
    }
    void begin_variant( std::string_view variant ) override;
    void end_variant() override;

    void begin_tagged( std::string_view tag ) override;
    void end_tagged() override;

  private:

    enum class FrameKind { Seq, Map, Variant, Tagged };

    struct Frame {
      FrameKind kind;
      std::string name; // variant name or tag
      Sequence seq;
      Mapping map;
      std::optional< Value > key;
      std::optional< Value > inner;
    };

    void push( Value v );
    Frame pop( FrameKind expected, const char* what );

    std::vector< Frame > stack_;
    std::optional< Value > result_;
  };

  // Replays a Value Tree as data-model visitor calls
  class ValueDeserializer : public Deserializer {
  public:

    explicit ValueDeserializer( const Value& value ) : value_( value ) {}

    void deserialize_any( Visitor& v ) override;
    void deserialize_string( Visitor& v ) override;
    void deserialize_integer( Visitor& v ) override;
    void deserialize_enum( Visitor& v ) override;
    void deserialize_ignored() override {}
    bool is_null() override { return value_.type() == Value::Type::Null; }

  private:

    const Value& value_;
  };

  template < typename T >
  Value to_value( const T& t ) {
    ValueSerializer ser;
    data_converter< T >::serialize( ser, t );
    return ser.take();
  }

  template < typename T >
  T from_value( const Value& v ) {
    ValueDeserializer de( v );
    T t{};
    data_converter< T >::deserialize( de, t );
    return t;
  }

namespace internal {

  class ValueSeqAccess : public SeqAccess {
  public:
    explicit ValueSeqAccess( const Sequence& seq ) : seq_( seq ) {}

    Deserializer* next_element() override {
      if ( pos_ >= seq_.size() ) return nullptr;
      current_.emplace( seq_[ pos_++ ] );
      return &*current_;
    }

    std::optional< std::size_t > size_hint() const override {
      return seq_.size() - pos_;
    }

  private:
    const Sequence& seq_;
    std::size_t pos_ = 0;
    std::optional< ValueDeserializer > current_;
  };

  class ValueMapAccess : public MapAccess {
  public:
    explicit ValueMapAccess( const Mapping& map ) : it_( map.begin() ),
      end_( map.end() ), size_( map.size() ) {}

    Deserializer* next_key() override {
      if ( it_ == end_ ) return nullptr;
      key_.emplace( it_->first );
      return &*key_;
    }

    Deserializer& next_value() override {
      value_.emplace( it_->second );
      ++it_;
      return *value_;
    }

    std::optional< std::size_t > size_hint() const override { return size_; }

  private:
    Mapping::const_iterator it_;
    Mapping::const_iterator end_;
    std::size_t size_;
    std::optional< ValueDeserializer > key_;
    std::optional< ValueDeserializer > value_;
  };

  class ValueEnumAccess : public EnumAccess {
  public:
    ValueEnumAccess( std::string variant, std::string tag,
      const Value* payload ) : variant_( std::move(variant) ),
      tag_( std::move(tag) )
    {
      if ( payload ) payload_.emplace( *payload );
    }

    const std::string& variant() const override { return variant_; }
    const std::string& tag() const override { return tag_; }
    Deserializer* payload() override {
      return payload_ ? &*payload_ : nullptr;
    }

  private:
    std::string variant_;
    std::string tag_;
    std::optional< ValueDeserializer > payload_;
  };

  // Variant name carried by a tag: "!Text" -> "Text"
  inline std::string variant_from_tag( const std::string& tag ) {
    if ( tag.size() > 1 && tag[0] == '!' && tag[1] != '!' ) return tag.substr(1);
    return tag;
  }

  class ValueVisitor : public Visitor {
  public:
    explicit ValueVisitor( Value& out ) : out_( out ) {}

    std::string expecting() const override { return "any valid YAML value"; }

    void visit_null() override { out_ = Value(); }
    void visit_bool( bool v ) override { out_ = Value( v ); }
    void visit_i64( std::int64_t v ) override { out_ = Value( v ); }
    void visit_u64( std::uint64_t v ) override { out_ = Value( v ); }
    void visit_f64( double v ) override { out_ = Value( v ); }
    void visit_number( const Number& n ) override { out_ = Value( n ); }
    void visit_str( std::string_view v ) override {
      out_ = Value( std::string(v) );
    }

    void visit_seq( SeqAccess& seq ) override {
      Sequence elements;
      if ( auto hint = seq.size_hint() ) elements.reserve( *hint );
      while ( Deserializer* d = seq.next_element() ) {
        Value element;
        data_converter< Value >::deserialize( *d, element );
        elements.push_back( std::move(element) );
      }
      out_ = Value( std::move(elements) );
    }

    void visit_map( MapAccess& map ) override {
      Mapping mapping;
      while ( Deserializer* kd = map.next_key() ) {
        Value key;
        data_converter< Value >::deserialize( *kd, key );
        Value value;
        data_converter< Value >::deserialize( map.next_value(), value );
        mapping.insert( std::move(key), std::move(value) );
      }
      out_ = Value( std::move(mapping) );
    }

    void visit_enum( EnumAccess& e ) override {
      Value inner;
      if ( Deserializer* d = e.payload() ) {
        data_converter< Value >::deserialize( *d, inner );
      }
      std::string tag = e.tag().empty() ? "!" + e.variant() : e.tag();
      out_ = Value( TaggedValue( std::move(tag), std::move(inner) ) );
    }

  private:
    Value& out_;
  };

} // namespace yodec::internal

} // namespace yodec

// data_converter< Value >

inline void yodec::data_converter< yodec::Value >::serialize( Serializer& s,
  const Value& v )
{
  switch ( v.type() ) {
    case Value::Type::Null: s.serialize_null(); break;
    case Value::Type::Bool: s.serialize_bool( *v.as_bool() ); break;
    case Value::Type::Number: s.serialize_number( *v.as_number() ); break;
    case Value::Type::String: s.serialize_str( *v.as_str() ); break;
    case Value::Type::Sequence: {
      const Sequence& seq = *v.as_sequence();
      s.begin_seq( seq.size() );
      for ( const auto& element : seq ) serialize( s, element );
      s.end_seq();
      break;
    }
    case Value::Type::Mapping: {
      const Mapping& map = *v.as_mapping();
      s.begin_map( map.size() );
      for ( const auto& [key, value] : map ) {
        serialize( s, key );
        serialize( s, value );
      }
      s.end_map();
      break;
    }
    case Value::Type::Tagged: {
      const TaggedValue& tagged = *v.as_tagged();
      s.begin_tagged( tagged.tag() );
      serialize( s, tagged.value() );
      s.end_tagged();
      break;
    }
  }
}

inline void yodec::data_converter< yodec::Value >::deserialize(
  Deserializer& d, Value& out )
{
  internal::ValueVisitor visitor( out );
  d.deserialize_any( visitor );
}

// ValueSerializer

inline yodec::Value yodec::ValueSerializer::take() {
  if ( !stack_.empty() || !result_ ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "incomplete value: unbalanced begin/end calls" );
  }
  Value v = std::move( *result_ );
  result_.reset();
  return v;
}

inline void yodec::ValueSerializer::push( Value v ) {
  if ( stack_.empty() ) {
    if ( result_ ) {
      internal::throw_error( ErrorKind::UnexpectedEvent,
        "more than one top-level value" );
    }
    result_ = std::move( v );
    return;
  }

  Frame& top = stack_.back();
  switch ( top.kind ) {
    case FrameKind::Seq:
      top.seq.push_back( std::move(v) );
      break;
    case FrameKind::Map:
      if ( !top.key ) {
        top.key = std::move( v );
      }
      else {
        top.map.insert( std::move(*top.key), std::move(v) );
        top.key.reset();
      }
      break;
    case FrameKind::Variant:
    case FrameKind::Tagged:
      if ( top.inner ) {
        internal::throw_error( ErrorKind::UnexpectedEvent,
          "more than one value inside " + std::string( top.kind
            == FrameKind::Variant ? "variant '" : "tag '" ) + top.name + '\'' );
      }
      top.inner = std::move( v );
      break;
  }
}

inline yodec::ValueSerializer::Frame yodec::ValueSerializer::pop(
  FrameKind expected, const char* what )
{
  if ( stack_.empty() || stack_.back().kind != expected ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      std::string( "unbalanced call: end of " ) + what + " without a start" );
  }
  Frame f = std::move( stack_.back() );
  stack_.pop_back();
  return f;
}

inline void yodec::ValueSerializer::begin_seq(
  std::optional< std::size_t > len )
{
  Frame f{ FrameKind::Seq, "", {}, {}, std::nullopt, std::nullopt };
  if ( len ) f.seq.reserve( *len );
  stack_.push_back( std::move(f) );
}

inline void yodec::ValueSerializer::end_seq() {
  Frame f = this->pop( FrameKind::Seq, "sequence" );
  this->push( Value( std::move(f.seq) ) );
}

inline void yodec::ValueSerializer::begin_map( std::optional< std::size_t > ) {
  stack_.push_back( Frame{ FrameKind::Map, "", {}, {}, std::nullopt,
    std::nullopt } );
}

inline void yodec::ValueSerializer::end_map() {
  Frame f = this->pop( FrameKind::Map, "mapping" );
  if ( f.key ) {
    internal::throw_error( ErrorKind::UnexpectedEvent,
      "mapping ended after a key without a value" );
  }
  this->push( Value( std::move(f.map) ) );
}

inline void yodec::ValueSerializer::begin_variant( std::string_view variant ) {
  stack_.push_back( Frame{ FrameKind::Variant, std::string(variant), {}, {},
    std::nullopt, std::nullopt } );
}

inline void yodec::ValueSerializer::end_variant() {
  Frame f = this->pop( FrameKind::Variant, "variant" );
  Mapping m;
  m.insert( Value( f.name ), f.inner ? std::move(*f.inner) : Value() );
  this->push( Value( std::move(m) ) );
}

inline void yodec::ValueSerializer::begin_tagged( std::string_view tag ) {
  if ( tag.empty() ) {
    internal::throw_error( ErrorKind::InvalidTag,
      "empty YAML tag is not allowed" );
  }
  stack_.push_back( Frame{ FrameKind::Tagged, std::string(tag), {}, {},
    std::nullopt, std::nullopt } );
}

inline void yodec::ValueSerializer::end_tagged() {
  Frame f = this->pop( FrameKind::Tagged, "tagged value" );
  this->push( Value( TaggedValue( std::move(f.name),
    f.inner ? std::move(*f.inner) : Value() ) ) );
}

// ValueDeserializer

inline void yodec::ValueDeserializer::deserialize_any( Visitor& v ) {
  switch ( value_.type() ) {
    case Value::Type::Null: v.visit_null(); break;
    case Value::Type::Bool: v.visit_bool( *value_.as_bool() ); break;
    case Value::Type::Number: v.visit_number( *value_.as_number() ); break;
    case Value::Type::String: v.visit_str( *value_.as_str() ); break;
    case Value::Type::Sequence: {
      internal::ValueSeqAccess seq( *value_.as_sequence() );
      v.visit_seq( seq );
      break;
    }
    case Value::Type::Mapping: {
      internal::ValueMapAccess map( *value_.as_mapping() );
      v.visit_map( map );
      break;
    }
    case Value::Type::Tagged: {
      const TaggedValue& tagged = *value_.as_tagged();
      internal::ValueEnumAccess e( internal::variant_from_tag(tagged.tag()),
        tagged.tag(), &tagged.value() );
      v.visit_enum( e );
      break;
    }
  }
}

inline void yodec::ValueDeserializer::deserialize_string( Visitor& v ) {
  switch ( value_.type() ) {
    case Value::Type::Bool:
      v.visit_str( *value_.as_bool() ? "true" : "false" );
      break;
    case Value::Type::Number:
      v.visit_str( value_.as_number()->to_string() );
      break;
    default:
      this->deserialize_any( v );
  }
}

inline void yodec::ValueDeserializer::deserialize_integer( Visitor& v ) {
  if ( value_.type() == Value::Type::Number
    && value_.as_number()->looks_integral() )
  {
    internal::throw_error( ErrorKind::NumberOverflow,
      "number too large to fit in target type: "
        + value_.as_number()->to_string() );
  }
  this->deserialize_any( v );
}

inline void yodec::ValueDeserializer::deserialize_enum( Visitor& v ) {
  switch ( value_.type() ) {
    case Value::Type::String: {
      internal::ValueEnumAccess e( *value_.as_str(), "", nullptr );
      v.visit_enum( e );
      return;
    }
    case Value::Type::Mapping: {
      const Mapping& m = *value_.as_mapping();
      if ( m.size() == 1 && m.begin()->first.type() == Value::Type::String ) {
        internal::ValueEnumAccess e( *m.begin()->first.as_str(), "",
          &m.begin()->second );
        v.visit_enum( e );
        return;
      }
      break;
    }
    case Value::Type::Tagged: {
      this->deserialize_any( v );
      return;
    }
    default:
      break;
  }
  internal::throw_error( ErrorKind::InvalidType,
    "invalid type: " + internal::describe( value_ ) + ", expected "
      + v.expecting() );
}
