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
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "error.hh"
#include "number.hh"

// The generic data model: every serializable value decomposes into null,
// bool, number, string, sequence, mapping or enum variant. A Serializer
// accepts these shapes, a Deserializer produces them by calling a Visitor.
namespace yodec {

  class Deserializer;

  // Accepting side of the data model. Between begin_map() and end_map(),
  // keys and values alternate. Between begin_variant() and end_variant(),
  // and between begin_tagged() and end_tagged(), exactly one value is
  // serialized.
  class Serializer {
  public:

    virtual ~Serializer() = default;

    virtual void serialize_null() = 0;
    virtual void serialize_bool( bool v ) = 0;
    virtual void serialize_i64( std::int64_t v ) = 0;
    virtual void serialize_u64( std::uint64_t v ) = 0;
    virtual void serialize_f64( double v ) = 0;
    virtual void serialize_str( std::string_view v ) = 0;

    // Numbers from a Value Tree. Dispatches on the number's kind unless a
    // serializer can keep more of it.
    virtual void serialize_number( const Number& n );

    // YAML has no byte strings
    virtual void serialize_bytes( const std::vector< std::uint8_t >& v );

    virtual void begin_seq( std::optional< std::size_t > len ) = 0;
    virtual void end_seq() = 0;
    virtual void begin_map( std::optional< std::size_t > len ) = 0;
    virtual void end_map() = 0;

    virtual void serialize_unit_variant( std::string_view variant ) = 0;
    virtual void begin_variant( std::string_view variant ) = 0;
    virtual void end_variant() = 0;

    virtual void begin_tagged( std::string_view tag ) = 0;
    virtual void end_tagged() = 0;
  };

  class SeqAccess {
  public:
    virtual ~SeqAccess() = default;

    // Deserializer for the next element, or null after the last one. The
    // pointer stays valid until the next call.
    virtual Deserializer* next_element() = 0;

    virtual std::optional< std::size_t > size_hint() const {
      return std::nullopt;
    }
  };

  class MapAccess {
  public:
    virtual ~MapAccess() = default;

    // Deserializer for the next key, or null after the last entry
    virtual Deserializer* next_key() = 0;

    // Deserializer for the value belonging to the last key
    virtual Deserializer& next_value() = 0;

    virtual std::optional< std::size_t > size_hint() const {
      return std::nullopt;
    }
  };

  class EnumAccess {
  public:
    virtual ~EnumAccess() = default;

    virtual const std::string& variant() const = 0;

    // Verbatim tag if the variant was written as a tagged node, else empty
    virtual const std::string& tag() const = 0;

    // Deserializer for the payload, or null for a unit variant
    virtual Deserializer* payload() = 0;

    // Accepts a unit variant, written either bare or with a null payload
    void unit_variant();
  };

  // Receives one value from a Deserializer. Every visit_* not overridden
  // rejects the value with an InvalidType error naming expecting().
  class Visitor {
  public:

    virtual ~Visitor() = default;

    // What this visitor accepts, e.g. "a string"
    virtual std::string expecting() const = 0;

    virtual void visit_null();
    virtual void visit_bool( bool v );
    virtual void visit_i64( std::int64_t v );
    virtual void visit_u64( std::uint64_t v );
    virtual void visit_f64( double v );
    virtual void visit_str( std::string_view v );
    virtual void visit_seq( SeqAccess& seq );
    virtual void visit_map( MapAccess& map );
    virtual void visit_enum( EnumAccess& e );

    // Deserializers report numbers here; the default dispatches to
    // visit_i64 (negative), visit_u64 (non-negative) or visit_f64
    virtual void visit_number( const Number& n );

  protected:

    [[noreturn]] void invalid_type( const std::string& unexpected ) const;
  };

  // Producing side of the data model
  class Deserializer {
  public:

    virtual ~Deserializer() = default;

    // Self-describing dispatch on the node's resolved shape
    virtual void deserialize_any( Visitor& v ) = 0;

    // Any untagged scalar is delivered through visit_str as written
    virtual void deserialize_string( Visitor& v ) = 0;

    // Like deserialize_any, except that an integer literal too wide for 64
    // bits is reported as NumberOverflow instead of a float
    virtual void deserialize_integer( Visitor& v ) = 0;

    // Scalar -> unit variant, {Variant: payload} or !Variant payload
    virtual void deserialize_enum( Visitor& v ) = 0;

    // Skips the node
    virtual void deserialize_ignored() = 0;

    // True if the node resolves to null
    virtual bool is_null() = 0;
  };

  // Conversion between a C++ type and the data model, in the manner of
  // fkyaml::node_value_converter. Specialize for user types.
  template < typename T, typename Enable = void >
  struct data_converter;

namespace internal {

  [[noreturn]] inline void invalid_value( const std::string& msg ) {
    throw_error( ErrorKind::InvalidValue, "invalid value: " + msg );
  }

  template < typename T >
  inline const char* integer_name() {
    if constexpr ( std::is_signed< T >::value ) {
      switch ( sizeof(T) ) {
        case 1: return "i8";
        case 2: return "i16";
        case 4: return "i32";
        default: return "i64";
      }
    }
    else {
      switch ( sizeof(T) ) {
        case 1: return "u8";
        case 2: return "u16";
        case 4: return "u32";
        default: return "u64";
      }
    }
  }

} // namespace yodec::internal

  template <>
  struct data_converter< bool > {
    static void serialize( Serializer& s, const bool& v ) {
      s.serialize_bool( v );
    }

    static void deserialize( Deserializer& d, bool& out ) {
      struct BoolVisitor : Visitor {
        bool& out;
        explicit BoolVisitor( bool& o ) : out( o ) {}
        std::string expecting() const override { return "a boolean"; }
        void visit_bool( bool v ) override { out = v; }
      } visitor( out );
      d.deserialize_any( visitor );
    }
  };

  template < typename T >
  struct data_converter< T, typename std::enable_if<
    std::is_integral< T >::value && !std::is_same< T, bool >::value >::type >
  {
    static void serialize( Serializer& s, const T& v ) {
      if constexpr ( std::is_signed< T >::value ) {
        s.serialize_i64( static_cast< std::int64_t >( v ) );
      }
      else {
        s.serialize_u64( static_cast< std::uint64_t >( v ) );
      }
    }

    static void deserialize( Deserializer& d, T& out ) {
      struct IntegerVisitor : Visitor {
        T& out;
        explicit IntegerVisitor( T& o ) : out( o ) {}

        std::string expecting() const override {
          return std::string( "an integer (" ) + internal::integer_name< T >()
            + ')';
        }

        void visit_i64( std::int64_t v ) override {
          if constexpr ( std::is_signed< T >::value ) {
            if ( v < static_cast< std::int64_t >(
                  std::numeric_limits< T >::min() )
              || v > static_cast< std::int64_t >(
                  std::numeric_limits< T >::max() ) )
            {
              out_of_range( std::to_string(v) );
            }
            out = static_cast< T >( v );
          }
          else {
            out_of_range( std::to_string(v) );
          }
        }

        void visit_u64( std::uint64_t v ) override {
          if ( v > static_cast< std::uint64_t >(
              std::numeric_limits< T >::max() ) )
          {
            out_of_range( std::to_string(v) );
          }
          out = static_cast< T >( v );
        }

        [[noreturn]] void out_of_range( const std::string& text ) const {
          internal::invalid_value( "integer `" + text + "`, expected "
            + this->expecting() );
        }
      } visitor( out );
      d.deserialize_integer( visitor );
    }
  };

  template < typename T >
  struct data_converter< T, typename std::enable_if<
    std::is_floating_point< T >::value >::type >
  {
    static void serialize( Serializer& s, const T& v ) {
      s.serialize_f64( static_cast< double >( v ) );
    }

    static void deserialize( Deserializer& d, T& out ) {
      struct FloatVisitor : Visitor {
        T& out;
        explicit FloatVisitor( T& o ) : out( o ) {}
        std::string expecting() const override {
          return "a floating point number";
        }
        void visit_f64( double v ) override { out = static_cast< T >( v ); }
        void visit_i64( std::int64_t v ) override { out = static_cast< T >( v ); }
        void visit_u64( std::uint64_t v ) override {
          out = static_cast< T >( v );
        }
      } visitor( out );
      d.deserialize_any( visitor );
    }
  };

  template <>
  struct data_converter< std::string > {
    static void serialize( Serializer& s, const std::string& v ) {
      s.serialize_str( v );
    }

    static void deserialize( Deserializer& d, std::string& out ) {
      struct StringVisitor : Visitor {
        std::string& out;
        explicit StringVisitor( std::string& o ) : out( o ) {}
        std::string expecting() const override { return "a string"; }
        void visit_str( std::string_view v ) override { out = std::string( v ); }
      } visitor( out );
      d.deserialize_string( visitor );
    }
  };

  template < typename T >
  struct data_converter< std::vector< T > > {
    static void serialize( Serializer& s, const std::vector< T >& v ) {
      s.begin_seq( v.size() );
      for ( const auto& element : v ) {
        data_converter< T >::serialize( s, element );
      }
      s.end_seq();
    }

    static void deserialize( Deserializer& d, std::vector< T >& out ) {
      struct SeqVisitor : Visitor {
        std::vector< T >& out;
        explicit SeqVisitor( std::vector< T >& o ) : out( o ) {}
        std::string expecting() const override { return "a sequence"; }
        void visit_seq( SeqAccess& seq ) override {
          out.clear();
          if ( auto hint = seq.size_hint() ) out.reserve( *hint );
          while ( Deserializer* element = seq.next_element() ) {
            T value{};
            data_converter< T >::deserialize( *element, value );
            out.push_back( std::move(value) );
          }
        }
      } visitor( out );
      d.deserialize_any( visitor );
    }
  };

  template < typename K, typename V >
  struct data_converter< std::map< K, V > > {
    static void serialize( Serializer& s, const std::map< K, V >& m ) {
      s.begin_map( m.size() );
      for ( const auto& [k, v] : m ) {
        data_converter< K >::serialize( s, k );
        data_converter< V >::serialize( s, v );
      }
      s.end_map();
    }

    static void deserialize( Deserializer& d, std::map< K, V >& out ) {
      struct MapVisitor : Visitor {
        std::map< K, V >& out;
        explicit MapVisitor( std::map< K, V >& o ) : out( o ) {}
        std::string expecting() const override { return "a map"; }
        void visit_map( MapAccess& map ) override {
          out.clear();
          while ( Deserializer* key_de = map.next_key() ) {
            K key{};
            data_converter< K >::deserialize( *key_de, key );
            V value{};
            data_converter< V >::deserialize( map.next_value(), value );
            // Keys that differ in YAML may coincide after conversion,
            // e.g. 1 and "1" as std::string keys
            if ( !out.emplace( std::move(key), std::move(value) ).second ) {
              internal::throw_error( ErrorKind::DuplicateMapKey,
                "duplicate entry after key conversion" );
            }
          }
        }
      } visitor( out );
      d.deserialize_any( visitor );
    }
  };

  template < typename T >
  struct data_converter< std::optional< T > > {
    static void serialize( Serializer& s, const std::optional< T >& v ) {
      if ( v ) data_converter< T >::serialize( s, *v );
      else s.serialize_null();
    }

    static void deserialize( Deserializer& d, std::optional< T >& out ) {
      if ( d.is_null() ) {
        d.deserialize_ignored();
        out.reset();
        return;
      }
      T value{};
      data_converter< T >::deserialize( d, value );
      out = std::move( value );
    }
  };

} // namespace yodec

inline void yodec::Serializer::serialize_number( const Number& n ) {
  switch ( n.kind() ) {
    case Number::Kind::PosInt: this->serialize_u64( *n.as_u64() ); break;
    case Number::Kind::NegInt: this->serialize_i64( *n.as_i64() ); break;
    case Number::Kind::Float: this->serialize_f64( n.as_f64() ); break;
  }
}

inline void yodec::Serializer::serialize_bytes(
  const std::vector< std::uint8_t >& )
{
  internal::throw_error( ErrorKind::Custom,
    "serialization and deserialization of bytes in YAML is not implemented" );
}

inline void yodec::EnumAccess::unit_variant() {
  Deserializer* d = this->payload();
  if ( !d ) return;
  if ( !d->is_null() ) {
    std::ostringstream oss;
    oss << "invalid type: newtype variant, expected unit variant '"
      << this->variant() << '\'';
    internal::throw_error( ErrorKind::InvalidType, oss.str() );
  }
  d->deserialize_ignored();
}

[[noreturn]] inline void yodec::Visitor::invalid_type(
  const std::string& unexpected ) const
{
  internal::throw_error( ErrorKind::InvalidType,
    "invalid type: " + unexpected + ", expected " + this->expecting() );
}

inline void yodec::Visitor::visit_null() { this->invalid_type( "null" ); }

inline void yodec::Visitor::visit_bool( bool v ) {
  this->invalid_type( std::string("boolean `") + ( v ? "true" : "false" )
    + '`' );
}

inline void yodec::Visitor::visit_i64( std::int64_t v ) {
  this->invalid_type( "integer `" + std::to_string(v) + '`' );
}

inline void yodec::Visitor::visit_u64( std::uint64_t v ) {
  this->invalid_type( "integer `" + std::to_string(v) + '`' );
}

inline void yodec::Visitor::visit_f64( double v ) {
  this->invalid_type( "floating point `" + Number(v).to_string() + '`' );
}

inline void yodec::Visitor::visit_str( std::string_view v ) {
  this->invalid_type( "string \"" + std::string(v) + '"' );
}

inline void yodec::Visitor::visit_seq( SeqAccess& ) {
  this->invalid_type( "sequence" );
}

inline void yodec::Visitor::visit_map( MapAccess& ) {
  this->invalid_type( "map" );
}

inline void yodec::Visitor::visit_enum( EnumAccess& ) {
  this->invalid_type( "enum" );
}

inline void yodec::Visitor::visit_number( const Number& n ) {
  switch ( n.kind() ) {
    case Number::Kind::PosInt: this->visit_u64( *n.as_u64() ); break;
    case Number::Kind::NegInt: this->visit_i64( *n.as_i64() ); break;
    case Number::Kind::Float: this->visit_f64( n.as_f64() ); break;
  }
}
