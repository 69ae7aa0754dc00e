// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <string>
#include <string_view>
#include <vector>

#include "error.hh"
#include "scalar.hh"

namespace yodec {

  enum class QuoteStyle { Plain, Literal, SingleQuoted, DoubleQuoted };

  enum class ContainerStyle { Block, Flow };

  // Which writer produces the text: the libyaml emitter, or fkYAML fed a
  // resolved Value Tree
  enum class Backend { Emitter, Pretty };

  // Output formatting choices. Passed by value to each Encoder.
  struct PrettyPolicy {

    static constexpr int DEFAULT_INDENT_WIDTH = 2;
    static constexpr int MIN_INDENT_WIDTH = 2;
    static constexpr int MAX_INDENT_WIDTH = 9;

    int indent_width = DEFAULT_INDENT_WIDTH;
    bool prefer_flow_for_empty = true;
    ContainerStyle container_style = ContainerStyle::Block;
    std::vector< QuoteStyle > quote_style_preference = {
      QuoteStyle::Plain, QuoteStyle::Literal, QuoteStyle::SingleQuoted,
      QuoteStyle::DoubleQuoted
    };
    Backend backend = Backend::Emitter;

    // Throws a Custom error for settings the emitter cannot honor
    void validate() const;
  };

  // True if the string can be written in the given style and read back
  // unchanged
  inline bool can_represent( QuoteStyle style, std::string_view text );

  // First style of the policy's preference list that represents the text,
  // falling back to double quotes
  inline QuoteStyle select_quote_style( const PrettyPolicy& policy,
    std::string_view text );

namespace internal {

  // Control characters other than tab and line feed, and DEL
  inline bool is_control( unsigned char c ) {
    return ( c < 0x20 && c != '\t' && c != '\n' ) || c == 0x7F;
  }

  inline bool is_indicator( char c ) {
    static const std::string INDICATORS = "-?:,[]{}#&*!|>'\"%@`";
    return INDICATORS.find( c ) != std::string::npos;
  }

  inline bool is_blank( char c ) { return c == ' ' || c == '\t'; }

  inline bool plain_allowed( std::string_view text ) {
    if ( text.empty() ) return false;
    if ( !plain_reads_as_string(text) ) return false;
    // A plain "<<" key would be read as a merge key
    if ( text == MERGE_KEY ) return false;
    if ( is_indicator( text.front() ) ) return false;
    if ( is_blank( text.front() ) || is_blank( text.back() ) ) return false;
    if ( text.back() == ':' ) return false;
    if ( text.compare(0, 3, "---") == 0 || text.compare(0, 3, "...") == 0 ) {
      return false;
    }
    if ( text.find(": ") != std::string_view::npos
      || text.find(" #") != std::string_view::npos
      || text.find(":\t") != std::string_view::npos
      || text.find("\t#") != std::string_view::npos )
    {
      return false;
    }
    for ( char c : text ) {
      if ( c == '\n' || c == '\t' || is_control(c) ) return false;
    }
    return true;
  }

  inline bool literal_allowed( std::string_view text ) {
    if ( text.find('\n') == std::string_view::npos ) return false;
    for ( std::size_t i = 0; i < text.size(); ++i ) {
      const char c = text[ i ];
      if ( c == '\r' || is_control(c) ) return false;
      if ( c == '\n' && i > 0 && is_blank( text[i - 1] ) ) return false;
    }
    return !is_blank( text.back() );
  }

  inline bool single_quoted_allowed( std::string_view text ) {
    for ( char c : text ) {
      if ( c == '\n' || c == '\r' || is_control(c) ) return false;
    }
    return true;
  }

} // namespace yodec::internal

} // namespace yodec

inline void yodec::PrettyPolicy::validate() const {
  if ( indent_width < MIN_INDENT_WIDTH || indent_width > MAX_INDENT_WIDTH ) {
    internal::throw_error( ErrorKind::Custom, "indent width "
      + std::to_string( indent_width ) + " is outside the supported range "
      + std::to_string( MIN_INDENT_WIDTH ) + ".."
      + std::to_string( MAX_INDENT_WIDTH ) );
  }
}

inline bool yodec::can_represent( QuoteStyle style, std::string_view text ) {
  switch ( style ) {
    case QuoteStyle::Plain: return internal::plain_allowed( text );
    case QuoteStyle::Literal: return internal::literal_allowed( text );
    case QuoteStyle::SingleQuoted: return internal::single_quoted_allowed( text );
    case QuoteStyle::DoubleQuoted: return true;
  }
  return false;
}

inline yodec::QuoteStyle yodec::select_quote_style( const PrettyPolicy& policy,
  std::string_view text )
{
  for ( QuoteStyle style : policy.quote_style_preference ) {
    if ( can_represent( style, text ) ) return style;
  }
  return QuoteStyle::DoubleQuoted;
}
