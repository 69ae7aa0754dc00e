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
#include <stdexcept>
#include <string>
#include <utility>

namespace yodec {

  // Categories of failure reported by the codec
  enum class ErrorKind {
    Syntax, // Malformed YAML grammar reported by the scanner
    UnexpectedEvent, // Event sequence that cannot be interpreted
    UnknownAnchor, // Alias to an anchor not bound earlier in the document
    DuplicateMapKey, // Structurally equal keys in one mapping
    InvalidTag, // Tag conflicting with the node's resolved shape
    RecursionLimitExceeded, // Nesting/alias-expansion depth ceiling hit
    RepetitionLimitExceeded, // Too many alias replays in one document
    NumberOverflow, // Integer literal wider than 64 bits where one is required
    InvalidType, // Node shape does not match what the target expects
    InvalidValue, // Right shape, unacceptable value (e.g. out of range)
    MoreThanOneDocument, // Single-document entry point fed a stream
    Emitter, // Output rejected by the emitter
    Custom // Raised by a data_converter or by configuration checks
  };

  inline const char* to_string( ErrorKind kind ) {
    switch ( kind ) {
      case ErrorKind::Syntax: return "syntax";
      case ErrorKind::UnexpectedEvent: return "unexpected event";
      case ErrorKind::UnknownAnchor: return "unknown anchor";
      case ErrorKind::DuplicateMapKey: return "duplicate map key";
      case ErrorKind::InvalidTag: return "invalid tag";
      case ErrorKind::RecursionLimitExceeded: return "recursion limit exceeded";
      case ErrorKind::RepetitionLimitExceeded:
        return "repetition limit exceeded";
      case ErrorKind::NumberOverflow: return "number overflow";
      case ErrorKind::InvalidType: return "invalid type";
      case ErrorKind::InvalidValue: return "invalid value";
      case ErrorKind::MoreThanOneDocument: return "more than one document";
      case ErrorKind::Emitter: return "emitter";
      case ErrorKind::Custom: return "custom";
    }
    return "unknown";
  }

  // Location of an event in the input text. Line and column are zero-based,
  // as the scanner reports them; rendered messages use one-based numbers.
  struct Mark {
    std::size_t index = 0; // byte offset
    std::size_t line = 0;
    std::size_t column = 0;
  };

  class Error : public std::runtime_error {
  public:

    Error( ErrorKind kind, const std::string& message,
      std::optional< Mark > mark = std::nullopt, std::string path = "" );

    // Error raised from a data_converter without position information. The
    // deserializer attaches the position of the offending node.
    static Error custom( const std::string& message );

    inline ErrorKind kind() const { return kind_; }
    inline const std::string& message() const { return message_; }
    inline const std::optional< Mark >& location() const { return mark_; }
    inline const std::string& path() const { return path_; }

    // Copy of this error located at the given mark and path. Location
    // information that is already present is kept.
    Error located( const Mark& mark, const std::string& path ) const;

  private:

    static std::string compose( const std::string& message,
      const std::optional< Mark >& mark, const std::string& path );

    ErrorKind kind_;
    std::string message_;
    std::optional< Mark > mark_;
    std::string path_;
  };

namespace internal {

  [[noreturn]] inline void throw_error( ErrorKind kind, const std::string& msg,
    std::optional< Mark > mark = std::nullopt, const std::string& path = "" )
  {
    throw Error( kind, msg, mark, path );
  }

} // namespace yodec::internal

} // namespace yodec

inline yodec::Error::Error( ErrorKind kind, const std::string& message,
  std::optional< Mark > mark, std::string path )
  : std::runtime_error( compose(message, mark, path) ), kind_( kind ),
  message_( message ), mark_( mark ), path_( std::move(path) )
{
}

inline yodec::Error yodec::Error::custom( const std::string& message ) {
  return Error( ErrorKind::Custom, message );
}

inline yodec::Error yodec::Error::located( const Mark& mark,
  const std::string& path ) const
{
  if ( mark_ ) return *this;
  // An empty path refers to the document root and adds nothing
  return Error( kind_, message_, mark, path_.empty() ? path : path_ );
}

// Compose "a.b[0].c: message at line L column C"
inline std::string yodec::Error::compose( const std::string& message,
  const std::optional< Mark >& mark, const std::string& path )
{
  std::ostringstream oss;
  if ( !path.empty() ) oss << path << ": ";
  oss << message;
  if ( mark ) {
    oss << " at line " << mark->line + 1 << " column " << mark->column + 1;
  }
  return oss.str();
}
