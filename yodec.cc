// ╻ ╻┏━┓╺┳┓┏━╸┏━╸
// ┗┳┛┃ ┃ ┃┃┣╸ ┃
//  ╹ ┗━┛╺┻┛┗━╸┗━╸
//  YAML Object DEcoding & enCoding
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>

// Standard library includes
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "yodec.hh"

namespace {

  const char* USAGE = "usage: yodec [--indent N] [--flow] [--pretty] < in.yaml";

  yodec::PrettyPolicy parse_args( int argc, char* argv[] ) {
    yodec::PrettyPolicy policy;
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( arg == "--indent" ) {
        if ( i + 1 >= argc ) throw std::invalid_argument( USAGE );
        policy.indent_width = std::stoi( argv[++i] );
      }
      else if ( arg == "--flow" ) {
        policy.container_style = yodec::ContainerStyle::Flow;
      }
      else if ( arg == "--pretty" ) {
        policy.backend = yodec::Backend::Pretty;
      }
      else {
        throw std::invalid_argument( "unknown option '" + arg + "'\n"
          + USAGE );
      }
    }
    policy.validate();
    return policy;
  }

}

int main( int argc, char* argv[] ) {
  try {
    const yodec::Encoder encoder( parse_args(argc, argv) );
    yodec::Decoder decoder;
    std::vector< yodec::Value > docs = decoder.decode_all< yodec::Value >(
      std::cin );
    std::cout << encoder.encode_all( docs );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[yodec] error: " << ex.what() << "\n";
    return 1;
  }
}
