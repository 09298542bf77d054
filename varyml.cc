#include "varyml.hh"

// Filter: dialect text on stdin, repacked structure as plain YAML on stdout
int main() {
  try {
    const varyml::Parser parser;
    varyml::ordered_node repacked = parser.parse( std::cin );
    std::cout << varyml::ordered_node::serialize( repacked );
    return 0;
  } catch ( const varyml::error& ex ) {
    std::cerr << "[varyml] error: " << ex.what() << "\n";
    return 1;
  } catch ( const std::exception& ex ) {
    std::cerr << "[varyml] unexpected error: " << ex.what() << "\n";
    return 1;
  }
}
