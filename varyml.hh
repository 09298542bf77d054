// ╻ ╻┏━┓┏━┓╻ ╻┏┳┓╻
// ┃┏┛┣━┫┣┳┛┗┳┛┃┃┃┃
// ┗┛ ╹ ╹╹┗╸ ╹ ╹ ╹┗━╸
//  Variant YAML: duplicate keys & inline values over block mappings
//  version 0.1.0 | MIT License
#pragma once

// Standard library includes
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <locale>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// Log levels: 0 none, 1 errors, 2 warnings, 3 debug
#ifndef VARYML_LOG_LEVEL
#define VARYML_LOG_LEVEL 1
#endif

#define VARYML_LOG_LINE( level, stream_expr ) \
  do { \
    std::ostringstream varyml_log_oss_; \
    varyml_log_oss_ << stream_expr; \
    ::varyml::internal::log_str( level, __FILE__, __LINE__, \
      varyml_log_oss_.str() ); \
  } while ( 0 )

#if VARYML_LOG_LEVEL >= 3
#define VARYML_LOGD( stream_expr ) VARYML_LOG_LINE( "DEBUG", stream_expr )
#else
#define VARYML_LOGD( stream_expr ) do {} while ( 0 )
#endif

#if VARYML_LOG_LEVEL >= 2
#define VARYML_LOGW( stream_expr ) VARYML_LOG_LINE( "WARNING", stream_expr )
#else
#define VARYML_LOGW( stream_expr ) do {} while ( 0 )
#endif

#if VARYML_LOG_LEVEL >= 1
#define VARYML_LOGE( stream_expr ) VARYML_LOG_LINE( "ERROR", stream_expr )
#else
#define VARYML_LOGE( stream_expr ) do {} while ( 0 )
#endif

namespace varyml {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the input
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  // Error hierarchy. Everything thrown by this library derives from error.
  class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // The rewritten text was rejected by the conventional YAML decoder, or the
  // source used a key reserved for duplicate disambiguation
  class parse_error : public error {
  public:
    using error::error;
  };

  // Accessor navigation failures
  class lookup_error : public error {
  public:
    using error::error;
  };

  class key_not_found : public lookup_error {
  public:
    using lookup_error::lookup_error;
  };

  class index_out_of_range : public lookup_error {
  public:
    using lookup_error::lookup_error;
  };

  // A path segment of unrecognized shape
  class unsupported_segment : public error {
  public:
    using error::error;
  };

namespace internal {

  // Constants defining the reserved names of the dialect. This block provides
  // a single location for easy editing to allow for future changes.
  inline constexpr char PATH_DELIMITER = '.';
  inline constexpr char SYNTHETIC_SEPARATOR = '_';
  inline constexpr char COMMENT_MARKER = '#';
  inline constexpr char KEY_VALUE_SEPARATOR = ':';
  inline constexpr int DEFAULT_DUMP_INDENT = 4;

  inline const std::string OWN_VALUE_KEY = "__val__";
  inline const std::string DEFAULT_SYNTHETIC_PREFIX = "varyml";

  inline void log_str( const char* level, const char* file, int line,
    const std::string& msg )
  {
    const char* name = file;
    for ( const char* p = file; *p; ++p ) {
      if ( *p == '/' || *p == '\\' ) name = p + 1;
    }
    std::cerr << level << ' ' << name << ':' << line << ": " << msg << '\n';
  }

} // namespace varyml::internal

  // One key on the path from the root to a node
  struct Key {
    std::string name;
  };

  // key[index]: element of the sequence of variants stored at key
  struct IndexedKey {
    std::string name;
    std::size_t index = 0;
  };

  // Value extraction: dereferences the own-value slot of the target, or
  // projects it out of every variant when the target is a sequence
  struct Extract {
    std::variant< Key, IndexedKey > target;
  };

  // A single accessor path element. Built implicitly from text ("key" or
  // "key[2]") or from an Extract made with val().
  class Segment {
  public:
    using value_type = std::variant< Key, IndexedKey, Extract >;

    Segment( const char* text );
    Segment( const std::string& text );
    Segment( Key key ) : value_( std::move(key) ) {}
    Segment( IndexedKey key ) : value_( std::move(key) ) {}
    Segment( Extract ex ) : value_( std::move(ex) ) {}

    const value_type& value() const { return value_; }

    // Human-readable form used in error messages, e.g. "val(key[2])"
    std::string str() const;

    // Tagged form, unique per segment, used as the memoization key
    std::string canonical() const;

  private:
    value_type value_;
  };

  using Path = std::vector< Segment >;

  // Build a value-extraction segment from "key" or "key[i]"
  inline Extract val( const std::string& text );

  // One duplicate occurrence recorded by the rewriter: the key as written
  // (unquoted) and the path of its parent, which may itself contain
  // synthetic names
  struct RegistryEntry {
    std::vector< std::string > parent_path;
    std::string key;

    // Full dotted path, e.g. "val2.val3"
    std::string path() const;
  };

  // Synthetic id -> original location
  using KeyRegistry = std::map< std::size_t, RegistryEntry >;

  // Output of the duplicate-key rewriting pass
  struct Preprocessed {
    std::vector< std::string > lines;
    KeyRegistry registry;

    std::string text() const;
  };

  // Render a repacked tree back to dialect text
  inline std::string dumps( const ordered_node& node,
    int indent = internal::DEFAULT_DUMP_INDENT );

  // Queryable, mutable wrapper around a repacked tree. Reads are memoized per
  // path; any write drops the whole cache. get() and set() are serialized on
  // an internal mutex.
  class Document {
  public:
    explicit Document( ordered_node repacked );
    Document( const Document& other );
    Document& operator=( const Document& other );

    ordered_node get( const Path& path ) const;
    void set( const Path& path, const ordered_node& value );

    // Read-only view of the tree. Not synchronized with set().
    const ordered_node& data() const { return data_; }

    // Deep copy of the current tree
    ordered_node copy() const;

    std::string dump( int indent = internal::DEFAULT_DUMP_INDENT ) const;

    // Number of memoized read results
    std::size_t cached_paths() const;

  private:
    ordered_node data_;
    mutable std::mutex mutex_;
    mutable std::map< std::string, ordered_node > cache_;
  };

  class Parser {
  public:
    // Constructor optionally takes a non-default prefix for the synthetic
    // keys that stand in for duplicates during decoding
    inline explicit Parser(
      std::string synthetic_prefix = internal::DEFAULT_SYNTHETIC_PREFIX )
      : prefix_( std::move(synthetic_prefix) ) {}

    // Full pipeline: rewrite -> decode -> repack
    ordered_node parse( std::istream& in ) const;
    ordered_node parse( const std::string& text ) const;

    Document load( std::istream& in ) const;
    Document load( const std::string& text ) const;

    // Processing stages, exposed individually
    Preprocessed preprocess( const std::string& text ) const;
    static ordered_node decode( const Preprocessed& pre );
    void repack( ordered_node& plain, const KeyRegistry& registry ) const;

    std::string synthetic_key( std::size_t id ) const;

  private:
    std::string prefix_;

    bool is_reserved_key( const std::string& key ) const;
  };

namespace internal {

  // Per-line result of the classifier
  struct LineInfo {
    bool is_key_value = false;
    std::size_t depth = 0;
    std::string key;
    std::string value;
  };

  inline bool is_space( char c ) {
    return c == ' ' || c == '\t';
  }

  inline std::size_t leading_whitespace( const std::string& line ) {
    std::size_t n = 0;
    while ( n < line.size() && is_space(line[n]) ) ++n;
    return n;
  }

  inline std::string trim( const std::string& s ) {
    std::size_t b = leading_whitespace( s );
    std::size_t e = s.size();
    while ( e > b && (is_space(s[e - 1]) || s[e - 1] == '\r') ) --e;
    return s.substr( b, e - b );
  }

  // Blank lines and full-line comments carry no structure
  inline bool is_blank_or_comment( const std::string& line ) {
    const std::string t = trim( line );
    return t.empty() || t.front() == COMMENT_MARKER;
  }

  // Split on '\n', dropping a trailing '\r' from each line
  inline std::vector< std::string > split_lines( const std::string& text ) {
    std::vector< std::string > lines;
    std::size_t start = 0;
    while ( true ) {
      std::size_t pos = text.find( '\n', start );
      std::string line = text.substr( start,
        pos == std::string::npos ? std::string::npos : pos - start );
      if ( !line.empty() && line.back() == '\r' ) line.pop_back();
      lines.push_back( std::move(line) );
      if ( pos == std::string::npos ) break;
      start = pos + 1;
    }
    return lines;
  }

  // Connects key segments into a full path string with PATH_DELIMITER
  inline std::string join_path( const std::vector< std::string >& segs ) {
    std::string s;
    for ( std::size_t i = 0; i < segs.size(); ++i ) {
      if ( i ) s += PATH_DELIMITER;
      s += segs[ i ];
    }
    return s;
  }

  // Leading whitespace length of the first indented non-blank line, if any
  inline std::optional< std::size_t > compute_indent_unit(
    const std::vector< std::string >& lines )
  {
    for ( const auto& line : lines ) {
      if ( is_blank_or_comment(line) ) continue;
      std::size_t ws = leading_whitespace( line );
      if ( ws > 0 ) return ws;
    }
    return std::nullopt;
  }

  inline LineInfo classify_line( const std::string& line,
    std::size_t indent_unit )
  {
    LineInfo info;
    info.depth = leading_whitespace( line ) / std::max<std::size_t>(
      indent_unit, 1 );

    std::size_t colon = line.find( KEY_VALUE_SEPARATOR );
    if ( colon == std::string::npos ) return info;

    info.is_key_value = true;
    info.key = trim( line.substr(0, colon) );
    info.value = trim( line.substr(colon + 1) );
    return info;
  }

  // Strip one level of matching quotes from a key as written, so that the
  // registry names keys the way the decoder will
  inline std::string unquote_key( const std::string& key ) {
    if ( key.size() >= 2 && (key.front() == '"' || key.front() == '\'')
      && key.back() == key.front() )
    {
      return key.substr( 1, key.size() - 2 );
    }
    return key;
  }

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  // Shortest decimal text that reads back as the same double. A '.' is
  // always present so the text never decodes as an integer.
  inline std::string format_float( double d ) {
    if ( std::isnan(d) ) return ".nan";
    if ( std::isinf(d) ) return d < 0 ? "-.inf" : ".inf";

    std::string text;
    for ( int precision = std::numeric_limits< double >::digits10;
      precision <= std::numeric_limits< double >::max_digits10; ++precision )
    {
      std::ostringstream oss;
      oss.imbue( std::locale::classic() );
      oss << std::setprecision( precision ) << d;
      text = oss.str();
      if ( std::strtod(text.c_str(), nullptr) == d ) break;
    }

    if ( text.find('.') == std::string::npos ) {
      std::size_t exp = text.find_first_of( "eE" );
      text.insert( exp == std::string::npos ? text.size() : exp, ".0" );
    }
    return text;
  }

  inline std::string to_string_any( const ordered_node& n ) {
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return n.get_value< bool >() ? "true" : "false";
    if ( n.is_float_number() ) return format_float(
      to_native_checked< double >( n )
    );

    // We did not match any of the scalar types, so fall back to serialization
    return ordered_node::serialize( n );
  }

  // True when `text` written as a plain scalar decodes back to the same
  // string. Anything the decoder would type, split or reject is not plain.
  inline bool reads_back_plain( const std::string& text ) {
    if ( text.empty() ) return false;
    try {
      const ordered_node n = ordered_node::deserialize( text );
      return n.is_string() && to_native_checked< std::string >( n ) == text;
    }
    catch ( const fkyaml::exception& ) {
      return false;
    }
  }

  inline std::string single_quoted( const std::string& s ) {
    std::string out( 1, '\'' );
    for ( char c : s ) {
      if ( c == '\'' ) out += '\'';
      out += c;
    }
    return out + '\'';
  }

  inline std::string double_quoted( const std::string& s ) {
    std::string out( 1, '"' );
    for ( char c : s ) {
      switch ( c ) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out += c;
      }
    }
    return out + '"';
  }

  // Text of a string scalar that decodes back to the same string
  inline std::string string_literal( const std::string& s ) {
    if ( reads_back_plain(s) ) return s;
    if ( s.find_first_of("\n\r\t") == std::string::npos ) {
      return single_quoted( s );
    }
    return double_quoted( s );
  }

  // Key as emitted into the rewritten text. Keys already quoted in the
  // source pass through; plain keys the decoder would type ("True", "1.5")
  // are single-quoted so the decoded key keeps its source spelling.
  inline std::string key_literal( const std::string& key ) {
    if ( unquote_key(key) != key || reads_back_plain(key) ) return key;
    return single_quoted( key );
  }

  inline bool has_own_value( const ordered_node& n ) {
    return n.is_mapping() && n.contains( OWN_VALUE_KEY );
  }

  // Key lines reach the decoder quoted, but flow mappings inside values
  // ("k: {1: a}") still decode with typed keys. Accessor paths are text, so
  // every mapping key is rewritten to its string form.
  inline void normalize_keys( ordered_node& node ) {
    if ( node.is_mapping() ) {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [mk, mv] : node.map_items() ) {
        ordered_node v = mv;
        normalize_keys( v );
        out[ to_string_any(mk) ] = v;
      }
      node = out;
    }
    else if ( node.is_sequence() ) {
      for ( std::size_t i = 0; i < node.size(); ++i ) {
        normalize_keys( node.at(i) );
      }
    }
  }

  // Field-wise merge of mapping variants. A field present in more than one
  // variant becomes a sequence of its values in variant order.
  inline ordered_node merge_mappings( const std::vector< ordered_node >& maps )
  {
    std::vector< std::string > order;
    std::unordered_map< std::string, std::vector< ordered_node > > fields;
    for ( const auto& m : maps ) {
      for ( const auto& [mk, mv] : m.map_items() ) {
        const std::string k = mk.get_value< std::string >();
        auto& bucket = fields[ k ];
        if ( bucket.empty() ) order.push_back( k );
        bucket.push_back( mv );
      }
    }

    ordered_node merged = ordered_node::mapping();
    for ( const auto& k : order ) {
      const auto& bucket = fields.at( k );
      merged[ k ] = bucket.size() > 1 ? make_node_from( bucket )
        : bucket.front();
    }
    return merged;
  }

  // Split "name" or "name[index]" into a key segment
  inline std::variant< Key, IndexedKey > parse_key_text(
    const std::string& text )
  {
    std::size_t open = text.find( '[' );
    if ( open == std::string::npos ) {
      if ( text.find(']') != std::string::npos ) {
        throw unsupported_segment( "Unsupported path segment '" + text
          + "' (unbalanced ']')" );
      }
      return Key{ text };
    }

    const std::string name = text.substr( 0, open );
    std::size_t close = text.find( ']', open );
    if ( name.empty() || close == std::string::npos
      || close + 1 != text.size() || close == open + 1 )
    {
      throw unsupported_segment( "Unsupported path segment '" + text
        + "' (expected key or key[<integer>])" );
    }

    const std::string digits = text.substr( open + 1, close - open - 1 );
    for ( char c : digits ) {
      if ( c < '0' || c > '9' ) {
        throw unsupported_segment( "Unsupported path segment '" + text
          + "' (index must be a non-negative integer)" );
      }
    }

    std::size_t index = 0;
    try {
      index = static_cast< std::size_t >( std::stoull(digits) );
    }
    catch ( const std::out_of_range& ) {
      throw unsupported_segment( "Unsupported path segment '" + text
        + "' (index too large)" );
    }
    return IndexedKey{ name, index };
  }

  inline std::string key_text( const std::variant< Key, IndexedKey >& k ) {
    if ( const Key* plain = std::get_if< Key >( &k ) ) return plain->name;
    const IndexedKey& ik = std::get< IndexedKey >( k );
    return ik.name + '[' + std::to_string( ik.index ) + ']';
  }

  // Where-am-I prefix for accessor error messages
  inline std::string trail_prefix( const std::string& trail ) {
    return trail.empty() ? std::string( "<root>" ) : trail;
  }

  // Mapping lookup for both const and mutable traversal
  template < typename Node >
  inline Node& child_of( Node& node, const std::string& key,
    const std::string& trail )
  {
    if ( !node.is_mapping() ) {
      throw key_not_found( trail_prefix(trail) + ": cannot look up key '"
        + key + "' in a non-mapping value" );
    }
    if ( !node.contains(key) ) {
      throw key_not_found( trail_prefix(trail) + ": key '" + key
        + "' not found" );
    }
    return node.at( key );
  }

  template < typename Node >
  inline Node& element_of( Node& seq, std::size_t index,
    const std::string& trail )
  {
    if ( !seq.is_sequence() ) {
      throw index_out_of_range( trail_prefix(trail) + ": index "
        + std::to_string(index) + " applied to a value that is not a"
        " sequence of variants" );
    }
    if ( index >= seq.size() ) {
      std::ostringstream oss;
      oss << trail_prefix( trail ) << ": index " << index
        << " out of range (size " << seq.size() << ")";
      throw index_out_of_range( oss.str() );
    }
    return seq.at( index );
  }

  inline void append_trail( std::string& trail, const std::string& piece ) {
    if ( !trail.empty() ) trail += PATH_DELIMITER;
    trail += piece;
  }

  // Read-side resolution. Non-projecting steps walk pointers into the
  // tree; a projection materializes a fresh sequence in `projected`.
  inline ordered_node resolve_path( const ordered_node& root,
    const Path& path )
  {
    const ordered_node* cur = &root;
    ordered_node projected;
    std::string trail;

    for ( const auto& seg : path ) {
      const auto& v = seg.value();

      if ( const Key* k = std::get_if< Key >( &v ) ) {
        cur = &child_of( *cur, k->name, trail );
      }
      else if ( const IndexedKey* ik = std::get_if< IndexedKey >( &v ) ) {
        const std::string where = trail;
        append_trail( trail, ik->name );
        cur = &element_of( child_of(*cur, ik->name, where), ik->index,
          trail );
        trail += '[' + std::to_string( ik->index ) + ']';
        continue;
      }
      else {
        const Extract& ex = std::get< Extract >( v );
        if ( const Key* k = std::get_if< Key >( &ex.target ) ) {
          const ordered_node& target = child_of( *cur, k->name, trail );
          if ( target.is_sequence() ) {
            std::vector< ordered_node > out;
            out.reserve( target.size() );
            for ( std::size_t i = 0; i < target.size(); ++i ) {
              const ordered_node& el = target.at( i );
              out.push_back( has_own_value(el) ? el.at(OWN_VALUE_KEY) : el );
            }
            ordered_node next = make_node_from( out );
            projected = std::move( next );
            cur = &projected;
          }
          else {
            // A single variant ends the lookup, own-value slot included
            return target;
          }
        }
        else {
          const IndexedKey& ik = std::get< IndexedKey >( ex.target );
          std::string at = trail;
          append_trail( at, ik.name );
          const ordered_node& el = element_of(
            child_of(*cur, ik.name, trail), ik.index, at );
          cur = has_own_value( el ) ? &el.at( OWN_VALUE_KEY ) : &el;
        }
      }
      append_trail( trail, seg.str() );
    }
    return *cur;
  }

  // Assign while keeping sibling children: a mapping that owns a value only
  // has its slot replaced
  inline void assign_preserving( ordered_node& target,
    const ordered_node& value )
  {
    if ( has_own_value(target) ) {
      target[ OWN_VALUE_KEY ] = value;
    }
    else {
      target = value;
    }
  }

  inline std::string scalar_text( const ordered_node& n ) {
    if ( n.is_null() ) return std::string();
    if ( n.is_string() ) {
      return string_literal( to_native_checked< std::string >(n) );
    }
    return to_string_any( n );
  }

  inline void dump_mapping( std::ostringstream& out, const ordered_node& map,
    std::size_t level, int indent );

  // Emit one "key: ..." line and its block. A sequence re-emits the key
  // line once per variant.
  inline void dump_entry( std::ostringstream& out, const std::string& key,
    const ordered_node& value, std::size_t level, int indent )
  {
    const std::string pad( level * static_cast< std::size_t >( indent ), ' ' );

    if ( value.is_sequence() ) {
      if ( value.size() == 0 ) {
        out << pad << key << ": []\n";
        return;
      }
      for ( std::size_t i = 0; i < value.size(); ++i ) {
        dump_entry( out, key, value.at(i), level, indent );
      }
      return;
    }
    if ( value.is_mapping() && value.size() == 0 ) {
      out << pad << key << ": {}\n";
      return;
    }

    out << pad << key << KEY_VALUE_SEPARATOR;
    std::string inline_text;
    if ( value.is_mapping() ) {
      if ( value.contains(OWN_VALUE_KEY) ) {
        inline_text = scalar_text( value.at(OWN_VALUE_KEY) );
      }
    }
    else {
      inline_text = scalar_text( value );
    }
    if ( !inline_text.empty() ) out << ' ' << inline_text;
    out << '\n';

    if ( value.is_mapping() ) dump_mapping( out, value, level + 1, indent );
  }

  inline void dump_mapping( std::ostringstream& out, const ordered_node& map,
    std::size_t level, int indent )
  {
    for ( const auto& [mk, mv] : map.map_items() ) {
      const std::string k = to_string_any( mk );
      // Rendered inline on the owner's line
      if ( k == OWN_VALUE_KEY ) continue;
      dump_entry( out, k, mv, level, indent );
    }
  }

} // namespace varyml::internal

} // namespace varyml

// Segment member function definitions
inline varyml::Segment::Segment( const char* text )
  : Segment( std::string(text) ) {}

inline varyml::Segment::Segment( const std::string& text ) {
  std::variant< Key, IndexedKey > k = internal::parse_key_text( text );
  if ( const Key* plain = std::get_if< Key >( &k ) ) value_ = *plain;
  else value_ = std::get< IndexedKey >( k );
}

inline std::string varyml::Segment::str() const {
  if ( const Key* k = std::get_if< Key >( &value_ ) ) return k->name;
  if ( const IndexedKey* ik = std::get_if< IndexedKey >( &value_ ) ) {
    return internal::key_text( *ik );
  }
  return "val(" + internal::key_text( std::get< Extract >(value_).target )
    + ')';
}

inline std::string varyml::Segment::canonical() const {
  if ( const Key* k = std::get_if< Key >( &value_ ) ) return "k:" + k->name;
  if ( const IndexedKey* ik = std::get_if< IndexedKey >( &value_ ) ) {
    return "i:" + std::to_string( ik->index ) + ':' + ik->name;
  }
  const Extract& ex = std::get< Extract >( value_ );
  if ( const Key* k = std::get_if< Key >( &ex.target ) ) {
    return "vk:" + k->name;
  }
  const IndexedKey& ik = std::get< IndexedKey >( ex.target );
  return "vi:" + std::to_string( ik.index ) + ':' + ik.name;
}

inline varyml::Extract varyml::val( const std::string& text ) {
  return Extract{ internal::parse_key_text( text ) };
}

inline std::string varyml::RegistryEntry::path() const {
  std::vector< std::string > segs = parent_path;
  segs.push_back( key );
  return internal::join_path( segs );
}

inline std::string varyml::Preprocessed::text() const {
  std::string out;
  for ( std::size_t i = 0; i < lines.size(); ++i ) {
    if ( i ) out += '\n';
    out += lines[ i ];
  }
  return out;
}

inline std::string varyml::dumps( const ordered_node& node, int indent ) {
  std::ostringstream out;
  if ( node.is_mapping() ) {
    internal::dump_mapping( out, node, 0, indent );
  }
  else if ( !node.is_null() ) {
    out << internal::scalar_text( node ) << '\n';
  }
  return out.str();
}

// Document member function definitions
inline varyml::Document::Document( ordered_node repacked )
  : data_( std::move(repacked) ) {}

inline varyml::Document::Document( const Document& other ) {
  std::lock_guard< std::mutex > lock( other.mutex_ );
  data_ = other.data_;
}

inline varyml::Document& varyml::Document::operator=( const Document& other )
{
  if ( this == &other ) return *this;
  std::scoped_lock lock( mutex_, other.mutex_ );
  data_ = other.data_;
  cache_.clear();
  return *this;
}

inline varyml::ordered_node varyml::Document::get( const Path& path ) const {
  std::string key;
  for ( const auto& seg : path ) {
    key += seg.canonical();
    key += '\0';
  }

  std::lock_guard< std::mutex > lock( mutex_ );
  auto it = cache_.find( key );
  if ( it != cache_.end() ) return it->second;

  ordered_node result = internal::resolve_path( data_, path );
  cache_.emplace( key, result );
  return result;
}

// Write: every segment but the last must name a location in the tree; the
// last one is assigned with the own-value-preserving rule
inline void varyml::Document::set( const Path& path,
  const ordered_node& value )
{
  if ( path.empty() ) {
    throw unsupported_segment( "Cannot assign to an empty path" );
  }

  std::lock_guard< std::mutex > lock( mutex_ );
  ordered_node* target = &data_;
  std::string trail;

  for ( std::size_t i = 0; i + 1 < path.size(); ++i ) {
    const auto& v = path[ i ].value();
    if ( const Key* k = std::get_if< Key >( &v ) ) {
      target = &internal::child_of( *target, k->name, trail );
    }
    else if ( const IndexedKey* ik = std::get_if< IndexedKey >( &v ) ) {
      target = &internal::element_of(
        internal::child_of(*target, ik->name, trail), ik->index,
        trail + ( trail.empty() ? "" : "." ) + ik->name );
    }
    else {
      throw unsupported_segment( internal::trail_prefix(trail)
        + ": value extraction '" + path[i].str()
        + "' may only be the last segment of a write" );
    }
    internal::append_trail( trail, path[i].str() );
  }

  const auto& last = path.back().value();
  if ( const Key* k = std::get_if< Key >( &last ) ) {
    if ( !target->is_mapping() ) {
      throw key_not_found( internal::trail_prefix(trail)
        + ": cannot assign key '" + k->name + "' in a non-mapping value" );
    }
    if ( target->contains(k->name) ) {
      internal::assign_preserving( target->at(k->name), value );
    }
    else {
      ( *target )[ k->name ] = value;
    }
  }
  else {
    const std::variant< Key, IndexedKey > key_seg =
      std::holds_alternative< Extract >( last )
      ? std::get< Extract >( last ).target
      : std::variant< Key, IndexedKey >( std::get< IndexedKey >(last) );

    if ( const Key* k = std::get_if< Key >( &key_seg ) ) {
      internal::assign_preserving(
        internal::child_of(*target, k->name, trail), value );
    }
    else {
      const IndexedKey& ik = std::get< IndexedKey >( key_seg );
      std::string at = trail;
      internal::append_trail( at, ik.name );
      internal::assign_preserving( internal::element_of(
        internal::child_of(*target, ik.name, trail), ik.index, at ), value );
    }
  }

  cache_.clear();
}

inline varyml::ordered_node varyml::Document::copy() const {
  std::lock_guard< std::mutex > lock( mutex_ );
  return data_;
}

inline std::string varyml::Document::dump( int indent ) const {
  std::lock_guard< std::mutex > lock( mutex_ );
  return dumps( data_, indent );
}

inline std::size_t varyml::Document::cached_paths() const {
  std::lock_guard< std::mutex > lock( mutex_ );
  return cache_.size();
}

// Parser member function definitions

inline std::string varyml::Parser::synthetic_key( std::size_t id ) const {
  return prefix_ + internal::SYNTHETIC_SEPARATOR + std::to_string( id );
}

inline bool varyml::Parser::is_reserved_key( const std::string& key ) const {
  const std::string head = prefix_ + internal::SYNTHETIC_SEPARATOR;
  if ( key.size() <= head.size() || key.compare(0, head.size(), head) != 0 )
    return false;
  return std::all_of( key.begin() + head.size(), key.end(),
    []( char c ) { return c >= '0' && c <= '9'; } );
}

// Read from an input stream until end-of-file, then apply full processing
// on the resulting string
inline varyml::ordered_node varyml::Parser::parse( std::istream& in ) const {
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->parse( ss.str() );
}

inline varyml::ordered_node
  varyml::Parser::parse( const std::string& text ) const
{
  // 1) Rename duplicates, inject own-value slots
  Preprocessed pre = this->preprocess( text );

  // 2) Conventional decoding
  ordered_node plain = decode( pre );
  internal::normalize_keys( plain );

  // 3) Fold synthetic keys back into lists of variants
  this->repack( plain, pre.registry );
  return plain;
}

inline varyml::Document varyml::Parser::load( std::istream& in ) const {
  return Document( this->parse(in) );
}

inline varyml::Document varyml::Parser::load( const std::string& text ) const
{
  return Document( this->parse(text) );
}

// Single top-to-bottom pass over a stack of the enclosing keys; occurrences
// are counted per full path, so the second and later occurrences of a path
// are renamed to synthetic keys.
//
// Emitted depth is relative to the shallowest key line: a key at depth d is
// written at level d - base, its injected own-value child at d - base + 1.
inline varyml::Preprocessed
  varyml::Parser::preprocess( const std::string& text ) const
{
  const std::vector< std::string > lines = internal::split_lines( text );
  const std::size_t unit = internal::compute_indent_unit( lines )
    .value_or( 1 );

  std::vector< internal::LineInfo > infos;
  infos.reserve( lines.size() );
  std::optional< std::size_t > base;
  for ( const auto& line : lines ) {
    infos.push_back( internal::classify_line(line, unit) );
    if ( infos.back().is_key_value && !internal::is_blank_or_comment(line) ) {
      base = std::min( base.value_or(infos.back().depth), infos.back().depth );
    }
  }

  // Names the decoder will see for the keys enclosing the current line
  struct Ancestor {
    std::size_t depth;
    std::string name;
  };

  Preprocessed out;
  std::vector< Ancestor > ancestors;
  std::unordered_map< std::string, std::size_t > occurrences;
  std::size_t next_id = 0;

  for ( std::size_t i = 0; i < lines.size(); ++i ) {
    if ( internal::is_blank_or_comment(lines[i]) ) continue;

    const internal::LineInfo& info = infos[ i ];
    if ( !info.is_key_value ) {
      VARYML_LOGD( "line " << i + 1 << ": no '"
        << internal::KEY_VALUE_SEPARATOR << "', skipped" );
      continue;
    }

    const std::string key = internal::unquote_key( info.key );
    if ( this->is_reserved_key(key) ) {
      std::ostringstream oss;
      oss << "line " << i + 1 << ": key '" << key
        << "' is reserved for duplicate-key disambiguation";
      throw parse_error( oss.str() );
    }

    while ( !ancestors.empty() && ancestors.back().depth >= info.depth ) {
      ancestors.pop_back();
    }
    std::vector< std::string > parent_path;
    for ( const auto& a : ancestors ) parent_path.push_back( a.name );
    std::vector< std::string > full = parent_path;
    full.push_back( key );

    std::string active = key;
    std::string emitted = internal::key_literal( info.key );
    if ( ++occurrences[ internal::join_path(full) ] > 1 ) {
      const std::size_t id = next_id++;
      out.registry[ id ] = RegistryEntry{ parent_path, key };
      active = emitted = this->synthetic_key( id );
      VARYML_LOGD( "line " << i + 1 << ": duplicate '"
        << internal::join_path(full) << "' renamed to '" << emitted << "'" );
    }
    ancestors.push_back( Ancestor{ info.depth, active } );

    // Look ahead to the next key line; dropped lines are not children
    std::optional< std::size_t > child_depth;
    for ( std::size_t j = i + 1; j < lines.size(); ++j ) {
      if ( internal::is_blank_or_comment(lines[j]) ) continue;
      if ( !infos[j].is_key_value ) continue;
      if ( infos[j].depth > info.depth ) child_depth = infos[ j ].depth;
      break;
    }

    const std::size_t first = *base;
    const std::size_t level = info.depth - first;
    const std::string pad( level * unit, ' ' );
    if ( child_depth ) {
      out.lines.push_back( pad + emitted + internal::KEY_VALUE_SEPARATOR );
      if ( !info.value.empty() ) {
        // Same column as the children, which may sit more than one level in
        out.lines.push_back( std::string((*child_depth - first) * unit, ' ')
          + internal::OWN_VALUE_KEY + internal::KEY_VALUE_SEPARATOR + ' '
          + info.value );
      }
    }
    else if ( info.value.empty() ) {
      out.lines.push_back( pad + emitted + internal::KEY_VALUE_SEPARATOR );
    }
    else {
      out.lines.push_back( pad + emitted + internal::KEY_VALUE_SEPARATOR
        + ' ' + info.value );
    }
  }

  return out;
}

inline varyml::ordered_node varyml::Parser::decode( const Preprocessed& pre )
{
  try {
    return ordered_node::deserialize( pre.text() );
  }
  catch ( const fkyaml::exception& ex ) {
    VARYML_LOGE( "decoding " << pre.lines.size() << " rewritten lines: "
      << ex.what() );
    throw parse_error( std::string("Conventional YAML decoding failed: ")
      + ex.what() );
  }
}

// Groups synthetic ids by (parent path, key) and folds each group into the
// original key, deepest parent path first so that synthetic names inside a
// parent path still exist when that group is visited
inline void varyml::Parser::repack( ordered_node& plain,
  const KeyRegistry& registry ) const
{
  struct Group {
    std::vector< std::string > parent_path;
    std::string key;
    std::vector< std::size_t > ids;
  };

  std::vector< Group > groups;
  std::map< std::string, std::size_t > group_index;
  for ( const auto& [id, entry] : registry ) {
    // '\0' cannot appear in a key, so this is an unambiguous group name
    std::string name;
    for ( const auto& p : entry.parent_path ) name += p + '\0';
    name += entry.key;

    auto it = group_index.find( name );
    if ( it == group_index.end() ) {
      group_index.emplace( name, groups.size() );
      groups.push_back( Group{ entry.parent_path, entry.key, { id } } );
    }
    else {
      groups[ it->second ].ids.push_back( id );
    }
  }

  std::stable_sort( groups.begin(), groups.end(),
    []( const Group& a, const Group& b ) {
      return a.parent_path.size() > b.parent_path.size();
    } );

  for ( const auto& group : groups ) {
    ordered_node* parent = &plain;
    for ( const auto& part : group.parent_path ) {
      if ( !parent->is_mapping() || !parent->contains(part) ) {
        parent = nullptr;
        break;
      }
      parent = &parent->at( part );
    }
    if ( !parent || !parent->is_mapping() ) {
      VARYML_LOGW( "parent '" << internal::join_path(group.parent_path)
        << "' of duplicate key '" << group.key << "' vanished, skipped" );
      continue;
    }

    // Original occurrence first, then synthetic ones in id order
    std::vector< ordered_node > values;
    if ( parent->contains(group.key) ) values.push_back(
      parent->at(group.key) );

    std::unordered_set< std::string > synthetic;
    for ( std::size_t id : group.ids ) {
      const std::string name = this->synthetic_key( id );
      synthetic.insert( name );
      if ( parent->contains(name) ) values.push_back( parent->at(name) );
    }
    if ( values.empty() ) continue;

    const bool all_mappings = std::all_of( values.begin(), values.end(),
      []( const ordered_node& v ) { return v.is_mapping(); } );

    ordered_node folded = all_mappings
      ? internal::make_node_from( std::vector< ordered_node >{
          internal::merge_mappings(values) } )
      : internal::make_node_from( values );

    // Rebuild the parent in place of erasing, keeping the key order
    ordered_node rebuilt = ordered_node::mapping();
    bool placed = false;
    for ( const auto& [mk, mv] : parent->map_items() ) {
      const std::string k = mk.get_value< std::string >();
      if ( synthetic.count(k) ) continue;
      if ( k == group.key ) {
        rebuilt[ k ] = folded;
        placed = true;
      }
      else {
        rebuilt[ k ] = mv;
      }
    }
    if ( !placed ) rebuilt[ group.key ] = folded;
    *parent = rebuilt;
  }
}
