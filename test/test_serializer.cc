#include "test_support.hh"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using varyml::val;
using varyml_test::NESTED_VARIANTS;
using varyml_test::SMALL_EXAMPLE;
using varyml_test::equivalent;
using varyml_test::yaml;

TEST(Serializer, ReproducesDuplicateKeyShape) {
  const varyml::Parser parser;
  EXPECT_EQ( varyml::dumps(parser.parse(SMALL_EXAMPLE)), SMALL_EXAMPLE );
}

TEST(Serializer, CustomIndentWidth) {
  const varyml::Parser parser;
  EXPECT_EQ( varyml::dumps(parser.parse(SMALL_EXAMPLE), 2),
    "val1: 1\n"
    "val2: 2\n"
    "  val3: 3\n"
    "  val3: 4\n"
    "    val5: 5\n" );
}

TEST(Serializer, NestedVariantsRoundTrip) {
  const varyml::Parser parser;
  auto first = parser.parse( NESTED_VARIANTS );
  const std::string text = varyml::dumps( first );

  EXPECT_EQ( text,
    "val1: 1\n"
    "val2: 2\n"
    "    val3: 3\n"
    "    val3: 4\n"
    "        val5: 5\n"
    "    val3: 6\n"
    "        val5: 10\n"
    "        val5: 11\n"
    "    val5: 7\n" );

  auto second = parser.parse( text );
  EXPECT_TRUE( equivalent(first, second) ) << text;
}

TEST(Serializer, RoundTripAfterWrites) {
  const varyml::Parser parser;
  varyml::Document doc = parser.load( NESTED_VARIANTS );
  doc.set( { "val2", val("val3[1]") }, varyml::ordered_node(
    std::string("four")) );
  doc.set( { "val2", "extra" }, varyml::ordered_node(std::int64_t{ 8 }) );

  auto reparsed = parser.parse( doc.dump() );
  EXPECT_TRUE( equivalent(doc.data(), reparsed) ) << doc.dump();
  EXPECT_EQ( varyml::Document(reparsed).get({ "val2", val("val3[1]") })
    .get_value< std::string >(), "four" );
}

TEST(Serializer, NullsAndEmptyStrings) {
  EXPECT_EQ( varyml::dumps(yaml("{a: null, b: '', c: x}")),
    "a:\nb: ''\nc: x\n" );
}

TEST(Serializer, EmptySequenceStaysVisible) {
  EXPECT_EQ( varyml::dumps(yaml("{k: []}")), "k: []\n" );
}

TEST(Serializer, BooleansAndMixedVariants) {
  const varyml::Parser parser;
  const std::string text =
    "flag: true\n"
    "k: 1\n"
    "k: 2\n"
    "    c: x\n";
  auto data = parser.parse( text );
  EXPECT_EQ( varyml::dumps(data), text );
  EXPECT_TRUE( equivalent(parser.parse(varyml::dumps(data)), data) );
}

TEST(Serializer, ScalarRoot) {
  EXPECT_EQ( varyml::dumps(varyml::ordered_node(std::int64_t{ 5 })), "5\n" );
  EXPECT_EQ( varyml::dumps(varyml::ordered_node()), "" );
}

TEST(Serializer, StringsThatReadAsOtherTypesAreQuoted) {
  const varyml::Parser parser;
  EXPECT_EQ( varyml::dumps(parser.parse("k: \"123\"\n")), "k: '123'\n" );

  const std::string texts[] = {
    "k: \"123\"\n",
    "k: 'true'\n",
    "k: 'null'\n",
    "k: \"a: b\"\n",
    "k: '#tag'\n",
    "k: '[x'\n",
    "k: '{x}'\n",
    "k: \"it's\"\n",
  };
  for ( const auto& text : texts ) {
    auto first = parser.parse( text );
    const std::string dumped = varyml::dumps( first );
    auto second = parser.parse( dumped );
    EXPECT_TRUE( second.at("k").is_string() ) << dumped;
    EXPECT_TRUE( equivalent(first, second) ) << dumped;
  }
}

TEST(Serializer, StringsWithLineBreaksUseEscapes) {
  const varyml::Parser parser;
  auto data = yaml( "{k: \"two\\nlines\"}" );
  const std::string dumped = varyml::dumps( data );
  EXPECT_EQ( dumped, "k: \"two\\nlines\"\n" );
  EXPECT_TRUE( equivalent(parser.parse(dumped), data) ) << dumped;
}

TEST(Serializer, FloatsKeepFullPrecision) {
  const varyml::Parser parser;
  auto first = parser.parse( "a: 0.0000001\nb: 3.14159265\nc: 2.0\n" );
  const std::string dumped = varyml::dumps( first );
  auto second = parser.parse( dumped );

  EXPECT_TRUE( equivalent(first, second) ) << dumped;
  EXPECT_EQ( second.at("a").get_value< double >(), 0.0000001 ) << dumped;
  EXPECT_EQ( second.at("b").get_value< double >(), 3.14159265 ) << dumped;
  EXPECT_TRUE( second.at("c").is_float_number() ) << dumped;
}

TEST(Serializer, EmptyMappingStaysAMapping) {
  const varyml::Parser parser;
  auto first = parser.parse( "k: {}\n" );
  const std::string dumped = varyml::dumps( first );
  EXPECT_EQ( dumped, "k: {}\n" );

  auto second = parser.parse( dumped );
  ASSERT_TRUE( second.at("k").is_mapping() );
  EXPECT_EQ( second.at("k").size(), 0u );
}
