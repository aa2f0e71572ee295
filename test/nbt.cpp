#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <nbt/nbt.hpp>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

using namespace std::literals;

namespace
{
//- serialize, check the payload and decode it back
void nbt_test( const nbt::value & data, std::string_view payload )
{
    CHECK( nbt::bin::serialize( data ) == payload );
    CHECK( nbt::bin::serialize_size( data ) == payload.size( ) );
    CHECK( nbt::bin::deserialize( data.kind( ), payload ) == data );
}

//- `depth` lists nested in a list, the innermost one empty
auto nested_lists( size_t depth ) -> std::string
{
    auto result = std::string( );
    for( size_t i = 0; i < depth; i++ )
    {
        result += "\x09\x00\x00\x00\x01"sv;
    }
    result += "\x00\x00\x00\x00\x00"sv;
    return result;
}

}// namespace

TEST_CASE( "numbers" )
{
    SUBCASE( "byte" )
    {
        nbt_test( int8_t( 0 ), "\x00"sv );
        nbt_test( int8_t( -1 ), "\xff"sv );
        nbt_test( std::numeric_limits< int8_t >::min( ), "\x80"sv );
        nbt_test( std::numeric_limits< int8_t >::max( ), "\x7f"sv );
    }
    SUBCASE( "short" )
    {
        nbt_test( int16_t( 1234 ), "\x04\xd2"sv );
        nbt_test( int16_t( -2 ), "\xff\xfe"sv );
        nbt_test( std::numeric_limits< int16_t >::min( ), "\x80\x00"sv );
    }
    SUBCASE( "int" )
    {
        nbt_test( int32_t( -42 ), "\xff\xff\xff\xd6"sv );
        nbt_test( int32_t( 0x01020304 ), "\x01\x02\x03\x04"sv );
        nbt_test( std::numeric_limits< int32_t >::max( ), "\x7f\xff\xff\xff"sv );
    }
    SUBCASE( "long" )
    {
        nbt_test( int64_t( 9876543210 ), "\x00\x00\x00\x02\x4c\xb0\x16\xea"sv );
        nbt_test( int64_t( -1 ), "\xff\xff\xff\xff\xff\xff\xff\xff"sv );
    }
    SUBCASE( "float" )
    {
        nbt_test( -1.5F, "\xbf\xc0\x00\x00"sv );
        nbt_test( 0.0F, "\x00\x00\x00\x00"sv );
        nbt_test( -0.0F, "\x80\x00\x00\x00"sv );
        nbt_test( std::numeric_limits< float >::max( ), "\x7f\x7f\xff\xff"sv );
    }
    SUBCASE( "double" )
    {
        nbt_test( 3.141592653589793, "\x40\x09\x21\xfb\x54\x44\x2d\x18"sv );
        nbt_test( 1.0, "\x3f\xf0\x00\x00\x00\x00\x00\x00"sv );
    }
}

TEST_CASE( "arrays" )
{
    SUBCASE( "byte_array" )
    {
        nbt_test( nbt::byte_array( ), "\x00\x00\x00\x00"sv );
        nbt_test( nbt::byte_array{ 1, -1 }, "\x00\x00\x00\x02\x01\xff"sv );
    }
    SUBCASE( "int_array" )
    {
        nbt_test( nbt::int_array( ), "\x00\x00\x00\x00"sv );
        nbt_test( nbt::int_array{ 1, -2 }, "\x00\x00\x00\x02\x00\x00\x00\x01\xff\xff\xff\xfe"sv );
    }
    SUBCASE( "long_array" )
    {
        nbt_test( nbt::long_array{ -1 }, "\x00\x00\x00\x01\xff\xff\xff\xff\xff\xff\xff\xff"sv );
    }
    SUBCASE( "negative length" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::byte_array, "\xff\xff\xff\xff"sv ),
                         std::runtime_error );
    }
    SUBCASE( "length past the end" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::int_array, "\x00\x00\x00\x02\x00\x00\x00\x01"sv ),
                         std::runtime_error );
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::long_array, "\x7f\xff\xff\xff"sv ),
                         std::runtime_error );
    }
}

TEST_CASE( "string" )
{
    nbt_test( std::string( ), "\x00\x00"sv );
    nbt_test( std::string( "Hi" ), "\x00\x02Hi"sv );
    SUBCASE( "modified utf8" )
    {
        nbt_test( std::string( "\0"sv ), "\x00\x02\xc0\x80"sv );
        nbt_test( std::string( "\xf0\x9f\x98\x80" ), "\x00\x06\xed\xa0\xbd\xed\xb8\x80"sv );
    }
    SUBCASE( "too long" )
    {
        CHECK_NOTHROW( nbt::bin::serialize( std::string( 65535, 'x' ) ) );
        CHECK_THROWS_AS( nbt::bin::serialize( std::string( 65536, 'x' ) ), std::runtime_error );
        //- the limit is on the encoded form
        CHECK_THROWS_AS( nbt::bin::serialize( std::string( 40000, '\0' ) ), std::runtime_error );
    }
    SUBCASE( "invalid utf8" )
    {
        CHECK_THROWS_AS( nbt::bin::serialize( std::string( "\xff" ) ), std::runtime_error );
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::string, "\x00\x01\xff"sv ),
                         std::runtime_error );
    }
}

TEST_CASE( "list" )
{
    nbt_test( nbt::list( ), "\x00\x00\x00\x00\x00"sv );
    nbt_test( nbt::list{ .element_kind = nbt::tag_kind::int_,
                         .items        = { int32_t( 1 ), int32_t( 2 ) } },
              "\x03\x00\x00\x00\x02\x00\x00\x00\x01\x00\x00\x00\x02"sv );
    nbt_test( nbt::list{ .element_kind = nbt::tag_kind::byte, .items = { } },
              "\x01\x00\x00\x00\x00"sv );

    SUBCASE( "element kind mismatch" )
    {
        const auto mixed = nbt::value( nbt::list{ .element_kind = nbt::tag_kind::int_,
                                                  .items = { int32_t( 1 ), int8_t( 2 ) } } );
        CHECK_THROWS_AS( nbt::bin::serialize( mixed ), std::runtime_error );

        const auto untyped = nbt::value( nbt::list{ .items = { int8_t( 2 ) } } );
        CHECK_THROWS_AS( nbt::bin::serialize( untyped ), std::runtime_error );
    }
    SUBCASE( "non empty list of end" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::list, "\x00\x00\x00\x00\x01\x00"sv ),
                         std::runtime_error );
    }
    SUBCASE( "invalid element kind" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::list, "\x0d\x00\x00\x00\x00"sv ),
                         std::runtime_error );
    }
}

TEST_CASE( "compound" )
{
    nbt_test( nbt::compound( ), "\x00"sv );
    nbt_test( nbt::compound{ .entries = { { "a", int8_t( 5 ) } } }, "\x01\x00\x01"
                                                                     "a\x05\x00"sv );
    SUBCASE( "entries in name order" )
    {
        const auto data = nbt::value( nbt::compound{
            .entries = { { "b", int8_t( 2 ) }, { "a", int16_t( 1 ) } } } );
        CHECK( nbt::bin::serialize( data ) == "\x02\x00\x01"
                                              "a\x00\x01\x01\x00\x01"
                                              "b\x02\x00"sv );
    }
    SUBCASE( "duplicate name" )
    {
        const auto data = nbt::bin::deserialize( nbt::tag_kind::compound, "\x01\x00\x01"
                                                                          "a\x05\x01\x00\x01"
                                                                          "a\x06\x00"sv );
        REQUIRE( data.is< nbt::compound >( ) );
        const auto & entries = data.get< nbt::compound >( ).entries;
        REQUIRE( entries.size( ) == 1 );
        CHECK( entries.at( "a" ) == nbt::value( int8_t( 6 ) ) );
    }
    SUBCASE( "missing end" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::compound, "\x01\x00\x01"
                                                                         "a\x05"sv ),
                         std::runtime_error );
    }
}

TEST_CASE( "malformed input" )
{
    SUBCASE( "truncated" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::int_, "\x00\x01"sv ), std::runtime_error );
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::string, "\x00\x05"
                                                                       "ab"sv ),
                         std::runtime_error );
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::byte, ""sv ), std::runtime_error );
    }
    SUBCASE( "trailing bytes" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::byte, "\x01\x02"sv ), std::runtime_error );
    }
    SUBCASE( "end has no payload" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::end, "\x00"sv ), std::runtime_error );
    }
    SUBCASE( "nesting" )
    {
        const auto options = nbt::bin::deserialize_options{ .max_depth = 4 };
        CHECK_NOTHROW( nbt::bin::deserialize( nbt::tag_kind::list, nested_lists( 4 ), options ) );
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::list, nested_lists( 5 ), options ),
                         std::runtime_error );
        CHECK_NOTHROW( nbt::bin::deserialize( nbt::tag_kind::list, nested_lists( NBT_MAX_DEPTH ) ) );
        CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::list, nested_lists( NBT_MAX_DEPTH + 1 ) ),
                         std::runtime_error );
    }
}

TEST_CASE( "reader" )
{
    //- two payloads back to back, the reader api stops after each one
    const auto payload = "\x00\x2a\xff\xff"sv;
    auto reader        = [ ptr = payload.data( ), end = payload.data( ) + payload.size( ) ](
                      void * data, size_t size ) mutable -> size_t
    {
        size_t bytes_left = end - ptr;

        size = std::min( size, bytes_left );
        memcpy( data, ptr, size );
        ptr += size;
        return size;
    };
    CHECK( nbt::bin::deserialize( nbt::tag_kind::short_, reader ) == nbt::value( int16_t( 42 ) ) );
    CHECK( nbt::bin::deserialize( nbt::tag_kind::short_, reader ) == nbt::value( int16_t( -1 ) ) );
    CHECK_THROWS_AS( nbt::bin::deserialize( nbt::tag_kind::short_, reader ), std::runtime_error );
}

TEST_CASE( "writer" )
{
    auto result = std::string( );
    auto writer = [ &result ]( const void * data, size_t size )
    { result.append( static_cast< const char * >( data ), size ); };

    CHECK( nbt::bin::serialize( nbt::value( int32_t( 1 ) ), writer ) == 4 );
    CHECK( result == "\x00\x00\x00\x01"sv );

    SUBCASE( "empty payloads skip the write" )
    {
        auto sizes         = std::vector< size_t >( );
        auto record_writer = [ &sizes ]( const void *, size_t size ) { sizes.push_back( size ); };

        CHECK( nbt::bin::serialize( nbt::value( nbt::byte_array( ) ), record_writer ) == 4 );
        CHECK( nbt::bin::serialize( nbt::value( std::string( ) ), record_writer ) == 2 );
        CHECK( std::find( sizes.begin( ), sizes.end( ), size_t( 0 ) ) == sizes.end( ) );

        auto bytes = std::vector< std::byte >( );
        CHECK( nbt::bin::serialize( nbt::value( nbt::byte_array( ) ), bytes ) == 4 );
        CHECK( bytes == std::vector< std::byte >( 4, std::byte( 0 ) ) );
    }
    SUBCASE( "string length uses the encoded size" )
    {
        auto sizes         = std::vector< size_t >( );
        auto record_writer = [ &sizes ]( const void *, size_t size ) { sizes.push_back( size ); };

        CHECK( nbt::bin::serialize( nbt::value( std::string( "\0\xf0\x9f\x98\x80"sv ) ), record_writer ) == 2 + 8 );
        CHECK( sizes == std::vector< size_t >{ 2, 8 } );
    }
    SUBCASE( "container" )
    {
        auto bytes = std::vector< std::byte >( );
        CHECK( nbt::bin::serialize( nbt::value( int16_t( 1 ) ), bytes ) == 2 );
        CHECK( bytes == std::vector< std::byte >{ std::byte( 0 ), std::byte( 1 ) } );
    }
}

TEST_CASE( "named root tag" )
{
    const auto document = "\x0a\x00\x05"
                          "hello\x08\x00\x04"
                          "name\x00\x03"
                          "Bob\x00"sv;

    const auto data = nbt::value( nbt::compound{ .entries = { { "name", std::string( "Bob" ) } } } );
    CHECK( nbt::bin::serialize_named( "hello", data ) == document );

    const auto root = nbt::bin::deserialize_named( document );
    CHECK( root.name == "hello" );
    CHECK( root.data == data );

    SUBCASE( "trailing bytes" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize_named( std::string( document ) + "x" ), std::runtime_error );
    }
    SUBCASE( "end as root" )
    {
        CHECK_THROWS_AS( nbt::bin::deserialize_named( "\x00\x00\x00"sv ), std::runtime_error );
    }
    SUBCASE( "scalar root" )
    {
        CHECK( nbt::bin::serialize_named( "", int8_t( 3 ) ) == "\x01\x00\x00\x03"sv );
    }
}

TEST_CASE( "codec per kind" )
{
    SUBCASE( "encode_as" )
    {
        CHECK( nbt::bin::encode_as< nbt::tag_kind::short_ >( int16_t( 1 ) ) ==
               std::vector< std::byte >{ std::byte( 0 ), std::byte( 1 ) } );
        CHECK_THROWS_AS( nbt::bin::encode_as< nbt::tag_kind::int_ >( int8_t( 1 ) ), std::invalid_argument );
    }
    SUBCASE( "decode_as" )
    {
        const auto payload = std::vector< std::byte >{ std::byte( 0xff ) };
        CHECK( nbt::bin::decode_as< nbt::tag_kind::byte >( payload ) == nbt::value( int8_t( -1 ) ) );
    }
    SUBCASE( "lookup" )
    {
        for( auto kind : nbt::all_tag_kinds )
        {
            if( kind == nbt::tag_kind::end )
            {
                continue;
            }
            CHECK( ( nbt::bin::encoder_for( kind ) != nullptr ) );
            CHECK( ( nbt::bin::decoder_for( kind ) != nullptr ) );
        }
        CHECK( ( nbt::bin::encoder_for( nbt::tag_kind::double_ ) ==
                 &nbt::bin::encode_as< nbt::tag_kind::double_ > ) );
    }
    SUBCASE( "no codec for end" )
    {
        CHECK_THROWS_AS( nbt::bin::encoder_for( nbt::tag_kind::end ), std::invalid_argument );
        CHECK_THROWS_AS( nbt::bin::decoder_for( nbt::tag_kind::end ), std::invalid_argument );
        CHECK_THROWS_AS( nbt::bin::encoder_for( nbt::tag_kind( 42 ) ), std::invalid_argument );
    }
}
