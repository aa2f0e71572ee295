#include <cstdint>
#include <limits>
#include <nbt/fixtures/aggregate.hpp>
#include <nbt/fixtures/generators.hpp>
#include <nbt/fixtures/registry.hpp>
#include <nbt/nbt.hpp>
#include <stdexcept>
#include <string>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

using nbt::tag_kind;
using nbt::fixtures::registry;
using nbt::fixtures::sample_set;

namespace
{
auto one_byte( ) -> sample_set
{
    return { int8_t( 7 ) };
}

auto same_bytes( ) -> sample_set
{
    return { int8_t( 1 ), int8_t( 2 ), int8_t( 1 ) };
}

auto short_as_byte( ) -> sample_set
{
    return { int16_t( 7 ) };
}

}// namespace

static_assert( !registry{ { tag_kind::byte, &one_byte } }.is_exhaustive( ) );

TEST_CASE( "generators" )
{
    const auto & generators = registry::standard( );
    CHECK( generators.is_exhaustive( ) );

    SUBCASE( "every kind except end" )
    {
        for( auto kind : nbt::all_tag_kinds )
        {
            CHECK( generators.contains( kind ) == ( kind != tag_kind::end ) );
        }
        CHECK( generators.kinds( ).size( ) == nbt::tag_kind_count - 1 );
        CHECK( generators.kinds( ).front( ) == tag_kind::byte );
        CHECK( generators.kinds( ).back( ) == tag_kind::long_array );
    }
    SUBCASE( "samples are of the generator kind" )
    {
        for( auto kind : generators.kinds( ) )
        {
            const auto samples = generators.lookup( kind )( );
            REQUIRE( !samples.empty( ) );
            for( const auto & sample : samples )
            {
                CHECK( sample.kind( ) == kind );
            }
        }
    }
    SUBCASE( "samples are deterministic" )
    {
        for( auto kind : generators.kinds( ) )
        {
            CHECK( generators.lookup( kind )( ) == generators.lookup( kind )( ) );
        }
    }
    SUBCASE( "samples are encodable" )
    {
        for( auto kind : generators.kinds( ) )
        {
            for( const auto & sample : generators.lookup( kind )( ) )
            {
                CHECK_NOTHROW( nbt::bin::serialize( sample ) );
            }
        }
    }
}

TEST_CASE( "scalar samples" )
{
    const auto bytes = nbt::fixtures::generators::byte_samples( );
    REQUIRE( bytes.size( ) == 3 );
    CHECK( bytes[ 0 ] == nbt::value( std::numeric_limits< int8_t >::min( ) ) );
    CHECK( bytes[ 2 ] == nbt::value( std::numeric_limits< int8_t >::max( ) ) );

    const auto longs = nbt::fixtures::generators::long_samples( );
    REQUIRE( longs.size( ) == 3 );
    CHECK( longs[ 0 ] == nbt::value( std::numeric_limits< int64_t >::min( ) ) );
    CHECK( longs[ 2 ] == nbt::value( std::numeric_limits< int64_t >::max( ) ) );
}

TEST_CASE( "byte array samples" )
{
    const auto samples = registry::standard( ).lookup( tag_kind::byte_array )( );
    REQUIRE( samples.size( ) == 3 );

    const auto & empty = samples[ 0 ].get< nbt::byte_array >( );
    const auto & small = samples[ 1 ].get< nbt::byte_array >( );
    const auto & large = samples[ 2 ].get< nbt::byte_array >( );
    CHECK( empty.empty( ) );
    REQUIRE( small.size( ) == 500 );
    CHECK( large.size( ) == 4096 );

    CHECK( small[ 0 ] == 0 );
    CHECK( small[ 1 ] == 62 );
    CHECK( small[ 2 ] == 34 );
    CHECK( small[ 3 ] == 16 );
    for( size_t i = 0; i < small.size( ); i++ )
    {
        const auto index = int64_t( i );
        CHECK( small[ i ] == int8_t( ( index * index * 255 + index * 7 ) % 100 ) );
    }

    //- past index 2901 the 32 bit intermediate wraps and the remainder turns negative
    CHECK( large[ 2901 ] == 62 );
    CHECK( large[ 2902 ] == -62 );
    CHECK( large[ 4095 ] == -56 );
    for( size_t i = 0; i < large.size( ); i++ )
    {
        const auto index   = uint32_t( i );
        const auto wrapped = int32_t( index * index * 255U + index * 7U );
        CHECK( large[ i ] == int8_t( wrapped % 100 ) );
    }
}

TEST_CASE( "array samples" )
{
    for( auto kind : { tag_kind::int_array, tag_kind::long_array } )
    {
        const auto samples = registry::standard( ).lookup( kind )( );
        REQUIRE( samples.size( ) == 3 );
        CHECK( nbt::bin::serialize_size( samples[ 0 ] ) == 4 );
        CHECK( samples[ 1 ] != samples[ 2 ] );
    }
    CHECK( nbt::fixtures::generate_ints( 4 ) == nbt::int_array{ 0, -73518, 278234, -614148 } );
}

TEST_CASE( "string samples" )
{
    const auto samples = registry::standard( ).lookup( tag_kind::string )( );
    REQUIRE( samples.size( ) == 3 );
    CHECK( samples[ 0 ].get< std::string >( ).empty( ) );
    CHECK( samples[ 1 ].get< std::string >( ) == "Hello, world!" );
    CHECK( samples[ 2 ].get< std::string >( ).size( ) == 22000 );
    //- NUL and supplementary code points grow in modified utf8
    CHECK( nbt::bin::serialize_size( samples[ 2 ] ) == 2 + 25000 );
}

TEST_CASE( "container samples" )
{
    const auto lists = registry::standard( ).lookup( tag_kind::list )( );
    REQUIRE( lists.size( ) == 3 );
    CHECK( lists[ 0 ] == nbt::value( nbt::list( ) ) );
    CHECK( lists[ 1 ].get< nbt::list >( ).element_kind == tag_kind::string );
    CHECK( lists[ 2 ].get< nbt::list >( ).element_kind == tag_kind::list );

    const auto compounds = registry::standard( ).lookup( tag_kind::compound )( );
    REQUIRE( compounds.size( ) == 3 );
    CHECK( compounds[ 0 ] == nbt::value( nbt::compound( ) ) );
    CHECK( compounds[ 1 ].get< nbt::compound >( ).entries.size( ) == 10 );
    CHECK( compounds[ 2 ].get< nbt::compound >( ).entries.contains( "" ) );
}

TEST_CASE( "registry" )
{
    SUBCASE( "end has no generator" )
    {
        CHECK_THROWS_AS( (void) registry::standard( ).lookup( tag_kind::end ), std::invalid_argument );
    }
    SUBCASE( "missing generator" )
    {
        const auto partial = registry{ { tag_kind::byte, &one_byte } };
        CHECK( partial.kinds( ).size( ) == 1 );
        CHECK_NOTHROW( (void) partial.lookup( tag_kind::byte ) );
        CHECK_THROWS_AS( (void) partial.lookup( tag_kind::short_ ), std::invalid_argument );
        CHECK_THROWS_AS( (void) partial.lookup( tag_kind( 99 ) ), std::invalid_argument );
    }
    SUBCASE( "invalid entries" )
    {
        const auto with_end = []
        { return registry{ { tag_kind::end, &one_byte } }; };
        const auto duplicate = []
        { return registry{ { tag_kind::byte, &one_byte }, { tag_kind::byte, &same_bytes } }; };
        const auto null_generator = []
        { return registry{ { tag_kind::byte, nullptr } }; };

        CHECK_THROWS_AS( with_end( ), std::invalid_argument );
        CHECK_THROWS_AS( duplicate( ), std::invalid_argument );
        CHECK_THROWS_AS( null_generator( ), std::invalid_argument );
    }
}

TEST_CASE( "aggregate" )
{
    SUBCASE( "standard" )
    {
        const auto collected = nbt::fixtures::collect( );
        const auto values    = nbt::fixtures::aggregate( );

        CHECK( collected.size( ) == 36 );
        CHECK( values.size( ) <= collected.size( ) );
        //- no sample repeats within its kind
        CHECK( values.size( ) == collected.size( ) );

        for( const auto & [ data, kind ] : values )
        {
            CHECK( data.kind( ) == kind );
        }
    }
    SUBCASE( "deterministic" )
    {
        CHECK( nbt::fixtures::aggregate( ) == nbt::fixtures::aggregate( ) );
    }
    SUBCASE( "duplicates collapse" )
    {
        const auto values = nbt::fixtures::aggregate( registry{ { tag_kind::byte, &same_bytes } } );
        CHECK( values.size( ) == 2 );
        CHECK( nbt::fixtures::collect( registry{ { tag_kind::byte, &same_bytes } } ).size( ) == 3 );
    }
    SUBCASE( "equal numbers of different kinds stay apart" )
    {
        const auto generators = registry{ { tag_kind::byte, &one_byte },
                                          { tag_kind::short_, []( ) -> sample_set { return { int16_t( 7 ) }; } } };
        const auto values     = nbt::fixtures::aggregate( generators );
        REQUIRE( values.size( ) == 2 );
        CHECK( values.at( int8_t( 7 ) ) == tag_kind::byte );
        CHECK( values.at( int16_t( 7 ) ) == tag_kind::short_ );
    }
    SUBCASE( "generator of the wrong kind" )
    {
        const auto generators = registry{ { tag_kind::byte, &short_as_byte } };
        CHECK_THROWS_AS( (void) nbt::fixtures::aggregate( generators ), std::logic_error );
    }
}
