/***************************************************************************\
* Name        : sample generators                                           *
* Description : deterministic representative values for every tag kind      *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include "../tag-kind.h"
#include "../value.h"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace nbt::fixtures
{
/**
 * @brief values produced by one generator, all of the same kind
 */
using sample_set = std::vector< value >;

/**
 * @brief produces the same sample set on every call, has no state
 */
using generator = auto ( * )( ) -> sample_set;

//- array sample lengths: empty, small, large
inline constexpr auto small_array_length = size_t( 500 );
inline constexpr auto large_array_length = size_t( 4096 );

/**
 * @brief diverse bytes, element `i` is `(i * i * 255 + i * 7) % 100` in 32 bit arithmetic
 *        (wrapping, like a java int) narrowed to a signed byte
 */
[[nodiscard]] inline auto generate_bytes( size_t length ) -> byte_array
{
    auto result = byte_array( length );
    for( size_t i = 0; i < length; i++ )
    {
        const auto index = uint32_t( i );
        const auto tmp   = int32_t( index * index * 255U + index * 7U );
        result[ i ]      = int8_t( tmp % 100 );
    }
    return result;
}

/**
 * @brief diverse ints with alternating sign
 */
[[nodiscard]] inline auto generate_ints( size_t length ) -> int_array
{
    auto result = int_array( length );
    for( size_t i = 0; i < length; i++ )
    {
        const auto index = int64_t( i );
        const auto tmp   = int32_t( ( index * index * 65599 + index * 7919 ) % 2147483629 );
        result[ i ]      = ( i % 2 == 0 ) ? tmp : -tmp;
    }
    return result;
}

/**
 * @brief diverse longs, polynomial of the index modulo 2^64
 */
[[nodiscard]] inline auto generate_longs( size_t length ) -> long_array
{
    auto result = long_array( length );
    for( size_t i = 0; i < length; i++ )
    {
        const auto index = uint64_t( i );
        result[ i ] = int64_t( index * index * index * 0x9E3779B97F4A7C15ULL +
                               index * 0x632BE59BD9B4E019ULL + 0x2545F4914F6CDD1DULL );
    }
    return result;
}

namespace generators
{
using namespace std::literals;

[[nodiscard]] inline auto byte_samples( ) -> sample_set
{
    return { std::numeric_limits< int8_t >::min( ), int8_t( 0 ),
             std::numeric_limits< int8_t >::max( ) };
}

[[nodiscard]] inline auto short_samples( ) -> sample_set
{
    return { std::numeric_limits< int16_t >::min( ), int16_t( 1234 ),
             std::numeric_limits< int16_t >::max( ) };
}

[[nodiscard]] inline auto int_samples( ) -> sample_set
{
    return { std::numeric_limits< int32_t >::min( ), int32_t( -42 ),
             std::numeric_limits< int32_t >::max( ) };
}

[[nodiscard]] inline auto long_samples( ) -> sample_set
{
    return { std::numeric_limits< int64_t >::min( ), int64_t( 9876543210 ),
             std::numeric_limits< int64_t >::max( ) };
}

[[nodiscard]] inline auto float_samples( ) -> sample_set
{
    return { 0.0F, -1.5F, std::numeric_limits< float >::max( ) };
}

[[nodiscard]] inline auto double_samples( ) -> sample_set
{
    return { 0.0, 3.141592653589793, std::numeric_limits< double >::lowest( ) };
}

[[nodiscard]] inline auto byte_array_samples( ) -> sample_set
{
    return { byte_array( ), generate_bytes( small_array_length ),
             generate_bytes( large_array_length ) };
}

[[nodiscard]] inline auto int_array_samples( ) -> sample_set
{
    return { int_array( ), generate_ints( small_array_length ),
             generate_ints( large_array_length ) };
}

[[nodiscard]] inline auto long_array_samples( ) -> sample_set
{
    return { long_array( ), generate_longs( small_array_length ),
             generate_longs( large_array_length ) };
}

[[nodiscard]] inline auto string_samples( ) -> sample_set
{
    //- 1, 2, 3 and 4 byte utf8 sequences and a NUL, 25 bytes in modified utf8
    constexpr auto fragment =
        "NBT \xc3\xa9\xc3\x9f \xe4\xb8\x96\xe7\x95\x8c \xf0\x9f\x98\x80 \0"sv;

    auto large = std::string( );
    large.reserve( fragment.size( ) * 1000 );
    for( size_t i = 0; i < 1000; i++ )
    {
        large.append( fragment );
    }

    return { std::string( ), std::string( "Hello, world!" ), std::move( large ) };
}

[[nodiscard]] inline auto list_samples( ) -> sample_set
{
    auto strings = list{ .element_kind = tag_kind::string,
                         .items        = { std::string( "alpha" ), std::string( "beta" ),
                                           std::string( "gamma" ) } };

    auto nested = list{ .element_kind = tag_kind::list,
                        .items        = {
                            list{ .element_kind = tag_kind::int_,
                                         .items = { int32_t( 1 ), int32_t( 2 ), int32_t( 3 ) } },
                            list{ .element_kind = tag_kind::int_, .items = { } },
                            list{ .element_kind = tag_kind::int_,
                                         .items = { std::numeric_limits< int32_t >::min( ) } },
                        } };

    return { list( ), std::move( strings ), std::move( nested ) };
}

[[nodiscard]] inline auto compound_samples( ) -> sample_set
{
    auto scalars = compound{ .entries = {
                                 { "byte", int8_t( 1 ) },
                                 { "short", int16_t( -2 ) },
                                 { "int", int32_t( 3 ) },
                                 { "long", int64_t( -4 ) },
                                 { "float", 5.5F },
                                 { "double", -6.25 },
                                 { "byte_array", generate_bytes( 16 ) },
                                 { "string", std::string( "seven" ) },
                                 { "int_array", generate_ints( 8 ) },
                                 { "long_array", generate_longs( 4 ) },
                             } };

    auto leaf   = compound{ .entries = { { "name", std::string( "leaf" ) } } };
    auto nested = compound{
        .entries = {
            { "list", list{ .element_kind = tag_kind::compound, .items = { leaf, compound( ) } } },
            { "child", compound{ .entries = { { "grandchild", leaf } } } },
            { "", std::string( "empty name" ) },
        } };

    return { compound( ), std::move( scalars ), std::move( nested ) };
}

}// namespace generators
}// namespace nbt::fixtures
