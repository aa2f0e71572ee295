/***************************************************************************\
* Name        : deserialize library for NBT                                 *
* Description : all NBT binary deserialization functions                    *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include "../concepts.h"
#include "../mutf8.h"
#include "../tag-kind.h"
#include "../value.h"
#include <algorithm>
#include <bit>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <nbt/io/io.hpp>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#ifndef NBT_MAX_DEPTH
#define NBT_MAX_DEPTH 512U
#endif

namespace nbt::bin::detail
{

struct istream
{
private:
    nbt::io::reader on_read;
    size_t m_size;

public:
    istream( nbt::io::reader reader, size_t size = std::numeric_limits< size_t >::max( ) ) noexcept
        : on_read( reader )
        , m_size( size )
    {
    }

    [[nodiscard]] auto read_byte( ) -> uint8_t
    {
        uint8_t result = { };
        read_exact( &result, sizeof( result ) );
        return result;
    }

    [[nodiscard]] auto read_byte_or_eof( ) -> int
    {
        uint8_t result = { };
        if( empty( ) || on_read( &result, sizeof( result ) ) == 0 )
        {
            return -1;
        }
        m_size -= 1;
        return result;
    }

    [[nodiscard]] auto size( ) const -> size_t
    {
        return m_size;
    }

    void read_exact( void * data, size_t size )
    {
        if( this->size( ) < size ) [[unlikely]]
        {
            throw std::runtime_error( "unexpected end of stream" );
        }

        auto * p_data = static_cast< uint8_t * >( data );
        while( size > 0 )
        {
            auto chunk_size = on_read( p_data, size );
            if( chunk_size == 0 )
            {
                throw std::runtime_error( "unexpected end of stream" );
            }

            p_data += chunk_size;
            size -= chunk_size;
            m_size -= chunk_size;
        }
    }

    [[nodiscard]] auto empty( ) const -> bool
    {
        return size( ) == 0;
    }
};

static inline void check_if_empty( istream & stream )
{
    if( stream.read_byte_or_eof( ) >= 0 )
    {
        throw std::runtime_error( "unexpected data in stream" );
    }
}

static inline void check_depth( uint32_t depth, uint32_t max_depth )
{
    if( depth > max_depth )
    {
        throw std::runtime_error( "nesting too deep" );
    }
}

template < nbt::detail::nbt_integer T >
[[nodiscard]] static inline auto read_be( istream & stream ) -> T
{
    using U = std::make_unsigned_t< T >;

    uint8_t buffer[ sizeof( T ) ];
    stream.read_exact( buffer, sizeof( buffer ) );

    auto tmp = U( 0 );
    for( auto byte : buffer )
    {
        if constexpr( sizeof( T ) > 1 )
        {
            tmp = U( tmp << CHAR_BIT );
        }
        tmp = U( tmp | byte );
    }
    return T( tmp );
}

template < nbt::detail::nbt_number T >
[[nodiscard]] static inline auto read_number( istream & stream ) -> T
{
    if constexpr( std::is_same_v< T, float > )
    {
        return std::bit_cast< float >( read_be< int32_t >( stream ) );
    }
    else if constexpr( std::is_same_v< T, double > )
    {
        return std::bit_cast< double >( read_be< int64_t >( stream ) );
    }
    else
    {
        return read_be< T >( stream );
    }
}

[[nodiscard]] static inline auto read_kind( istream & stream ) -> tag_kind
{
    const auto id = stream.read_byte( );
    if( !is_valid_tag_kind( id ) )
    {
        throw std::runtime_error( "invalid tag kind" );
    }
    return tag_kind( id );
}

[[nodiscard]] static inline auto read_length( istream & stream ) -> size_t
{
    const auto length = read_be< int32_t >( stream );
    if( length < 0 )
    {
        throw std::runtime_error( "negative array length" );
    }
    return size_t( length );
}

[[nodiscard]] static inline auto read_string( istream & stream ) -> std::string
{
    const auto size = read_be< uint16_t >( stream );
    auto encoded    = std::string( size, '\0' );
    stream.read_exact( encoded.data( ), encoded.size( ) );
    return nbt::detail::mutf8::decode( encoded );
}

template < nbt::detail::nbt_number_array C >
[[nodiscard]] static inline auto read_array( istream & stream ) -> C
{
    using T = typename C::value_type;

    const auto length = read_length( stream );
    //- do not trust the length prefix more than the stream
    if( stream.size( ) / sizeof( T ) < length )
    {
        throw std::runtime_error( "unexpected end of stream" );
    }

    auto result = C( );
    result.resize( length );
    if constexpr( sizeof( T ) == 1 )
    {
        stream.read_exact( result.data( ), result.size( ) );
    }
    else
    {
        for( auto & element : result )
        {
            element = read_be< T >( stream );
        }
    }
    return result;
}

[[nodiscard]] static inline auto deserialize( istream & stream, tag_kind kind, uint32_t depth,
                                              uint32_t max_depth ) -> value;

[[nodiscard]] static inline auto read_list( istream & stream, uint32_t depth, uint32_t max_depth )
    -> list
{
    auto result         = list( );
    result.element_kind = read_kind( stream );
    const auto length   = read_length( stream );
    if( result.element_kind == tag_kind::end && length > 0 )
    {
        throw std::runtime_error( "invalid list element kind" );
    }

    //- every element takes at least one byte
    if( stream.size( ) < length )
    {
        throw std::runtime_error( "unexpected end of stream" );
    }

    result.items.reserve( std::min< size_t >( length, 4096 ) );
    for( size_t i = 0; i < length; i++ )
    {
        result.items.emplace_back(
            deserialize( stream, result.element_kind, depth + 1, max_depth ) );
    }
    return result;
}

[[nodiscard]] static inline auto read_compound( istream & stream, uint32_t depth,
                                                uint32_t max_depth ) -> compound
{
    auto result = compound( );
    for( ;; )
    {
        const auto kind = read_kind( stream );
        if( kind == tag_kind::end )
        {
            return result;
        }
        auto name = read_string( stream );
        //- last duplicate name wins
        result.entries.insert_or_assign( std::move( name ),
                                         deserialize( stream, kind, depth + 1, max_depth ) );
    }
}

[[nodiscard]] static inline auto deserialize( istream & stream, tag_kind kind, uint32_t depth,
                                              uint32_t max_depth ) -> value
{
    check_depth( depth, max_depth );

    switch( kind )
    {
    case tag_kind::byte:
        return read_number< int8_t >( stream );
    case tag_kind::short_:
        return read_number< int16_t >( stream );
    case tag_kind::int_:
        return read_number< int32_t >( stream );
    case tag_kind::long_:
        return read_number< int64_t >( stream );
    case tag_kind::float_:
        return read_number< float >( stream );
    case tag_kind::double_:
        return read_number< double >( stream );
    case tag_kind::byte_array:
        return read_array< byte_array >( stream );
    case tag_kind::string:
        return read_string( stream );
    case tag_kind::list:
        return read_list( stream, depth, max_depth );
    case tag_kind::compound:
        return read_compound( stream, depth, max_depth );
    case tag_kind::int_array:
        return read_array< int_array >( stream );
    case tag_kind::long_array:
        return read_array< long_array >( stream );
    case tag_kind::end:
        break;
    }
    throw std::runtime_error( "invalid tag kind" );
}

}// namespace nbt::bin::detail
