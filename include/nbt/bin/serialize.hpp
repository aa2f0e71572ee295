/***************************************************************************\
* Name        : serialize library for NBT                                   *
* Description : all NBT binary serialization functions                      *
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
#include <bit>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <nbt/io/io.hpp>
#include <stdexcept>
#include <string_view>
#include <type_traits>
#include <variant>

namespace nbt::bin::detail
{
struct ostream
{
private:
    size_t bytes_written = 0;
    nbt::io::writer on_write;

public:
    /**
     * @brief Construct a new ostream object
     *
     * @param writer if null, stream will skip all writes but will still count number of written
     * bytes
     */
    explicit ostream( nbt::io::writer writer = nullptr ) noexcept
        : on_write( writer )
    {
    }

    void write( const void * p_data, size_t size )
    {
        if( on_write )
        {
            on_write( p_data, size );
        }

        bytes_written += size;
    }

    [[nodiscard]] auto size( ) const noexcept -> size_t
    {
        return bytes_written;
    }
};

//- NBT is always big-endian
template < nbt::detail::nbt_integer T >
static inline void serialize_be( ostream & stream, T value )
{
    using U = std::make_unsigned_t< T >;

    auto tmp = U( value );
    uint8_t buffer[ sizeof( T ) ];
    for( size_t i = sizeof( T ); i > 0; i-- )
    {
        buffer[ i - 1 ] = uint8_t( tmp & 0xFF );
        if constexpr( sizeof( T ) > 1 )
        {
            tmp = U( tmp >> CHAR_BIT );
        }
    }
    stream.write( buffer, sizeof( buffer ) );
}

static inline void serialize( ostream & stream, nbt::detail::nbt_number auto value )
{
    using T = std::remove_cvref_t< decltype( value ) >;

    if constexpr( std::is_same_v< T, float > )
    {
        serialize_be( stream, std::bit_cast< int32_t >( value ) );
    }
    else if constexpr( std::is_same_v< T, double > )
    {
        serialize_be( stream, std::bit_cast< int64_t >( value ) );
    }
    else
    {
        serialize_be( stream, value );
    }
}

static inline void serialize_kind( ostream & stream, tag_kind kind )
{
    serialize_be( stream, int8_t( kind ) );
}

static inline void serialize_length( ostream & stream, size_t length )
{
    if( length > size_t( std::numeric_limits< int32_t >::max( ) ) )
    {
        throw std::runtime_error( "array too long" );
    }
    serialize_be( stream, int32_t( length ) );
}

static inline void serialize( ostream & stream, std::string_view value )
{
    const auto size = nbt::detail::mutf8::encoded_size( value );
    if( size > std::numeric_limits< uint16_t >::max( ) )
    {
        throw std::runtime_error( "string too long" );
    }
    serialize_be( stream, uint16_t( size ) );
    if( size > 0 )
    {
        const auto encoded = nbt::detail::mutf8::encode( value );
        stream.write( encoded.data( ), encoded.size( ) );
    }
}

static inline void serialize( ostream & stream, const nbt::detail::nbt_number_array auto & value )
{
    serialize_length( stream, value.size( ) );
    if constexpr( sizeof( typename std::decay_t< decltype( value ) >::value_type ) == 1 )
    {
        //- empty vector has no data
        if( !value.empty( ) )
        {
            stream.write( value.data( ), value.size( ) );
        }
    }
    else
    {
        for( auto element : value )
        {
            serialize_be( stream, element );
        }
    }
}

static inline void serialize( ostream & stream, const value & data );

static inline void serialize( ostream & stream, const list & list_value )
{
    if( list_value.element_kind == tag_kind::end && !list_value.items.empty( ) )
    {
        throw std::runtime_error( "invalid list element kind" );
    }
    serialize_kind( stream, list_value.element_kind );
    serialize_length( stream, list_value.items.size( ) );
    for( const auto & item : list_value.items )
    {
        if( item.kind( ) != list_value.element_kind )
        {
            throw std::runtime_error( "invalid list element kind" );
        }
        serialize( stream, item );
    }
}

static inline void serialize_named( ostream & stream, std::string_view name, const value & data )
{
    serialize_kind( stream, data.kind( ) );
    serialize( stream, name );
    serialize( stream, data );
}

static inline void serialize( ostream & stream, const compound & compound_value )
{
    for( const auto & [ name, item ] : compound_value.entries )
    {
        serialize_named( stream, name, item );
    }
    serialize_kind( stream, tag_kind::end );
}

static inline void serialize( ostream & stream, const value & data )
{
    std::visit(
        [ &stream ]( const auto & payload )
        {
            using T = std::remove_cvref_t< decltype( payload ) >;
            if constexpr( std::is_same_v< T, std::string > )
            {
                serialize( stream, std::string_view( payload ) );
            }
            else
            {
                serialize( stream, payload );
            }
        },
        data.data( ) );
}

static inline auto serialize( const value & data, nbt::io::writer on_write ) -> size_t
{
    auto stream = ostream( on_write );
    serialize( stream, data );
    return stream.size( );
}

static inline auto serialize_size( const value & data ) -> size_t
{
    auto stream = ostream( nullptr );
    serialize( stream, data );
    return stream.size( );
}

}// namespace nbt::bin::detail
