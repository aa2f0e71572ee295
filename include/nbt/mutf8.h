/***************************************************************************\
* Name        : modified utf8                                               *
* Description : utf8 <-> java modified utf8 used by NBT strings             *
* Author      : antonin.kriz@gmail.com                                      *
* reference   : https://docs.oracle.com/javase/8/docs/api/java/io/DataInput.html
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace nbt::detail::mutf8
{

static inline auto is_continuation( uint8_t byte ) noexcept -> bool
{
    return ( byte & 0xC0 ) == 0x80;
}

/**
 * @brief decode one code point from standard utf8
 *
 * @param str input, `pos` is advanced past the code point
 * @return unicode codepoint
 * @throws std::runtime_error on invalid or overlong sequence
 */
static inline auto decode_point( std::string_view str, size_t & pos ) -> uint32_t
{
    const auto lead = uint8_t( str[ pos++ ] );
    if( lead < 0x80 )
    {
        return lead;
    }

    auto length  = size_t( 0 );
    auto unicode = uint32_t( 0 );
    auto minimum = uint32_t( 0 );

    if( ( lead & 0xE0 ) == 0xC0 )
    {
        length  = 1;
        unicode = lead & 0x1F;
        minimum = 0x80;
    }
    else if( ( lead & 0xF0 ) == 0xE0 )
    {
        length  = 2;
        unicode = lead & 0x0F;
        minimum = 0x800;
    }
    else if( ( lead & 0xF8 ) == 0xF0 )
    {
        length  = 3;
        unicode = lead & 0x07;
        minimum = 0x10000;
    }
    else
    {
        throw std::runtime_error( "invalid utf8 string" );
    }

    if( str.size( ) - pos < length )
    {
        throw std::runtime_error( "invalid utf8 string" );
    }

    for( size_t i = 0; i < length; i++ )
    {
        const auto byte = uint8_t( str[ pos++ ] );
        if( !is_continuation( byte ) )
        {
            throw std::runtime_error( "invalid utf8 string" );
        }
        unicode = ( unicode << 6 ) | ( byte & 0x3F );
    }

    if( unicode < minimum || unicode > 0x10FFFF || ( unicode >= 0xD800 && unicode < 0xE000 ) )
    {
        throw std::runtime_error( "invalid utf8 string" );
    }
    return unicode;
}

/**
 * @brief append one 16 bit unit (or U+0000) in modified utf8 form
 */
static inline void append_unit( std::string & out, uint32_t unit )
{
    if( unit != 0 && unit <= 0x7F )
    {
        out.push_back( char( unit ) );
    }
    else if( unit <= 0x7FF )
    {
        //- U+0000 takes the overlong 2 byte form C0 80
        out.push_back( char( 0xC0 | ( unit >> 6 ) ) );
        out.push_back( char( 0x80 | ( unit & 0x3F ) ) );
    }
    else
    {
        out.push_back( char( 0xE0 | ( unit >> 12 ) ) );
        out.push_back( char( 0x80 | ( ( unit >> 6 ) & 0x3F ) ) );
        out.push_back( char( 0x80 | ( unit & 0x3F ) ) );
    }
}

static inline void append_utf8( std::string & out, uint32_t unicode )
{
    if( unicode <= 0x7F )
    {
        out.push_back( char( unicode ) );
    }
    else if( unicode <= 0x7FF )
    {
        out.push_back( char( 0xC0 | ( unicode >> 6 ) ) );
        out.push_back( char( 0x80 | ( unicode & 0x3F ) ) );
    }
    else if( unicode <= 0xFFFF )
    {
        out.push_back( char( 0xE0 | ( unicode >> 12 ) ) );
        out.push_back( char( 0x80 | ( ( unicode >> 6 ) & 0x3F ) ) );
        out.push_back( char( 0x80 | ( unicode & 0x3F ) ) );
    }
    else
    {
        out.push_back( char( 0xF0 | ( unicode >> 18 ) ) );
        out.push_back( char( 0x80 | ( ( unicode >> 12 ) & 0x3F ) ) );
        out.push_back( char( 0x80 | ( ( unicode >> 6 ) & 0x3F ) ) );
        out.push_back( char( 0x80 | ( unicode & 0x3F ) ) );
    }
}

/**
 * @brief convert standard utf8 into modified utf8
 *
 * @param utf8 input
 * @return modified utf8
 * @throws std::runtime_error on invalid utf8
 */
[[nodiscard]] static inline auto encode( std::string_view utf8 ) -> std::string
{
    auto result = std::string( );
    result.reserve( utf8.size( ) );

    for( size_t pos = 0; pos < utf8.size( ); )
    {
        const auto unicode = decode_point( utf8, pos );
        if( unicode > 0xFFFF )
        {
            const auto tmp = unicode - 0x10000;
            append_unit( result, 0xD800 | ( tmp >> 10 ) );
            append_unit( result, 0xDC00 | ( tmp & 0x3FF ) );
        }
        else
        {
            append_unit( result, unicode );
        }
    }
    return result;
}

/**
 * @brief size of the modified utf8 form in bytes
 *
 * @throws std::runtime_error on invalid utf8
 */
[[nodiscard]] static inline auto encoded_size( std::string_view utf8 ) -> size_t
{
    auto size = size_t( 0 );
    for( size_t pos = 0; pos < utf8.size( ); )
    {
        const auto unicode = decode_point( utf8, pos );
        if( unicode == 0 )
        {
            size += 2;
        }
        else if( unicode <= 0x7F )
        {
            size += 1;
        }
        else if( unicode <= 0x7FF )
        {
            size += 2;
        }
        else if( unicode <= 0xFFFF )
        {
            size += 3;
        }
        else
        {
            size += 6;
        }
    }
    return size;
}

/**
 * @brief read one 16 bit unit from modified utf8
 */
static inline auto decode_unit( std::string_view str, size_t & pos ) -> uint32_t
{
    const auto lead = uint8_t( str[ pos++ ] );
    if( lead < 0x80 )
    {
        return lead;
    }

    auto length = size_t( 0 );
    auto unit   = uint32_t( 0 );
    if( ( lead & 0xE0 ) == 0xC0 )
    {
        length = 1;
        unit   = lead & 0x1F;
    }
    else if( ( lead & 0xF0 ) == 0xE0 )
    {
        length = 2;
        unit   = lead & 0x0F;
    }
    else
    {
        throw std::runtime_error( "invalid modified utf8 string" );
    }

    if( str.size( ) - pos < length )
    {
        throw std::runtime_error( "invalid modified utf8 string" );
    }

    for( size_t i = 0; i < length; i++ )
    {
        const auto byte = uint8_t( str[ pos++ ] );
        if( !is_continuation( byte ) )
        {
            throw std::runtime_error( "invalid modified utf8 string" );
        }
        unit = ( unit << 6 ) | ( byte & 0x3F );
    }
    return unit;
}

/**
 * @brief convert modified utf8 into standard utf8
 *
 * @param str modified utf8
 * @return utf8
 * @throws std::runtime_error on malformed input or unpaired surrogate
 */
[[nodiscard]] static inline auto decode( std::string_view str ) -> std::string
{
    auto result = std::string( );
    result.reserve( str.size( ) );

    for( size_t pos = 0; pos < str.size( ); )
    {
        const auto unit = decode_unit( str, pos );
        if( unit >= 0xD800 && unit < 0xDC00 )
        {
            if( pos >= str.size( ) )
            {
                throw std::runtime_error( "invalid modified utf8 string" );
            }
            const auto low = decode_unit( str, pos );
            if( low < 0xDC00 || low >= 0xE000 )
            {
                throw std::runtime_error( "invalid modified utf8 string" );
            }
            append_utf8( result, 0x10000 + ( ( unit - 0xD800 ) << 10 ) + ( low - 0xDC00 ) );
        }
        else if( unit >= 0xDC00 && unit < 0xE000 )
        {
            throw std::runtime_error( "invalid modified utf8 string" );
        }
        else
        {
            append_utf8( result, unit );
        }
    }
    return result;
}

}// namespace nbt::detail::mutf8
