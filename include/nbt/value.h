/***************************************************************************\
* Name        : NBT value                                                   *
* Description : tagged union of all NBT payload kinds                       *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include "tag-kind.h"
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace nbt
{
class value;

using byte_array = std::vector< int8_t >;
using int_array  = std::vector< int32_t >;
using long_array = std::vector< int64_t >;

/**
 * @brief ordered sequence of values of the same kind
 *        an empty list may keep `element_kind == tag_kind::end`
 */
struct list
{
    tag_kind element_kind = tag_kind::end;
    std::vector< value > items;
};

/**
 * @brief string keyed mapping of values
 */
struct compound
{
    //- `value` is still incomplete here, libstdc++ and libc++ both accept std::map of it
    std::map< std::string, value > entries;
};

inline auto operator==( const list & lhs, const list & rhs ) noexcept -> bool;
inline auto operator==( const compound & lhs, const compound & rhs ) noexcept -> bool;

class value
{
public:
    //- alternatives are in tag id order, index + 1 == tag id
    using variant_type = std::variant< int8_t, int16_t, int32_t, int64_t, float, double,
                                       byte_array, std::string, list, compound, int_array,
                                       long_array >;

    value( ) = default;

    template < typename T >
        requires( !std::is_same_v< std::remove_cvref_t< T >, value > &&
                  std::is_constructible_v< variant_type, T > )
    value( T && data )
        : m_data( std::forward< T >( data ) )
    {
    }

    [[nodiscard]] auto kind( ) const noexcept -> tag_kind
    {
        return tag_kind( m_data.index( ) + 1 );
    }

    [[nodiscard]] auto data( ) const noexcept -> const variant_type &
    {
        return m_data;
    }

    template < typename T >
    [[nodiscard]] auto is( ) const noexcept -> bool
    {
        return std::holds_alternative< T >( m_data );
    }

    template < typename T >
    [[nodiscard]] auto get( ) const -> const T &
    {
        return std::get< T >( m_data );
    }

    template < typename T >
    [[nodiscard]] auto get_if( ) const noexcept -> const T *
    {
        return std::get_if< T >( &m_data );
    }

private:
    variant_type m_data;
};

static_assert( std::variant_size_v< value::variant_type > == tag_kind_count - 1 );
static_assert( std::is_same_v< std::variant_alternative_t< tag_kind_index( tag_kind::byte_array ) - 1,
                                                           value::variant_type >,
                               byte_array > );
static_assert( std::is_same_v< std::variant_alternative_t< tag_kind_index( tag_kind::compound ) - 1,
                                                           value::variant_type >,
                               compound > );
static_assert( std::is_same_v< std::variant_alternative_t< tag_kind_index( tag_kind::long_array ) - 1,
                                                           value::variant_type >,
                               long_array > );

namespace detail
{
//- floats compare by bit pattern, -0.0 != 0.0 and NaN == NaN
template < typename T >
static inline auto same_content( const T & lhs, const T & rhs ) noexcept -> bool
{
    if constexpr( std::is_same_v< T, float > )
    {
        return std::bit_cast< uint32_t >( lhs ) == std::bit_cast< uint32_t >( rhs );
    }
    else if constexpr( std::is_same_v< T, double > )
    {
        return std::bit_cast< uint64_t >( lhs ) == std::bit_cast< uint64_t >( rhs );
    }
    else
    {
        return lhs == rhs;
    }
}

static inline void hash_combine( size_t & seed, size_t hash ) noexcept
{
    seed ^= hash + 0x9e3779b97f4a7c15ULL + ( seed << 6 ) + ( seed >> 2 );
}

static inline auto hash_value( const value & v ) noexcept -> size_t;

template < typename T >
static inline auto hash_content( const T & content ) noexcept -> size_t
{
    if constexpr( std::is_same_v< T, float > )
    {
        return std::hash< uint32_t >( )( std::bit_cast< uint32_t >( content ) );
    }
    else if constexpr( std::is_same_v< T, double > )
    {
        return std::hash< uint64_t >( )( std::bit_cast< uint64_t >( content ) );
    }
    else if constexpr( std::is_same_v< T, std::string > )
    {
        return std::hash< std::string >( )( content );
    }
    else if constexpr( std::is_same_v< T, list > )
    {
        auto seed = size_t( content.element_kind );
        for( const auto & item : content.items )
        {
            hash_combine( seed, hash_value( item ) );
        }
        return seed;
    }
    else if constexpr( std::is_same_v< T, compound > )
    {
        auto seed = content.entries.size( );
        for( const auto & [ name, item ] : content.entries )
        {
            hash_combine( seed, std::hash< std::string >( )( name ) );
            hash_combine( seed, hash_value( item ) );
        }
        return seed;
    }
    else if constexpr( std::is_integral_v< T > )
    {
        return std::hash< T >( )( content );
    }
    else
    {
        //- byte_array, int_array, long_array
        auto seed = content.size( );
        for( auto element : content )
        {
            hash_combine( seed, std::hash< typename T::value_type >( )( element ) );
        }
        return seed;
    }
}

static inline auto hash_value( const value & v ) noexcept -> size_t
{
    auto seed = size_t( v.kind( ) );
    hash_combine( seed, std::visit( []( const auto & content ) { return hash_content( content ); },
                                    v.data( ) ) );
    return seed;
}

}// namespace detail

inline auto operator==( const value & lhs, const value & rhs ) noexcept -> bool
{
    if( lhs.kind( ) != rhs.kind( ) )
    {
        return false;
    }

    return std::visit(
        [ &rhs ]( const auto & content ) -> bool
        {
            using T = std::remove_cvref_t< decltype( content ) >;
            return detail::same_content( content, rhs.get< T >( ) );
        },
        lhs.data( ) );
}

inline auto operator==( const list & lhs, const list & rhs ) noexcept -> bool
{
    return lhs.element_kind == rhs.element_kind && lhs.items == rhs.items;
}

inline auto operator==( const compound & lhs, const compound & rhs ) noexcept -> bool
{
    return lhs.entries == rhs.entries;
}

}// namespace nbt

template <>
struct std::hash< nbt::value >
{
    auto operator( )( const nbt::value & v ) const noexcept -> size_t
    {
        return nbt::detail::hash_value( v );
    }
};
