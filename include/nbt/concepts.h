/***************************************************************************\
* Name        : template concepts                                           *
* Description : general template concepts used by NBT de/serializer         *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace nbt
{
template < class T >
concept resizable_container = requires( T container ) {
    { container.data( ) } -> std::same_as< typename std::decay_t< T >::value_type * >;
    { container.resize( 1 ) };
    typename std::decay_t< T >::value_type;
    requires sizeof( typename std::decay_t< T >::value_type ) == sizeof( char );
};

template < class T >
concept size_container = requires( T container ) {
    { container.data( ) };
    { container.size( ) } -> std::convertible_to< std::size_t >;
    typename std::decay_t< T >::value_type;
    requires sizeof( typename std::decay_t< T >::value_type ) == sizeof( char );
};

namespace detail
{
//- NBT numbers are all signed, fixed width; uint16_t is the string length prefix
template < class T >
concept nbt_integer = std::same_as< T, int8_t > || std::same_as< T, int16_t > ||
    std::same_as< T, int32_t > || std::same_as< T, int64_t > || std::same_as< T, uint16_t >;

template < class T >
concept nbt_float = std::same_as< T, float > || std::same_as< T, double >;

template < class T >
concept nbt_number = nbt_integer< T > || nbt_float< T >;

template < class T >
concept nbt_number_array = requires( T container ) {
    { container.data( ) } -> std::same_as< typename std::decay_t< T >::value_type * >;
    { container.size( ) } -> std::convertible_to< std::size_t >;
    { container.resize( 1 ) };
    typename std::decay_t< T >::value_type;
} && nbt_integer< typename std::decay_t< T >::value_type >;

}// namespace detail
}// namespace nbt
