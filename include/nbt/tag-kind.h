/***************************************************************************\
* Name        : tag kinds                                                   *
* Description : NBT tag ids and helpers                                     *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace nbt
{

//- https://minecraft.wiki/w/NBT_format
enum class tag_kind : uint8_t
{
    //- terminates a compound, never stored as a value
    end = 0,
    byte = 1,
    short_ = 2,
    int_ = 3,
    long_ = 4,
    float_ = 5,
    double_ = 6,
    //- int32 length + bytes
    byte_array = 7,
    //- uint16 length + modified utf8
    string = 8,
    //- element tag id + int32 length + payloads
    list = 9,
    //- named tags terminated by `end`
    compound = 10,
    int_array = 11,
    long_array = 12,
};

inline constexpr auto tag_kind_count = size_t( 13 );

static constexpr auto tag_kind_index( tag_kind kind ) noexcept -> size_t
{
    return size_t( std::underlying_type_t< tag_kind >( kind ) );
}

[[nodiscard]] static constexpr auto is_valid_tag_kind( uint8_t id ) noexcept -> bool
{
    return id < tag_kind_count;
}

//- all kinds in declaration order, `end` included
inline constexpr auto all_tag_kinds = [] {
    auto result = std::array< tag_kind, tag_kind_count >( );
    for( size_t i = 0; i < tag_kind_count; i++ )
    {
        result[ i ] = tag_kind( i );
    }
    return result;
}( );

inline constexpr auto tag_kind_names = std::array< std::string_view, tag_kind_count >{
    "end",    "byte",     "short",  "int",  "long",      "float",     "double",
    "byte_array", "string", "list", "compound", "int_array", "long_array",
};

[[nodiscard]] static constexpr auto tag_kind_name( tag_kind kind ) noexcept -> std::string_view
{
    if( !is_valid_tag_kind( uint8_t( kind ) ) )
    {
        return "unknown";
    }
    return tag_kind_names[ tag_kind_index( kind ) ];
}

[[nodiscard]] static constexpr auto tag_kind_from_name( std::string_view name ) noexcept
    -> std::optional< tag_kind >
{
    for( auto kind : all_tag_kinds )
    {
        if( tag_kind_name( kind ) == name )
        {
            return kind;
        }
    }
    return std::nullopt;
}

[[nodiscard]] static constexpr auto is_array_kind( tag_kind kind ) noexcept -> bool
{
    return kind == tag_kind::byte_array || kind == tag_kind::int_array ||
        kind == tag_kind::long_array;
}

[[nodiscard]] static constexpr auto is_container_kind( tag_kind kind ) noexcept -> bool
{
    return kind == tag_kind::list || kind == tag_kind::compound;
}

}// namespace nbt
