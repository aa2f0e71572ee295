/***************************************************************************\
* Name        : Public API for NBT                                          *
* Description : all NBT binary serialize and deserialize functions          *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/
#pragma once

#include "bin/deserialize.hpp"
#include "bin/serialize.hpp"
#include "concepts.h"
#include "nbt/io/io.hpp"
#include "tag-kind.h"
#include "value.h"
#include <array>
#include <cstdlib>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nbt::bin
{

struct deserialize_options
{
    /**
     * @brief Maximal nesting of lists and compounds accepted by the decoder. Deeper input is
     *        rejected with std::runtime_error before it can exhaust the call stack.
     */
    uint32_t max_depth = NBT_MAX_DEPTH;
};

/**
 * @brief root tag of an NBT document
 */
struct named_value
{
    std::string name;
    value data;
};

/**
 * @brief serialize value payload via writer (no tag id, no name)
 *
 * @param[in] data to be serialized
 * @param[in] on_write function for handling the writes
 * @return serialized size in bytes
 * @throws std::runtime_error on error, or exceptions from `on_write`
 */
static inline auto serialize( const value & data, nbt::io::writer on_write ) -> size_t
{
    return detail::serialize( data, on_write );
}

/**
 * @brief return NBT payload size in bytes
 */
[[nodiscard]] static inline auto serialize_size( const value & data ) -> size_t
{
    return detail::serialize_size( data );
}

/**
 * @brief serialize value payload into container
 *
 * @param[in] data to be serialized
 * @param[out] result serialized payload
 * @return serialized size in bytes
 * @throws std::runtime_error on error
 */
template < nbt::resizable_container Container >
static inline auto serialize( const value & data, Container & result ) -> size_t
{
    const auto size = serialize_size( data );
    result.resize( size );
    auto writer = [ ptr = result.data( ) ]( const void * p_data, size_t size ) mutable
    {
        memcpy( ptr, p_data, size );
        ptr += size;
    };

    serialize( data, writer );
    return size;
}

/**
 * @brief serialize value payload
 *
 * @example `auto payload = nbt::bin::serialize< std::vector< std::byte > >( value );`
 */
template < nbt::resizable_container Container = std::string >
[[nodiscard]] static inline auto serialize( const value & data ) -> Container
{
    auto result = Container( );
    serialize< Container >( data, result );
    return result;
}

/**
 * @brief serialize root tag (tag id, name, payload) via writer
 *
 * @throws std::runtime_error on error, or exceptions from `on_write`
 */
static inline auto serialize_named( std::string_view name, const value & data,
                                    nbt::io::writer on_write ) -> size_t
{
    auto stream = detail::ostream( on_write );
    detail::serialize_named( stream, name, data );
    return stream.size( );
}

template < nbt::resizable_container Container = std::string >
[[nodiscard]] static inline auto serialize_named( std::string_view name, const value & data )
    -> Container
{
    const auto size = serialize_named( name, data, nbt::io::writer( nullptr ) );
    auto result     = Container( );
    result.resize( size );
    auto writer = [ ptr = result.data( ) ]( const void * p_data, size_t size ) mutable
    {
        memcpy( ptr, p_data, size );
        ptr += size;
    };
    serialize_named( name, data, writer );
    return result;
}

/**
 * @brief deserialize payload of the given kind from reader
 *        reading stops right after the payload, the reader can be used again
 *
 * @throws std::runtime_error on error
 */
[[nodiscard]] static inline auto deserialize( tag_kind kind, nbt::io::reader reader,
                                              const deserialize_options & options = { } ) -> value
{
    auto stream = detail::istream( reader );
    return detail::deserialize( stream, kind, 0, options.max_depth );
}

/**
 * @brief deserialize payload of the given kind
 *
 * @param[in] kind tag kind of the payload
 * @param[in] payload serialized payload, must be consumed completely
 * @return deserialized value
 * @throws std::runtime_error on error
 * @example `auto value = nbt::bin::deserialize( nbt::tag_kind::int_array, payload );`
 */
template < nbt::size_container Container >
[[nodiscard]] static inline auto deserialize( tag_kind kind, const Container & payload,
                                              const deserialize_options & options = { } ) -> value
{
    auto reader = [ ptr = reinterpret_cast< const char * >( payload.data( ) ),
                    end = reinterpret_cast< const char * >( payload.data( ) ) + payload.size( ) ](
                      void * data, size_t size ) mutable -> size_t
    {
        size_t bytes_left = end - ptr;

        size = std::min( size, bytes_left );
        memcpy( data, ptr, size );
        ptr += size;
        return size;
    };

    auto stream = detail::istream( reader, payload.size( ) );
    auto result = detail::deserialize( stream, kind, 0, options.max_depth );
    detail::check_if_empty( stream );
    return result;
}

/**
 * @brief deserialize root tag (tag id, name, payload) from reader
 *
 * @throws std::runtime_error on error, `end` as root kind is an error
 */
[[nodiscard]] static inline auto deserialize_named( nbt::io::reader reader,
                                                    const deserialize_options & options = { } )
    -> named_value
{
    auto stream = detail::istream( reader );
    const auto kind = detail::read_kind( stream );
    auto result     = named_value{ };
    result.name     = detail::read_string( stream );
    result.data     = detail::deserialize( stream, kind, 0, options.max_depth );
    return result;
}

template < nbt::size_container Container >
[[nodiscard]] static inline auto deserialize_named( const Container & document,
                                                    const deserialize_options & options = { } )
    -> named_value
{
    auto reader = [ ptr = reinterpret_cast< const char * >( document.data( ) ),
                    end = reinterpret_cast< const char * >( document.data( ) ) + document.size( ) ](
                      void * data, size_t size ) mutable -> size_t
    {
        size_t bytes_left = end - ptr;

        size = std::min( size, bytes_left );
        memcpy( data, ptr, size );
        ptr += size;
        return size;
    };

    auto stream     = detail::istream( reader, document.size( ) );
    const auto kind = detail::read_kind( stream );
    auto result     = named_value{ };
    result.name     = detail::read_string( stream );
    result.data     = detail::deserialize( stream, kind, 0, options.max_depth );
    detail::check_if_empty( stream );
    return result;
}

/**
 * @brief payload encoder bound to one tag kind
 *
 * @throws std::invalid_argument if `data` is not of kind `Kind`
 */
template < tag_kind Kind >
[[nodiscard]] static inline auto encode_as( const value & data ) -> std::vector< std::byte >
{
    static_assert( Kind != tag_kind::end );

    if( data.kind( ) != Kind )
    {
        throw std::invalid_argument( "value is not of kind " + std::string( tag_kind_name( Kind ) ) );
    }
    return serialize< std::vector< std::byte > >( data );
}

/**
 * @brief payload decoder bound to one tag kind
 */
template < tag_kind Kind >
[[nodiscard]] static inline auto decode_as( std::span< const std::byte > payload ) -> value
{
    static_assert( Kind != tag_kind::end );

    return deserialize( Kind, payload );
}

using encoder_fn = auto ( * )( const value & ) -> std::vector< std::byte >;
using decoder_fn = auto ( * )( std::span< const std::byte > ) -> value;

namespace detail
{
template < size_t... I >
static constexpr auto make_encoders( std::index_sequence< I... > )
{
    return std::array< encoder_fn, sizeof...( I ) >{ &encode_as< tag_kind( I + 1 ) >... };
}

template < size_t... I >
static constexpr auto make_decoders( std::index_sequence< I... > )
{
    return std::array< decoder_fn, sizeof...( I ) >{ &decode_as< tag_kind( I + 1 ) >... };
}

static constexpr auto encoders = make_encoders( std::make_index_sequence< tag_kind_count - 1 >( ) );
static constexpr auto decoders = make_decoders( std::make_index_sequence< tag_kind_count - 1 >( ) );

static inline void check_codec_kind( tag_kind kind )
{
    if( kind == tag_kind::end || !is_valid_tag_kind( uint8_t( kind ) ) )
    {
        throw std::invalid_argument( "no codec for tag kind " +
                                     std::string( tag_kind_name( kind ) ) );
    }
}
}// namespace detail

/**
 * @brief payload encoder for `kind`
 *
 * @throws std::invalid_argument for `tag_kind::end` or an unknown kind
 */
[[nodiscard]] static inline auto encoder_for( tag_kind kind ) -> encoder_fn
{
    detail::check_codec_kind( kind );
    return detail::encoders[ tag_kind_index( kind ) - 1 ];
}

/**
 * @brief payload decoder for `kind`
 *
 * @throws std::invalid_argument for `tag_kind::end` or an unknown kind
 */
[[nodiscard]] static inline auto decoder_for( tag_kind kind ) -> decoder_fn
{
    detail::check_codec_kind( kind );
    return detail::decoders[ tag_kind_index( kind ) - 1 ];
}

}// namespace nbt::bin
