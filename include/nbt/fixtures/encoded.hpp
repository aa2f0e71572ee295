/***************************************************************************\
* Name        : encoded sample provider                                     *
* Description : pairs generated samples with their binary encoding          *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include "../nbt.hpp"
#include "../tag-kind.h"
#include "../value.h"
#include "generators.hpp"
#include "registry.hpp"
#include "stream-iterator.h"
#include <cstddef>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace nbt::fixtures
{

/**
 * @brief canonical payload encoding of one kind, may throw on values it cannot encode
 */
using encoder = auto ( * )( const value & ) -> std::vector< std::byte >;

struct encoded_sample
{
    value data;
    std::vector< std::byte > bytes;
};

/**
 * @brief one `encoded_sample` per sample of a generator, encoded lazily
 *
 *        Exceptions thrown by the encoder propagate out of `next()` unchanged: a sample the
 *        paired encoder cannot serialize is a broken fixture.
 */
class encoded_stream
{
public:
    using iterator = detail::stream_iterator< encoded_stream, encoded_sample >;

    encoded_stream( sample_set samples, encoder encode ) noexcept
        : m_samples( std::move( samples ) )
        , m_encode( encode )
    {
    }

    encoded_stream( const encoded_stream & )                     = delete;
    auto operator=( const encoded_stream & ) -> encoded_stream & = delete;
    encoded_stream( encoded_stream && )                          = default;
    auto operator=( encoded_stream && ) -> encoded_stream &      = default;

    [[nodiscard]] auto next( ) -> std::optional< encoded_sample >
    {
        if( m_position >= m_samples.size( ) )
        {
            return std::nullopt;
        }

        auto & sample = m_samples[ m_position++ ];
        auto bytes    = m_encode( sample );
        return encoded_sample{ std::move( sample ), std::move( bytes ) };
    }

    [[nodiscard]] auto begin( ) -> iterator
    {
        return iterator( *this );
    }

    [[nodiscard]] auto end( ) const noexcept -> std::default_sentinel_t
    {
        return { };
    }

private:
    sample_set m_samples;
    size_t m_position = 0;
    encoder m_encode;
};

/**
 * @brief pair a generator with an encoder
 *
 * @throws std::invalid_argument on null generator or encoder
 */
[[nodiscard]] static inline auto provide_encoded( generator produce, encoder encode )
    -> encoded_stream
{
    if( produce == nullptr || encode == nullptr )
    {
        throw std::invalid_argument( "encoded provider needs a generator and an encoder" );
    }
    return encoded_stream( produce( ), encode );
}

/**
 * @brief standard generator of `Kind` paired with the codec payload encoder of `Kind`
 */
template < tag_kind Kind >
[[nodiscard]] static inline auto provide_encoded( ) -> encoded_stream
{
    static_assert( Kind != tag_kind::end, "tag kind end has no samples" );

    return provide_encoded( registry::standard( ).lookup( Kind ), &nbt::bin::encode_as< Kind > );
}

}// namespace nbt::fixtures
