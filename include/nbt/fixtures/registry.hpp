/***************************************************************************\
* Name        : generator registry                                          *
* Description : maps every tag kind to its sample generator                 *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include "../tag-kind.h"
#include "generators.hpp"
#include <array>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace nbt::fixtures
{

class registry
{
public:
    using entry = std::pair< tag_kind, generator >;

    /**
     * @brief build registry from `{ kind, generator }` pairs
     *
     * @throws std::invalid_argument for `tag_kind::end`, an unknown kind, a null generator or
     *         a kind registered twice (in a constant expression this is a compile error)
     */
    constexpr registry( std::initializer_list< entry > entries )
        : registry( std::span< const entry >( entries.begin( ), entries.size( ) ) )
    {
    }

    constexpr explicit registry( std::span< const entry > entries )
    {
        for( const auto & [ kind, produce ] : entries )
        {
            if( kind == tag_kind::end || !is_valid_tag_kind( uint8_t( kind ) ) )
            {
                throw std::invalid_argument( "invalid tag kind for generator" );
            }
            if( produce == nullptr )
            {
                throw std::invalid_argument( "null generator" );
            }
            if( m_generators[ tag_kind_index( kind ) ] != nullptr )
            {
                throw std::invalid_argument( "duplicate generator" );
            }
            m_generators[ tag_kind_index( kind ) ] = produce;
        }
    }

    /**
     * @brief registry with a generator for every kind except `tag_kind::end`
     */
    [[nodiscard]] static auto standard( ) noexcept -> const registry &;

    [[nodiscard]] constexpr auto contains( tag_kind kind ) const noexcept -> bool
    {
        return is_valid_tag_kind( uint8_t( kind ) ) &&
            m_generators[ tag_kind_index( kind ) ] != nullptr;
    }

    /**
     * @brief generator for `kind`
     *
     * @throws std::invalid_argument when asked for `tag_kind::end` or a kind without generator,
     *         this is always a bug in the caller
     */
    [[nodiscard]] auto lookup( tag_kind kind ) const -> generator
    {
        if( kind == tag_kind::end )
        {
            throw std::invalid_argument( "tag kind end has no generator" );
        }
        if( !contains( kind ) )
        {
            throw std::invalid_argument( "unable to find generator for tag kind " +
                                         std::string( tag_kind_name( kind ) ) );
        }
        return m_generators[ tag_kind_index( kind ) ];
    }

    //- registered kinds in declaration order
    [[nodiscard]] auto kinds( ) const -> std::vector< tag_kind >
    {
        auto result = std::vector< tag_kind >( );
        for( auto kind : all_tag_kinds )
        {
            if( contains( kind ) )
            {
                result.push_back( kind );
            }
        }
        return result;
    }

    [[nodiscard]] constexpr auto is_exhaustive( ) const noexcept -> bool
    {
        for( auto kind : all_tag_kinds )
        {
            if( kind != tag_kind::end && !contains( kind ) )
            {
                return false;
            }
        }
        return true;
    }

private:
    std::array< generator, tag_kind_count > m_generators = { };
};

namespace detail
{
//- adding a kind: one enum value, one generator, one line here
inline constexpr auto standard_registry = registry{
    { tag_kind::byte, &generators::byte_samples },
    { tag_kind::short_, &generators::short_samples },
    { tag_kind::int_, &generators::int_samples },
    { tag_kind::long_, &generators::long_samples },
    { tag_kind::float_, &generators::float_samples },
    { tag_kind::double_, &generators::double_samples },
    { tag_kind::byte_array, &generators::byte_array_samples },
    { tag_kind::string, &generators::string_samples },
    { tag_kind::list, &generators::list_samples },
    { tag_kind::compound, &generators::compound_samples },
    { tag_kind::int_array, &generators::int_array_samples },
    { tag_kind::long_array, &generators::long_array_samples },
};

static_assert( standard_registry.is_exhaustive( ), "every tag kind needs a generator" );
static_assert( !standard_registry.contains( tag_kind::end ) );

}// namespace detail

inline auto registry::standard( ) noexcept -> const registry &
{
    return detail::standard_registry;
}

}// namespace nbt::fixtures
