/***************************************************************************\
* Name        : all tags provider                                           *
* Description : serves aggregated samples as test case arguments            *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include "../tag-kind.h"
#include "../value.h"
#include "aggregate.hpp"
#include "registry.hpp"
#include "stream-iterator.h"
#include <concepts>
#include <iterator>
#include <optional>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace nbt::fixtures
{

struct delivery_options
{
    /**
     * @brief Pass the tag kind as a second argument next to every value. With `all_at_once`
     *        the single argument becomes a `value_map` instead of a `value_set`.
     */
    bool include_kinds = false;

    /**
     * @brief Deliver one argument holding every value instead of one argument tuple per value.
     */
    bool all_at_once = false;

    [[nodiscard]] auto provides_tag_kinds( ) const noexcept -> bool
    {
        return include_kinds;
    }

    [[nodiscard]] auto provides_all_at_once( ) const noexcept -> bool
    {
        return all_at_once;
    }
};

/**
 * @brief what the test runner knows about the test case being invoked
 */
template < class T >
concept invocation_context = requires( const T & context ) {
    { context.provides_tag_kinds( ) } -> std::convertible_to< bool >;
    { context.provides_all_at_once( ) } -> std::convertible_to< bool >;
};

static_assert( invocation_context< delivery_options > );

using value_set = std::unordered_set< value >;
using value_map = aggregate_result;

using argument  = std::variant< value, tag_kind, value_set, value_map >;
using arguments = std::vector< argument >;

/**
 * @brief finite, single pass sequence of argument tuples
 *
 *        Delivery order is unspecified. Once exhausted the stream stays empty.
 */
class parameter_stream
{
public:
    using iterator = detail::stream_iterator< parameter_stream, arguments >;

    parameter_stream( aggregate_result values, const delivery_options & options )
        : m_values( std::move( values ) )
        , m_options( options )
    {
    }

    parameter_stream( const parameter_stream & )                     = delete;
    auto operator=( const parameter_stream & ) -> parameter_stream & = delete;
    parameter_stream( parameter_stream && )                          = default;
    auto operator=( parameter_stream && ) -> parameter_stream &      = default;

    [[nodiscard]] auto next( ) -> std::optional< arguments >
    {
        if( m_options.all_at_once )
        {
            if( m_delivered )
            {
                return std::nullopt;
            }
            m_delivered = true;

            auto result = arguments( );
            if( m_options.include_kinds )
            {
                result.emplace_back( std::move( m_values ) );
                return result;
            }

            auto values = value_set( );
            values.reserve( m_values.size( ) );
            while( !m_values.empty( ) )
            {
                auto node = m_values.extract( m_values.begin( ) );
                values.insert( std::move( node.key( ) ) );
            }
            result.emplace_back( std::move( values ) );
            return result;
        }

        if( m_values.empty( ) )
        {
            return std::nullopt;
        }

        //- extracting keeps the stream single pass without holding iterators across moves
        auto node   = m_values.extract( m_values.begin( ) );
        auto result = arguments( );
        result.emplace_back( std::move( node.key( ) ) );
        if( m_options.include_kinds )
        {
            result.emplace_back( node.mapped( ) );
        }
        return result;
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
    aggregate_result m_values;
    delivery_options m_options;
    bool m_delivered = false;
};

/**
 * @brief shape aggregated values as test case arguments
 *
 *        | all_at_once | include_kinds | tuples                    |
 *        |-------------|---------------|---------------------------|
 *        | true        | true          | 1 x { value_map }         |
 *        | true        | false         | 1 x { value_set }         |
 *        | false       | true          | N x { value, tag_kind }   |
 *        | false       | false         | N x { value }             |
 */
[[nodiscard]] static inline auto dispatch( aggregate_result values,
                                           const delivery_options & options ) -> parameter_stream
{
    return parameter_stream( std::move( values ), options );
}

/**
 * @brief fresh arguments for one test case invocation
 *
 * @param[in] context answers whether the test case wants kinds and aggregate delivery
 * @param[in] generators registry to aggregate
 * @throws std::logic_error if a generator breaks the value/kind correspondence
 */
template < invocation_context Context >
[[nodiscard]] static inline auto provide_arguments( const Context & context,
                                                    const registry & generators = registry::standard( ) )
    -> parameter_stream
{
    const auto options = delivery_options{
        .include_kinds = bool( context.provides_tag_kinds( ) ),
        .all_at_once   = bool( context.provides_all_at_once( ) ),
    };
    return dispatch( aggregate( generators ), options );
}

}// namespace nbt::fixtures
