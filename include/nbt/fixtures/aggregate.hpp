/***************************************************************************\
* Name        : value aggregator                                            *
* Description : collects the samples of all generators into one mapping     *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once

#include "../tag-kind.h"
#include "../value.h"
#include "registry.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace nbt::fixtures
{

struct tagged_value
{
    value data;
    //- kind of the generator that produced `data`
    tag_kind kind = tag_kind::end;
};

/**
 * @brief unique values mapped to the kind that produced them
 */
using aggregate_result = std::unordered_map< value, tag_kind >;

/**
 * @brief every sample of every registered generator, kinds in declaration order,
 *        samples in generator order, duplicates kept
 *
 * @throws std::logic_error if a generator produces a value of another kind
 */
[[nodiscard]] static inline auto collect( const registry & generators = registry::standard( ) )
    -> std::vector< tagged_value >
{
    auto result = std::vector< tagged_value >( );
    for( auto kind : generators.kinds( ) )
    {
        const auto produce = generators.lookup( kind );
        for( auto & sample : produce( ) )
        {
            if( sample.kind( ) != kind )
            {
                throw std::logic_error( "generator for " + std::string( tag_kind_name( kind ) ) +
                                        " produced " +
                                        std::string( tag_kind_name( sample.kind( ) ) ) );
            }
            result.push_back( { std::move( sample ), kind } );
        }
    }
    return result;
}

/**
 * @brief unique samples of every registered generator
 *
 *        The kind is part of a value's identity, values of different kinds never compare equal,
 *        so only duplicates within one kind can collide. Those collapse into one entry.
 *
 * @throws std::logic_error if a generator produces a value of another kind
 */
[[nodiscard]] static inline auto aggregate( const registry & generators = registry::standard( ) )
    -> aggregate_result
{
    auto result = aggregate_result( );
    for( auto & [ data, kind ] : collect( generators ) )
    {
        result.try_emplace( std::move( data ), kind );
    }
    return result;
}

}// namespace nbt::fixtures
