/***************************************************************************\
* Name        : stream iterator                                             *
* Description : single pass input iterator over a `next()` based stream     *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>

namespace nbt::fixtures::detail
{

template < typename Stream, typename T >
class stream_iterator
{
    Stream * p_stream = nullptr;
    //- `operator*` hands out the element by reference
    mutable std::optional< T > current;

public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;

    stream_iterator( ) = default;

    explicit stream_iterator( Stream & stream )
        : p_stream( &stream )
        , current( stream.next( ) )
    {
    }

    auto operator*( ) const -> T &
    {
        return *current;
    }

    auto operator->( ) const -> T *
    {
        return &*current;
    }

    auto operator++( ) -> stream_iterator &
    {
        current = p_stream->next( );
        return *this;
    }

    void operator++( int )
    {
        ++*this;
    }

    friend auto operator==( const stream_iterator & it, std::default_sentinel_t ) noexcept -> bool
    {
        return !it.current.has_value( );
    }
};

}// namespace nbt::fixtures::detail
