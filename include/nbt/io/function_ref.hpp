/***************************************************************************\
* Name        : function_ref                                                *
* Description : non-owning reference to a callable                          *
* Author      : LLVM                                                        *
* Reference   : https://llvm.org/doxygen/classllvm_1_1function__ref_3_01Ret_07Params_8_8_8_08_4.html
*
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
#include <utility>

namespace nbt::detail
{

template < typename Fn >
class function_ref;

/**
 * @brief the referenced callable must outlive the function_ref
 */
template < typename Ret, typename... Params >
class function_ref< Ret( Params... ) >
{
    using callback_type = Ret ( * )( intptr_t callable, Params... params );

    callback_type callback = nullptr;
    intptr_t callable      = 0;

    template < typename Callable >
    static auto invoke( intptr_t callable, Params... params ) -> Ret
    {
        return ( *reinterpret_cast< Callable * >( callable ) )(
            std::forward< Params >( params )... );
    }

public:
    function_ref( ) = default;
    function_ref( std::nullptr_t )
    {
    }

    template < typename Callable >
        requires( !std::is_same_v< std::remove_cvref_t< Callable >, function_ref > &&
                  ( std::is_void_v< Ret > || std::is_invocable_r_v< Ret, Callable, Params... > ) )
    function_ref( Callable && callable )
        : callback( invoke< std::remove_reference_t< Callable > > )
        , callable( reinterpret_cast< intptr_t >( &callable ) )
    {
    }

    auto operator( )( Params... params ) const -> Ret
    {
        return callback( callable, std::forward< Params >( params )... );
    }

    explicit operator bool( ) const noexcept
    {
        return callback != nullptr;
    }
};

}// namespace nbt::detail
