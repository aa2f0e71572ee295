/***************************************************************************\
* Name        : generic reader and writer                                   *
* Description : user specific input/output used for NBT de/serialization    *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/

#pragma once
#include "function_ref.hpp"
#include <cstdlib>

namespace nbt::io
{
/**
 * @brief generic writer used to write exactly `size` number of bytes from `p_data`
 *
 * @param[in] p_data input buffer
 * @param[in] size input buffer size
 * @throws any exception thrown will stop `nbt::bin::serialize` and is propagated to its caller
 */
using writer = nbt::detail::function_ref< void( const void * p_data, size_t size ) >;

/**
 * @brief generic reader used to read up to `size` number of bytes into `p_data`
 *
 * @param p_data output buffer (never nullptr)
 * @param[in] size number of bytes to read (always > 0)
 * @return number of bytes copied into `p_data`, could be less than `size`. 0 indicates end-of-file
 * @throws any exception thrown will stop `nbt::bin::deserialize` and is propagated to its caller
 */
using reader = nbt::detail::function_ref< size_t( void * p_data, size_t size ) >;

}// namespace nbt::io
