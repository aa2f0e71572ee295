/***************************************************************************\
* Name        : Public API for NBT fixtures                                 *
* Description : sample values of every tag kind for tests                   *
* Author      : antonin.kriz@gmail.com                                      *
* ------------------------------------------------------------------------- *
* This is free software; you can redistribute it and/or modify it under the *
* terms of the MIT license. A copy of the license can be found in the file  *
* "LICENSE" at the root of this distribution.                               *
\***************************************************************************/
#pragma once

#include "fixtures/aggregate.hpp"
#include "fixtures/encoded.hpp"
#include "fixtures/generators.hpp"
#include "fixtures/provider.hpp"
#include "fixtures/registry.hpp"
