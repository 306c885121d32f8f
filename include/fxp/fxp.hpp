/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

// Core algebra is header-only and has no dependencies beyond the standard
// library. format.hpp (fmt) is opt-in.
#include <fxp/descriptor.hpp>
#include <fxp/storage.hpp>
#include <fxp/rules.hpp>
#include <fxp/literal.hpp>
#include <fxp/fixed.hpp>
#include <fxp/ops.hpp>
#include <fxp/construct.hpp>
#include <fxp/families.hpp>
