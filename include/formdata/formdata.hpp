// Copyright (c) 2026, formdata Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef FORMDATA_FORMDATA_HPP
#define FORMDATA_FORMDATA_HPP

// Project version
#define FORMDATA_VERSION_MAJOR 0
#define FORMDATA_VERSION_MINOR 1
#define FORMDATA_VERSION_PATCH 0

#include <formdata/export.hpp>
#include <formdata/enums.hpp>
#include <formdata/errors.hpp>
#include <formdata/part.hpp>
#include <formdata/traversable.hpp>
#include <formdata/value.hpp>
#include <formdata/convert.hpp>
#include <formdata/serializer.hpp>
#include <formdata/encoder.hpp>

#endif
