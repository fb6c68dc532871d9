// Copyright (C) 2025 Roberto Rossini <roberros@uio.no>
//
// SPDX-License-Identifier: MIT

#pragma once

#include "localtable/nanobind.hpp"

namespace localtable {

// Binds localtable::DataType as localtable.DataType together with parse_ddl().
void bind_data_type(nanobind::module_ &m);

}  // namespace localtable
