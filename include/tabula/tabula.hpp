#pragma once

/// Convenience umbrella header for the Tabula library.

#include <tabula/core/record.hpp>
#include <tabula/core/schema.hpp>
#include <tabula/core/stats.hpp>
#include <tabula/core/value.hpp>
#include <tabula/io/csv.hpp>
#include <tabula/io/json.hpp>
#include <tabula/runtime/batch.hpp>
#include <tabula/runtime/catalog.hpp>
#include <tabula/runtime/dispatcher.hpp>
#include <tabula/runtime/error.hpp>
#include <tabula/runtime/ops.hpp>
#include <tabula/runtime/request.hpp>
