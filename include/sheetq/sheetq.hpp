#pragma once

/// Convenience umbrella header for the sheetq library.

#include <sheetq/codec/json.hpp>
#include <sheetq/core/error.hpp>
#include <sheetq/core/value.hpp>
#include <sheetq/query/print.hpp>
#include <sheetq/query/request.hpp>
#include <sheetq/query/service.hpp>
#include <sheetq/source/catalog.hpp>
#include <sheetq/source/csv.hpp>
#include <sheetq/source/manifest.hpp>
#include <sheetq/source/row_source.hpp>
