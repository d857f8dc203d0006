#pragma once

#include <sheetq/query/request.hpp>

#include <iostream>

namespace sheetq::query {

/// Print a preview as an aligned text table, followed by a row count line and
/// one `warning:` line per warning.
void print(const PreviewResult& result, std::ostream& out = std::cout);

}  // namespace sheetq::query
