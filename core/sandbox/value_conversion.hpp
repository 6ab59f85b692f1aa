#pragma once

#include "engine/execution_result.hpp"
#include <pybind11/pybind11.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandscrape {

constexpr int kMaxDepth = 64;

/// The entry point returned something other than a sequence of
/// string-keyed mappings.
class RecordShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Convert a Python value to JSON. None, bool, int, float, str, list,
/// tuple and dict map structurally; anything else is rendered with
/// str(). Nested dict keys are stringified. Throws RecordShapeError
/// beyond kMaxDepth levels of nesting.
nlohmann::json toJson(pybind11::handle value, int depth = 0);

/// Convert scrape()'s return value: a list or tuple whose elements are
/// dicts with str keys. Throws RecordShapeError otherwise.
std::vector<Record> toRecords(pybind11::handle value);

} // namespace sandscrape
