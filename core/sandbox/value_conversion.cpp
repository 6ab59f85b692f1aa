#include "sandbox/value_conversion.hpp"

#include <cmath>

namespace py = pybind11;

namespace sandscrape {

namespace {

std::string typeName(py::handle value) {
    return py::str(py::type::handle_of(value).attr("__name__"));
}

} // namespace

nlohmann::json toJson(py::handle value, int depth) {
    if (depth > kMaxDepth) {
        throw RecordShapeError("record nesting deeper than " + std::to_string(kMaxDepth));
    }

    if (value.is_none()) return nullptr;

    // bool before int: bool is an int subclass.
    if (py::isinstance<py::bool_>(value)) return value.cast<bool>();

    if (py::isinstance<py::int_>(value)) {
        try {
            return value.cast<long long>();
        } catch (const py::cast_error&) {
            return std::string(py::str(value));  // out of int64 range
        }
    }

    if (py::isinstance<py::float_>(value)) {
        double d = value.cast<double>();
        if (!std::isfinite(d)) return std::string(py::str(value));
        return d;
    }

    if (py::isinstance<py::str>(value)) return value.cast<std::string>();

    if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
        nlohmann::json arr = nlohmann::json::array();
        for (py::handle item : value) {
            arr.push_back(toJson(item, depth + 1));
        }
        return arr;
    }

    if (py::isinstance<py::dict>(value)) {
        nlohmann::json obj = nlohmann::json::object();
        for (auto item : value.cast<py::dict>()) {
            obj[std::string(py::str(item.first))] = toJson(item.second, depth + 1);
        }
        return obj;
    }

    return std::string(py::str(value));
}

std::vector<Record> toRecords(py::handle value) {
    if (!py::isinstance<py::list>(value) && !py::isinstance<py::tuple>(value)) {
        throw RecordShapeError("scrape() must return a list of dicts, got " + typeName(value));
    }

    std::vector<Record> records;
    size_t index = 0;
    for (py::handle item : value) {
        if (!py::isinstance<py::dict>(item)) {
            throw RecordShapeError("scrape() must return a list of dicts, item " +
                                   std::to_string(index) + " is " + typeName(item));
        }
        Record rec = Record::object();
        for (auto kv : item.cast<py::dict>()) {
            if (!py::isinstance<py::str>(kv.first)) {
                throw RecordShapeError("record keys must be str, item " +
                                       std::to_string(index) + " has a " +
                                       typeName(kv.first) + " key");
            }
            rec[kv.first.cast<std::string>()] = toJson(kv.second, 1);
        }
        records.push_back(std::move(rec));
        ++index;
    }
    return records;
}

} // namespace sandscrape
