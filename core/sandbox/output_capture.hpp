#pragma once

#include <pybind11/pybind11.h>

namespace sandscrape {

/// Swaps Python's sys.stdout for a write-through text stream on the
/// given descriptor for the lifetime of the object. The previous
/// stream is restored on every exit path, including exceptions.
///
/// Write-through matters: if the worker is killed on timeout, anything
/// the program printed has already reached the host.
class ScopedStdoutCapture {
public:
    explicit ScopedStdoutCapture(int fd = 1);
    ~ScopedStdoutCapture();

    ScopedStdoutCapture(const ScopedStdoutCapture&) = delete;
    ScopedStdoutCapture& operator=(const ScopedStdoutCapture&) = delete;

private:
    pybind11::module_ sys_;
    pybind11::object previous_;
    pybind11::object stream_;
};

} // namespace sandscrape
