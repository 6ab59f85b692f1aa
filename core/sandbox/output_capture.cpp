#include "sandbox/output_capture.hpp"

#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace sandscrape {

ScopedStdoutCapture::ScopedStdoutCapture(int fd)
    : sys_(py::module_::import("sys")) {
    py::module_ io = py::module_::import("io");
    py::object raw = io.attr("FileIO")(fd, "w", py::arg("closefd") = false);
    stream_ = io.attr("TextIOWrapper")(raw,
                                      py::arg("encoding") = "utf-8",
                                      py::arg("errors") = "replace",
                                      py::arg("write_through") = true);
    previous_ = sys_.attr("stdout");
    sys_.attr("stdout") = stream_;
}

ScopedStdoutCapture::~ScopedStdoutCapture() {
    // Destructors must not throw; a failed flush loses at most a partial line.
    try {
        stream_.attr("flush")();
    } catch (const py::error_already_set& e) {
        spdlog::warn("[worker] stdout flush failed: {}", e.what());
    }
    try {
        sys_.attr("stdout") = previous_;
    } catch (const py::error_already_set& e) {
        spdlog::error("[worker] could not restore sys.stdout: {}", e.what());
    }
}

} // namespace sandscrape
