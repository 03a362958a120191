#define PYBIND11_DETAILED_ERROR_MESSAGES
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "duration_parser.hpp"
#include "progress_bar.hpp"
#include "timer_config.hpp"

namespace py = pybind11;

// InvalidDuration and InvalidConfig derive from std::invalid_argument and
// reach Python as ValueError.
PYBIND11_MODULE(pomotimer, m) {
    m.def("parse_duration", &parse_duration, py::arg("text"));
    m.def("format_clock", &formatDuration, py::arg("seconds"));
    m.def("validate_config", &validate_config, py::arg("config"));

    py::class_<TimerConfig>(m, "TimerConfig")
        .def(py::init<>())
        .def_readwrite("total_seconds", &TimerConfig::total_seconds)
        .def_readwrite("label", &TimerConfig::label)
        .def_readwrite("bar_width", &TimerConfig::bar_width)
        .def_readwrite("poll_interval", &TimerConfig::poll_interval)
        .def_readwrite("early_color", &TimerConfig::early_color)
        .def_readwrite("middle_color", &TimerConfig::middle_color)
        .def_readwrite("late_color", &TimerConfig::late_color);

    py::enum_<ColorTier>(m, "ColorTier")
        .value("early", ColorTier::early)
        .value("middle", ColorTier::middle)
        .value("late", ColorTier::late);
    m.def("tier_for", &tier_for, py::arg("progress"));

    py::class_<Frame>(m, "Frame")
        .def_readonly("progress", &Frame::progress)
        .def_readonly("filled", &Frame::filled)
        .def_readonly("empty", &Frame::empty)
        .def_readonly("tier", &Frame::tier)
        .def_readonly("percent", &Frame::percent)
        .def_readonly("remaining", &Frame::remaining)
        .def_readonly("elapsed", &Frame::elapsed)
        .def_readonly("total", &Frame::total);

    m.def("compute_frame",
          [](const TimerConfig& config, double elapsed) { return ProgressBar(config).compute(elapsed); },
          py::arg("config"), py::arg("elapsed"));
    m.def("format_line",
          [](const TimerConfig& config, double elapsed) {
              ProgressBar bar(config);
              return bar.format_line(bar.compute(elapsed));
          },
          py::arg("config"), py::arg("elapsed"));
}
