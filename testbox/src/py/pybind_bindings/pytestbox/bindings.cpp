/*
 * Copyright (c) 2025 Qualcomm Technologies, Inc. and/or its subsidiaries.
 * SPDX-License-Identifier: MIT
 */
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "src/main/tools/testbox-api.h"


namespace py = pybind11;
PYBIND11_MODULE(pytestbox, m) {
    m.doc() = "Python bindings for libtestbox";
    m.def("testbox_run", [](const std::vector<std::string>& args) {
        std::string report;
        int code;
        {
            py::gil_scoped_release release;
            code = testbox_run(args, &report);
        }
        return py::make_tuple(code, report);
    }, py::arg("args"), "Run the harness with command-line options, returns (exit_code, json_report)");
    m.def("testbox_run_with_env", [](const std::vector<std::string>& args, const std::vector<std::string>& env) {
        std::string report;
        int code;
        {
            py::gil_scoped_release release;
            code = testbox_run_with_env(args, env, &report);
        }
        return py::make_tuple(code, report);
    }, py::arg("args"), py::arg("env"), "Run the harness with an explicit KEY=VALUE environment");
    m.def("testbox_classify", &testbox_classify, py::arg("exit_code"), py::arg("signal"), py::arg("timed_out"), "Classify a finished command");
    m.def("testbox_enable_log", &testbox_enable_log, py::arg("path"), "Set a path where to store the log");

    m.def("testbox_get_last_error_code", &testbox_get_last_error_code);
    m.def("testbox_get_last_error_msg", []() -> std::string { return std::string(testbox_get_last_error_msg()); });
}
