#pragma once

#include "declare_includes.hpp"
using namespace NSTRACK;

void
declare_enums(py::module& m)
{
	py::enum_<LAYER>(m, "LAYER")
		.value("INACTIVE", LAYER::INACTIVE)
		.value("ACTIVE", LAYER::ACTIVE);
}

// Maps the C++ exceptions to python ones, ConfigurationError & co. derive
// from nstrack.NSTError which derives from RuntimeError.
// Translators are tried last registered first: the base goes first.
void
declare_errors(py::module& m)
{
	auto& base_error =
		py::register_exception<NSTError>(m, "NSTError", PyExc_RuntimeError);
	py::register_exception<ConfigurationError>(
		m, "ConfigurationError", base_error.ptr());
	py::register_exception<PhysicalInvariantViolation>(
		m, "PhysicalInvariantViolation", base_error.ptr());
	py::register_exception<ExhaustionError>(
		m, "ExhaustionError", base_error.ptr());
}
