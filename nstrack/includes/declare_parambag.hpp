#pragma once

#include "declare_includes.hpp"
using namespace NSTRACK;

void
declare_param(py::module& m)
{
	py::class_<ParamBag<int, double>>(m, "ParamBag")

		.def(py::init<>())
		.def("set_gravity", &ParamBag<int, double>::set_gravity)
		.def("get_gravity", &ParamBag<int, double>::get_gravity)
		.def("set_fluid_density", &ParamBag<int, double>::set_fluid_density)
		.def("get_fluid_density", &ParamBag<int, double>::get_fluid_density)
		.def("set_bed_porosity", &ParamBag<int, double>::set_bed_porosity)
		.def("get_bed_porosity", &ParamBag<int, double>::get_bed_porosity)
		.def("set_transport_method", &ParamBag<int, double>::set_transport_method)
		.def("get_transport_method", &ParamBag<int, double>::get_transport_method)
		.def("set_minimum_slope", &ParamBag<int, double>::set_minimum_slope)
		.def("get_minimum_slope", &ParamBag<int, double>::get_minimum_slope)
		.def("set_fallback_active_layer_thickness",
				 &ParamBag<int, double>::set_fallback_active_layer_thickness)
		.def("get_fallback_active_layer_thickness",
				 &ParamBag<int, double>::get_fallback_active_layer_thickness)
		.def("set_sand_diameter", &ParamBag<int, double>::set_sand_diameter)
		.def("get_sand_diameter", &ParamBag<int, double>::get_sand_diameter)
		.def("enable_verbose", &ParamBag<int, double>::enable_verbose)
		.def("disable_verbose", &ParamBag<int, double>::disable_verbose)
		.def("check", &ParamBag<int, double>::check)

		;
}
