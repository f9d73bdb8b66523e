#pragma once

#include "declare_includes.hpp"
using namespace NSTRACK;

void
declare_parcel_record(py::module& m)
{
	py::class_<ParcelRecord<int, double>>(m, "ParcelRecord")
		.def(py::init<>())
		.def(py::init<double>())
		.def("add_items", &ParcelRecord<int, double>::add_items)
		.def("add_record", &ParcelRecord<int, double>::add_record)
		.def("number_of_items", &ParcelRecord<int, double>::number_of_items)
		.def("number_of_timesteps",
				 &ParcelRecord<int, double>::number_of_timesteps)
		.def("time_at", &ParcelRecord<int, double>::time_at)
		.def("has_variable", &ParcelRecord<int, double>::has_variable)
		.def("get_data", &ParcelRecord<int, double>::get_data)
		.def("set_data", &ParcelRecord<int, double>::set_data)
		.def("calc_aggregate_sum", &ParcelRecord<int, double>::calc_aggregate_sum)
		.def("get_times", &ParcelRecord<int, double>::get_times<py::array>)
		.def("get_element_id",
				 &ParcelRecord<int, double>::get_element_id<py::array>)
		.def("get_variable", &ParcelRecord<int, double>::get_variable<py::array>)
		.def("get_item_history",
				 &ParcelRecord<int, double>::get_item_history<py::array>)
		.def("get_element_history",
				 &ParcelRecord<int, double>::get_element_history<py::array>);

	m.attr("NO_RECORD") = ParcelRecord<int, double>::NO_RECORD;
}
