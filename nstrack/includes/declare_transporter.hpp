#pragma once

#include "declare_includes.hpp"
using namespace NSTRACK;

void
declare_transporter(py::module& m)
{
	py::class_<NetworkSedimentTransporter<int, double>>(
		m, "NetworkSedimentTransporter")
		.def(py::init<NetworkGraph<int, double>&,
									ParcelRecord<int, double>&,
									FlowDirector<int, double>&,
									py::array_t<double, 1>&,
									ParamBag<int, double>&>(),
				 py::keep_alive<1, 2>(),
				 py::keep_alive<1, 3>(),
				 py::keep_alive<1, 4>(),
				 R"pbdoc(
				 grid, parcels, flow_director, flow_depth (flattened [timesteps+1, nlinks]), params
				 )pbdoc")
		.def("run_one_step",
				 &NetworkSedimentTransporter<int, double>::run_one_step)
		.def("attach_recorder",
				 &NetworkSedimentTransporter<int, double>::attach_recorder,
				 py::keep_alive<1, 2>())
		.def("detach_recorder",
				 &NetworkSedimentTransporter<int, double>::detach_recorder)
		.def("time", &NetworkSedimentTransporter<int, double>::time)
		.def("time_idx", &NetworkSedimentTransporter<int, double>::time_idx)
		.def("distance_traveled_cumulative",
				 &NetworkSedimentTransporter<int, double>::distance_traveled_cumulative)
		.def("median_travel_distance",
				 &NetworkSedimentTransporter<int, double>::median_travel_distance)
		.def("get_d_mean_active",
				 &NetworkSedimentTransporter<int, double>::get_d_mean_active<py::array>)
		.def("get_rhos_mean_active",
				 &NetworkSedimentTransporter<int,
																		 double>::get_rhos_mean_active<py::array>)
		.def("get_active_layer_thickness",
				 &NetworkSedimentTransporter<int, double>::get_active_layer_thickness<
					 py::array>)
		.def("get_vol_stor",
				 &NetworkSedimentTransporter<int, double>::get_vol_stor<py::array>)
		.def("get_pvelocity",
				 &NetworkSedimentTransporter<int, double>::get_pvelocity<py::array>)
		.def("get_frac_parcel",
				 &NetworkSedimentTransporter<int, double>::get_frac_parcel<py::array>);
}

void
declare_recorder(py::module& m)
{
	py::class_<nst_recorder<double>>(m, "NSTRecorder")
		.def(py::init<>())
		.def(py::init<int>())
		.def("enable_all", &nst_recorder<double>::enable_all)
		.def("reset", &nst_recorder<double>::reset)
		.def("get_nsteps", &nst_recorder<double>::get_nsteps)
		.def("enable_thickness_recording",
				 &nst_recorder<double>::enable_thickness_recording)
		.def("disable_thickness_recording",
				 &nst_recorder<double>::disable_thickness_recording)
		.def("get_thickness", &nst_recorder<double>::get_thickness<py::array>)
		.def("enable_vol_tot_recording",
				 &nst_recorder<double>::enable_vol_tot_recording)
		.def("disable_vol_tot_recording",
				 &nst_recorder<double>::disable_vol_tot_recording)
		.def("get_vol_tot", &nst_recorder<double>::get_vol_tot<py::array>)
		.def("enable_vol_act_recording",
				 &nst_recorder<double>::enable_vol_act_recording)
		.def("disable_vol_act_recording",
				 &nst_recorder<double>::disable_vol_act_recording)
		.def("get_vol_act", &nst_recorder<double>::get_vol_act<py::array>)
		.def("enable_vol_stor_recording",
				 &nst_recorder<double>::enable_vol_stor_recording)
		.def("disable_vol_stor_recording",
				 &nst_recorder<double>::disable_vol_stor_recording)
		.def("get_vol_stor", &nst_recorder<double>::get_vol_stor<py::array>)
		.def("enable_frac_sand_recording",
				 &nst_recorder<double>::enable_frac_sand_recording)
		.def("disable_frac_sand_recording",
				 &nst_recorder<double>::disable_frac_sand_recording)
		.def("get_frac_sand", &nst_recorder<double>::get_frac_sand<py::array>)
		.def("enable_median_distance_recording",
				 &nst_recorder<double>::enable_median_distance_recording)
		.def("disable_median_distance_recording",
				 &nst_recorder<double>::disable_median_distance_recording)
		.def("get_median_distance",
				 &nst_recorder<double>::get_median_distance<py::array>);
}
