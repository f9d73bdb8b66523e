#pragma once

#include "declare_includes.hpp"
using namespace NSTRACK;

void
declare_network_graph(py::module& m)
{
	py::class_<NetworkGraph<int, double>>(m, "NetworkGraph")
		.def(py::init<>())
		.def(py::init<int, py::array_t<int, 1>&>())
		.def("number_of_nodes", &NetworkGraph<int, double>::number_of_nodes)
		.def("number_of_links", &NetworkGraph<int, double>::number_of_links)
		.def("node_at_link_tail", &NetworkGraph<int, double>::node_at_link_tail)
		.def("node_at_link_head", &NetworkGraph<int, double>::node_at_link_head)
		.def("links_at_node", &NetworkGraph<int, double>::links_at_node)
		.def("set_link_length",
				 &NetworkGraph<int, double>::set_link_length<py::array_t<double, 1>>)
		.def("get_link_length",
				 &NetworkGraph<int, double>::get_link_length<py::array>)
		.def("set_channel_width",
				 &NetworkGraph<int, double>::set_channel_width<py::array_t<double, 1>>)
		.def("get_channel_width",
				 &NetworkGraph<int, double>::get_channel_width<py::array>)
		.def("set_channel_slope",
				 &NetworkGraph<int, double>::set_channel_slope<py::array_t<double, 1>>)
		.def("get_channel_slope",
				 &NetworkGraph<int, double>::get_channel_slope<py::array>)
		.def("has_channel_slope", &NetworkGraph<int, double>::has_channel_slope)
		.def("set_topographic_elevation",
				 &NetworkGraph<int, double>::set_topographic_elevation<
					 py::array_t<double, 1>>)
		.def("get_topographic_elevation",
				 &NetworkGraph<int, double>::get_topographic_elevation<py::array>)
		.def("set_bedrock_elevation",
				 &NetworkGraph<int, double>::set_bedrock_elevation<
					 py::array_t<double, 1>>)
		.def("get_bedrock_elevation",
				 &NetworkGraph<int, double>::get_bedrock_elevation<py::array>)
		.def("get_sediment_total_volume",
				 &NetworkGraph<int, double>::get_sediment_total_volume<py::array>)
		.def("get_sediment_active_volume",
				 &NetworkGraph<int, double>::get_sediment_active_volume<py::array>)
		.def("get_sediment_active_sand_fraction",
				 &NetworkGraph<int, double>::get_sediment_active_sand_fraction<
					 py::array>)
		.def("check_fields", &NetworkGraph<int, double>::check_fields);

	m.attr("BAD_INDEX") = NetworkGraph<int, double>::BAD_INDEX;
	m.attr("OUT_OF_NETWORK") = NetworkGraph<int, double>::OUT_OF_NETWORK;
}

void
declare_flow_director(py::module& m)
{
	py::class_<FlowDirector<int, double>>(m, "FlowDirector")
		.def(py::init<NetworkGraph<int, double>&>(), py::keep_alive<1, 2>())
		.def("run_one_step", &FlowDirector<int, double>::run_one_step)
		.def("set_receiving_links",
				 &FlowDirector<int, double>::set_receiving_links<py::array_t<int, 1>>)
		.def("is_computed", &FlowDirector<int, double>::is_computed)
		.def("upstream_node_at_link",
				 &FlowDirector<int, double>::upstream_node_at_link)
		.def("downstream_node_at_link",
				 &FlowDirector<int, double>::downstream_node_at_link)
		.def("downstream_link_at_link",
				 &FlowDirector<int, double>::downstream_link_at_link)
		.def("number_of_contributors",
				 &FlowDirector<int, double>::number_of_contributors)
		.def("get_link_to_flow_receiving_node",
				 &FlowDirector<int, double>::get_link_to_flow_receiving_node<
					 py::array>)
		.def("get_upstream_node_at_link",
				 &FlowDirector<int, double>::get_upstream_node_at_link<py::array>)
		.def("get_downstream_node_at_link",
				 &FlowDirector<int, double>::get_downstream_node_at_link<py::array>)
		.def("get_flow_link_incoming_at_node",
				 &FlowDirector<int, double>::get_flow_link_incoming_at_node<
					 py::array>);
}
