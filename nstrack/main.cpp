#include "declare_enums.hpp"
#include "declare_includes.hpp"
#include "declare_network.hpp"
#include "declare_parambag.hpp"
#include "declare_parcels.hpp"
#include "declare_transporter.hpp"

using namespace NSTRACK;

PYBIND11_MODULE(nstrack, m)
{
	m.doc() = R"pbdoc(
		nstrack - python API
		====================

		Quick API
		---------

		.. autosummary::

			ParamBag
			ParamBag.set_bed_porosity
			ParamBag.set_gravity
			ParamBag.set_fluid_density
			ParamBag.set_transport_method
			ParamBag.enable_verbose

			NetworkGraph
			NetworkGraph.__init__
			NetworkGraph.set_link_length
			NetworkGraph.set_channel_width
			NetworkGraph.set_channel_slope
			NetworkGraph.set_topographic_elevation
			NetworkGraph.set_bedrock_elevation
			NetworkGraph.get_topographic_elevation
			NetworkGraph.get_channel_slope
			NetworkGraph.get_sediment_total_volume
			NetworkGraph.get_sediment_active_volume
			NetworkGraph.get_sediment_active_sand_fraction

			FlowDirector
			FlowDirector.run_one_step
			FlowDirector.set_receiving_links
			FlowDirector.get_link_to_flow_receiving_node
			FlowDirector.get_upstream_node_at_link
			FlowDirector.get_downstream_node_at_link

			ParcelRecord
			ParcelRecord.add_items
			ParcelRecord.add_record
			ParcelRecord.get_data
			ParcelRecord.set_data
			ParcelRecord.get_variable
			ParcelRecord.get_element_id
			ParcelRecord.get_element_history

			NetworkSedimentTransporter
			NetworkSedimentTransporter.__init__
			NetworkSedimentTransporter.run_one_step
			NetworkSedimentTransporter.time
			NetworkSedimentTransporter.get_active_layer_thickness
			NetworkSedimentTransporter.get_vol_stor
			NetworkSedimentTransporter.get_pvelocity
			NetworkSedimentTransporter.distance_traveled_cumulative

			NSTRecorder

	)pbdoc";

	declare_enums(m);
	declare_errors(m);
	declare_param(m);
	declare_network_graph(m);
	declare_flow_director(m);
	declare_parcel_record(m);
	declare_transporter(m);
	declare_recorder(m);
};

// end of file
