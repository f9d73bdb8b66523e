//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef network_sediment_transporter_HPP
#define network_sediment_transporter_HPP

/*
Lagrangian transport of sediment parcels on a river network.
Each step:
	- opens a new time slice in the parcel record
	- splits the parcels of each link into an active and a storage layer
		(first in, last out) and turns the stored volume into alluvium at the nodes
	- updates the channel slopes
	- computes a virtual velocity for the active parcels from a transport law
	- moves them downstream, abrading them along the way

Usage:
	NetworkGraph -> FlowDirector -> ParcelRecord -> NetworkSedimentTransporter
	then run_one_step(dt) as many times as needed.
*/

// STL imports
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "flow_director.hpp"
#include "network_graph.hpp"
#include "nst_enums.hpp"
#include "nst_errors.hpp"
#include "nst_functions.hpp"
#include "nst_recorder.hpp"
#include "nst_state.hpp"
#include "parambag.hpp"
#include "parcel_record.hpp"
#include "transport_laws.hpp"
#include "utils.hpp"
#include "wrap_helper.hpp"

namespace NSTRACK {

template<class i_t, class f_t>
class NetworkSedimentTransporter
{
public:
	// # Collaborators (not owned)
	NetworkGraph<i_t, f_t>* grid = nullptr;
	ParcelRecord<i_t, f_t>* parcels = nullptr;
	FlowDirector<i_t, f_t>* fd = nullptr;
	nst_recorder<f_t>* recorder = nullptr;

	// Scalar configuration, copied at construction
	ParamBag<i_t, f_t> param;

	// [time_idx][link] flattened
	std::vector<f_t> flow_depth;
	i_t n_flow_depth_rows = 0;

	std::unique_ptr<TransportLaw<i_t, f_t>> transport_law;

	StepState<i_t, f_t> state;

	f_t _time = 0.;
	i_t _time_idx = 0;
	f_t last_median_travel_distance = 0.;

	NetworkSedimentTransporter(){};

	template<class arrin_t>
	NetworkSedimentTransporter(NetworkGraph<i_t, f_t>& grid,
														 ParcelRecord<i_t, f_t>& parcels,
														 FlowDirector<i_t, f_t>& fd,
														 arrin_t& tflow_depth,
														 ParamBag<i_t, f_t>& param)
	{
		this->grid = &grid;
		this->parcels = &parcels;
		this->fd = &fd;
		this->param = param;

		this->param.check();
		this->grid->check_fields();
		this->check_flow_director();
		this->check_parcel_attributes();

		auto arr = format_input<arrin_t>(tflow_depth);
		this->flow_depth = to_vec(arr);
		if (this->flow_depth.size() == 0 ||
				this->flow_depth.size() % size_t(this->grid->nlinks) != 0)
			throw ConfigurationError(
				"flow_depth must be a [timesteps+1 x number_of_links] matrix");
		this->n_flow_depth_rows = i_t(this->flow_depth.size() / this->grid->nlinks);

		this->transport_law =
			TransportLawRegistry<i_t, f_t>::global().create(this->param.transport_method);

		this->_time_idx = this->parcels->last_time_index();
		this->_time = this->parcels->time_at(this->_time_idx);
		this->state.init(this->grid->nlinks);

		if (this->grid->has_channel_slope() == false) {
			this->grid->channel_slope = std::vector<f_t>(this->grid->nlinks, 0.);
			this->update_channel_slopes();
		}

		// zeroth pass: the initial topography reflects the parcels already there
		this->find_this_timesteps_parcels();
		if (this->count_this_timesteps_parcels() > 0) {
			this->partition_active_and_storage_layers();
			this->adjust_node_elevation();
		}
		this->update_channel_slopes();

		if (this->param.verbose)
			std::cout << "NST::INFO::transporter ready with "
								<< this->parcels->number_of_items() << " parcels on "
								<< this->grid->nlinks << " links, transport law "
								<< this->transport_law->name() << std::endl;
	}

	void check_flow_director()
	{
		if (this->fd->graph != this->grid)
			throw ConfigurationError(
				"the flow director must be built on the transporter's grid");
		if (this->fd->is_computed() == false)
			throw ConfigurationError(
				"the flow director must be run before building the transporter");
		if (this->fd->link_to_flow_receiving_node.size() !=
					size_t(this->grid->nnodes) ||
				this->fd->_upstream_node_at_link.size() != size_t(this->grid->nlinks))
			throw ConfigurationError(
				"flow director and grid have inconsistent sizes");
	}

	void check_parcel_attributes()
	{
		static const std::vector<std::string> temporal_names = {
			"time_arrival_in_link", "active_layer", "location_in_link", "D", "volume"
		};
		static const std::vector<std::string> any_names = { "abrasion_rate",
																												"density" };
		for (auto& name : temporal_names) {
			if (this->parcels->has_temporal_variable(name) == false)
				throw ConfigurationError("parcels must contain the time-varying "
																 "attribute " +
																 name);
		}
		for (auto& name : any_names) {
			if (this->parcels->has_variable(name) == false)
				throw ConfigurationError("parcels must contain the attribute " + name);
		}
	}

	// Item or temporal column of the parcels at the current time
	std::vector<f_t>& parcel_column(const std::string& name)
	{
		if (this->parcels->has_item_variable(name))
			return this->parcels->item(name);
		return this->parcels->temporal(name, this->_time_idx);
	}

	// Flow depth of the current time index, one value per link
	const f_t* current_flow_depth()
	{
		if (this->_time_idx >= this->n_flow_depth_rows)
			throw ConfigurationError("no flow depth given for time index " +
															 std::to_string(this->_time_idx));
		return &this->flow_depth[this->_time_idx * this->grid->nlinks];
	}

	// Masks of the parcels existing at the current time and of those still in
	// the network. Also resizes the parcel-wise state, parcels may have been
	// added since the last step.
	void find_this_timesteps_parcels()
	{
		i_t nparcels = this->parcels->number_of_items();
		this->state.resize_parcels(nparcels);
		auto& elts = this->parcels->elements(this->_time_idx);
		for (i_t p = 0; p < nparcels; ++p) {
			i_t link = elts[p];
			if (link == ParcelRecord<i_t, f_t>::NO_RECORD ||
					link == NetworkGraph<i_t, f_t>::OUT_OF_NETWORK)
				continue;
			if (link < 0 || link >= this->grid->nlinks)
				throw ConfigurationError("parcel " + std::to_string(p) +
																 " sits in an unknown link");
			this->state.this_timesteps_parcels[p] = true;
		}
	}

	i_t count_this_timesteps_parcels()
	{
		i_t n = 0;
		for (auto v : this->state.this_timesteps_parcels)
			n += (v ? 1 : 0);
		return n;
	}

	// Opens the new time slice: every value is carried forward from the last one
	void create_new_parcel_time()
	{
		this->parcels->add_record(this->_time);
		this->_time_idx = this->parcels->last_time_index();
		this->find_this_timesteps_parcels();
	}

	// Volume weighted mean grain size and density of all the parcels of each
	// link, used once before any layer exists
	void bootstrap_means()
	{
		i_t nlinks = this->grid->nlinks;
		auto& elts = this->parcels->elements(this->_time_idx);
		auto& D = this->parcel_column("D");
		auto& vol = this->parcel_column("volume");
		auto& rho = this->parcel_column("density");

		std::vector<f_t> sumDV(nlinks, 0.), sumRV(nlinks, 0.), sumV(nlinks, 0.);
		for (size_t p = 0; p < elts.size(); ++p) {
			if (this->state.this_timesteps_parcels[p] == false)
				continue;
			i_t link = elts[p];
			sumDV[link] += D[p] * vol[p];
			sumRV[link] += rho[p] * vol[p];
			sumV[link] += vol[p];
		}
		for (i_t l = 0; l < nlinks; ++l) {
			this->state.d_mean_active[l] =
				(sumV[l] > 0) ? sumDV[l] / sumV[l] : nan_value<f_t>();
			this->state.rhos_mean_active[l] =
				(sumV[l] > 0) ? sumRV[l] / sumV[l] : nan_value<f_t>();
		}
		this->state.means_initialised = true;
	}

	// Active layer thickness of every link from the (lagged) active means,
	// links without a finite value take the mean of the others
	void compute_active_layer_thickness()
	{
		i_t nlinks = this->grid->nlinks;
		const f_t* depth = this->current_flow_depth();
		auto& thickness = this->state.active_layer_thickness;
		thickness = std::vector<f_t>(nlinks, nan_value<f_t>());

		for (i_t l = 0; l < nlinks; ++l) {
			f_t tau = this->param.rho_fluid * this->param.GRAVITY *
								this->grid->channel_slope[l] * depth[l];
			thickness[l] =
				calculate_active_layer_thickness(tau,
																				 this->state.rhos_mean_active[l],
																				 this->param.rho_fluid,
																				 this->param.GRAVITY,
																				 this->state.d_mean_active[l]);
		}

		if (count_finite(thickness) == 0) {
			thickness = std::vector<f_t>(nlinks,
																	 this->param.fallback_active_layer_thickness);
			return;
		}

		f_t mean_thickness = finite_mean(thickness);
		for (auto& val : thickness) {
			if (std::isfinite(val) == false)
				val = mean_thickness;
		}
	}

	// First in, last out: in each link the most recently arrived parcels fill
	// the active layer up to its capacity, the rest goes to storage
	void partition_active_and_storage_layers()
	{
		i_t nlinks = this->grid->nlinks;
		i_t t = this->_time_idx;

		this->state.vol_tot = this->parcels->calc_aggregate_sum(
			"volume", nlinks, this->state.this_timesteps_parcels, t);
		nan_to_value(this->state.vol_tot, f_t(0.));

		if (this->state.means_initialised == false)
			this->bootstrap_means();

		this->compute_active_layer_thickness();

		auto& elts = this->parcels->elements(t);
		auto& vol = this->parcel_column("volume");
		auto& arrival = this->parcel_column("time_arrival_in_link");
		auto& active = this->parcel_column("active_layer");

		// grouping the parcels by link in a single pass
		std::vector<std::vector<i_t>> parcels_in_link(nlinks);
		for (size_t p = 0; p < elts.size(); ++p) {
			if (this->state.this_timesteps_parcels[p])
				parcels_in_link[elts[p]].emplace_back(i_t(p));
		}

		for (i_t l = 0; l < nlinks; ++l) {
			if (this->state.vol_tot[l] <= 0)
				continue;

			f_t capacity = this->grid->channel_width[l] * this->grid->link_length[l] *
										 this->state.active_layer_thickness[l];

			auto& ids = parcels_in_link[l];
			std::vector<f_t> times(ids.size());
			for (size_t i = 0; i < ids.size(); ++i)
				times[i] = arrival[ids[i]];

			// descending arrival time
			auto order = sort_indexes(times);
			std::reverse(order.begin(), order.end());

			f_t cumvol = 0.;
			for (auto o : order) {
				i_t p = ids[o];
				cumvol += vol[p];
				active[p] = (cumvol > capacity) ? static_cast<f_t>(LAYER::INACTIVE)
																				: static_cast<f_t>(LAYER::ACTIVE);
			}
		}

		for (size_t p = 0; p < elts.size(); ++p)
			this->state.active_parcel_records[p] =
				this->state.this_timesteps_parcels[p] &&
				active[p] == static_cast<f_t>(LAYER::ACTIVE);

		this->state.vol_act = this->parcels->calc_aggregate_sum(
			"volume", nlinks, this->state.active_parcel_records, t);
		nan_to_value(this->state.vol_act, f_t(0.));

		for (i_t l = 0; l < nlinks; ++l)
			this->state.vol_stor[l] = (this->state.vol_tot[l] - this->state.vol_act[l]) /
																(1 - this->param.bed_porosity);
	}

	// Topography = bedrock + alluvium at every node with a contributing link
	void adjust_node_elevation()
	{
		auto& gr = *this->grid;
		std::vector<f_t> width_up, length_up;

		for (i_t node = 0; node < gr.nnodes; ++node) {
			width_up.clear();
			length_up.clear();
			f_t stored_upstream = 0.;
			for (i_t k = 0; k < gr.max_degree; ++k) {
				if (this->fd->flow_link_incoming_at_node(node, k) == false)
					continue;
				i_t link = gr.links_at_node(node, k);
				width_up.emplace_back(gr.channel_width[link]);
				length_up.emplace_back(gr.link_length[link]);
				stored_upstream += this->state.vol_stor[link];
			}
			if (width_up.size() == 0)
				continue;

			i_t down = this->fd->link_to_flow_receiving_node[node];
			f_t width_down = 0., length_down = 0., stored = 0.;
			if (down == NetworkGraph<i_t, f_t>::BAD_INDEX) {
				// outlet: what sits in the links draining into it
				stored = stored_upstream;
			} else {
				width_down = gr.channel_width[down];
				length_down = gr.link_length[down];
				stored = this->state.vol_stor[down];
			}

			f_t alluvium_depth = calculate_alluvium_depth(stored,
																										width_up,
																										length_up,
																										width_down,
																										length_down,
																										this->param.bed_porosity);
			gr.topographic_elevation[node] =
				gr.bedrock_elevation[node] + alluvium_depth;
		}
	}

	void update_channel_slopes()
	{
		auto& gr = *this->grid;
		for (i_t l = 0; l < gr.nlinks; ++l) {
			i_t up = this->fd->upstream_node_at_link(l);
			i_t down = this->fd->downstream_node_at_link(l);
			gr.channel_slope[l] =
				recalculate_channel_slope(gr.topographic_elevation[up],
																	gr.topographic_elevation[down],
																	gr.link_length[l],
																	this->param.minimum_slope);
		}
	}

	// Active layer statistics, then the virtual velocity of each parcel
	void calc_transport()
	{
		i_t nlinks = this->grid->nlinks;
		auto& elts = this->parcels->elements(this->_time_idx);
		auto& D = this->parcel_column("D");
		auto& vol = this->parcel_column("volume");
		auto& rho = this->parcel_column("density");
		auto& active = this->parcel_column("active_layer");

		std::vector<f_t> sumDV(nlinks, 0.), sumRV(nlinks, 0.), sumV(nlinks, 0.),
			sand(nlinks, 0.);
		for (size_t p = 0; p < elts.size(); ++p) {
			if (this->state.active_parcel_records[p] == false)
				continue;
			i_t link = elts[p];
			sumDV[link] += D[p] * vol[p];
			sumRV[link] += rho[p] * vol[p];
			sumV[link] += vol[p];
			if (D[p] < this->param.sand_diameter)
				sand[link] += vol[p];
		}

		for (i_t l = 0; l < nlinks; ++l) {
			if (sumV[l] > 0) {
				this->state.d_mean_active[l] = sumDV[l] / sumV[l];
				this->state.rhos_mean_active[l] = sumRV[l] / sumV[l];
			} else {
				this->state.d_mean_active[l] = nan_value<f_t>();
				this->state.rhos_mean_active[l] = nan_value<f_t>();
			}
			this->state.frac_sand[l] =
				(this->state.vol_act[l] != 0) ? sand[l] / this->state.vol_act[l] : 0.;
		}

		TransportInput<i_t, f_t> in;
		in.links = &elts;
		in.in_network = &this->state.this_timesteps_parcels;
		in.D = &D;
		in.volume = &vol;
		in.density = &rho;
		in.active = &active;
		in.d_mean_active = &this->state.d_mean_active;
		in.frac_sand = &this->state.frac_sand;
		in.vol_act = &this->state.vol_act;
		in.active_layer_thickness = &this->state.active_layer_thickness;
		in.slope = &this->grid->channel_slope;
		in.flow_depth = this->current_flow_depth();
		in.rho_fluid = this->param.rho_fluid;
		in.g = this->param.GRAVITY;

		this->transport_law->compute_velocity(
			in, this->state.pvelocity, this->state.frac_parcel);
		nan_to_value(this->state.pvelocity, f_t(0.));

		this->grid->sediment_total_volume = this->state.vol_tot;
		this->grid->sediment_active_volume = this->state.vol_act;
		this->grid->sediment_active_sand_fraction = this->state.frac_sand;
	}

	// Moves the parcels by velocity * dt along the network, abrading them on the
	// whole distance
	void move_parcel_downstream(f_t dt)
	{
		auto& gr = *this->grid;
		auto& elts = this->parcels->elements(this->_time_idx);
		auto& loc = this->parcel_column("location_in_link");
		auto& D = this->parcel_column("D");
		auto& vol = this->parcel_column("volume");
		auto& arrival = this->parcel_column("time_arrival_in_link");
		auto& abrasion = this->parcel_column("abrasion_rate");

		std::vector<f_t> active_distances;
		for (size_t p = 0; p < elts.size(); ++p) {
			if (this->state.this_timesteps_parcels[p] == false)
				continue;
			f_t distance = this->state.pvelocity[p] * dt;
			this->state.distance_to_travel[p] = distance;
			this->state.distance_traveled_cumulative[i_t(p)] += distance;
			if (this->state.active_parcel_records[p])
				active_distances.emplace_back(distance);
		}

		this->last_median_travel_distance = median(active_distances);
		if (this->param.verbose)
			std::cout << "NST::INFO::median travel distance of the active parcels: "
								<< this->last_median_travel_distance << " m" << std::endl;

		for (size_t p = 0; p < elts.size(); ++p) {
			if (this->state.this_timesteps_parcels[p] == false)
				continue;
			f_t distance = this->state.distance_to_travel[p];
			if (distance == 0)
				continue;

			i_t link = elts[p];
			f_t distance_to_exit = gr.link_length[link] * (1. - loc[p]);
			f_t distance_within = gr.link_length[link] * loc[p];
			f_t running_distance = 0.;

			while (running_distance + distance_to_exit <= distance) {
				running_distance += distance_to_exit;
				distance_within = 0.;
				arrival[p] = static_cast<f_t>(this->_time_idx);
				i_t down = this->fd->downstream_link_at_link(link);
				if (down == NetworkGraph<i_t, f_t>::BAD_INDEX) {
					link = NetworkGraph<i_t, f_t>::OUT_OF_NETWORK;
					break;
				}
				link = down;
				distance_to_exit = gr.link_length[link];
			}

			elts[p] = link;
			if (link == NetworkGraph<i_t, f_t>::OUT_OF_NETWORK)
				loc[p] = nan_value<f_t>();
			else
				loc[p] =
					(distance_within + distance - running_distance) / gr.link_length[link];

			f_t new_volume =
				calculate_parcel_volume_post_abrasion(vol[p], distance, abrasion[p]);
			D[p] = calculate_parcel_grain_diameter_post_abrasion(D[p], vol[p], new_volume);
			vol[p] = new_volume;
		}
	}

	void run_one_step(f_t dt)
	{
		this->_time += dt;
		this->create_new_parcel_time();

		if (this->count_this_timesteps_parcels() == 0)
			throw ExhaustionError("No more parcels on grid");

		if (this->param.verbose)
			std::cout << "NST::INFO::step " << this->_time_idx << " (t = " << this->_time
								<< " s), " << this->count_this_timesteps_parcels()
								<< " parcels in the network" << std::endl;

		this->partition_active_and_storage_layers();
		this->adjust_node_elevation();
		this->update_channel_slopes();
		this->calc_transport();
		this->move_parcel_downstream(dt);

		if (this->recorder != nullptr)
			this->recorder->record(this->state, this->last_median_travel_distance);
	}

	void attach_recorder(nst_recorder<f_t>& recorder)
	{
		this->recorder = &recorder;
	}
	void detach_recorder() { this->recorder = nullptr; }

	// # Accessors
	f_t time() const { return this->_time; }
	i_t time_idx() const { return this->_time_idx; }
	const std::vector<f_t>& d_mean_active() const
	{
		return this->state.d_mean_active;
	}
	const std::vector<f_t>& rhos_mean_active() const
	{
		return this->state.rhos_mean_active;
	}
	const std::vector<f_t>& active_layer_thickness() const
	{
		return this->state.active_layer_thickness;
	}
	const std::vector<f_t>& vol_stor() const { return this->state.vol_stor; }
	const std::vector<f_t>& pvelocity() const { return this->state.pvelocity; }
	const std::vector<f_t>& frac_parcel() const { return this->state.frac_parcel; }
	f_t distance_traveled_cumulative(i_t parcel_id) const
	{
		auto it = this->state.distance_traveled_cumulative.find(parcel_id);
		if (it == this->state.distance_traveled_cumulative.end())
			return 0.;
		return it->second;
	}
	f_t median_travel_distance() const
	{
		return this->last_median_travel_distance;
	}

	template<class out_t>
	out_t get_d_mean_active()
	{
		return format_output<std::vector<f_t>, out_t>(this->state.d_mean_active);
	}
	template<class out_t>
	out_t get_rhos_mean_active()
	{
		return format_output<std::vector<f_t>, out_t>(this->state.rhos_mean_active);
	}
	template<class out_t>
	out_t get_active_layer_thickness()
	{
		return format_output<std::vector<f_t>, out_t>(
			this->state.active_layer_thickness);
	}
	template<class out_t>
	out_t get_vol_stor()
	{
		return format_output<std::vector<f_t>, out_t>(this->state.vol_stor);
	}
	template<class out_t>
	out_t get_pvelocity()
	{
		return format_output<std::vector<f_t>, out_t>(this->state.pvelocity);
	}
	template<class out_t>
	out_t get_frac_parcel()
	{
		return format_output<std::vector<f_t>, out_t>(this->state.frac_parcel);
	}
};

}; // namespace NSTRACK

#endif
