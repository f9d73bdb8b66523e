//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef NST_STATE_HPP
#define NST_STATE_HPP

// STL imports
#include <cstdint>
#include <map>
#include <vector>

#include "utils.hpp"

namespace NSTRACK {

// Working state of the transporter, written by one phase of a step and read by
// the next ones. Link-wise vectors are nlinks long, parcel-wise ones
// nparcels long.
template<class i_t, class f_t>
class StepState
{
public:
	StepState(){};

	// # Link-wise
	// Volume weighted mean grain size and density of the active layer, lagged
	// by one step when used to size the active layer
	std::vector<f_t> d_mean_active;
	std::vector<f_t> rhos_mean_active;
	bool means_initialised = false;

	std::vector<f_t> active_layer_thickness;
	std::vector<f_t> vol_tot;
	std::vector<f_t> vol_act;
	std::vector<f_t> vol_stor;
	std::vector<f_t> frac_sand;

	// # Parcel-wise
	// in the network at the current time
	std::vector<std::uint8_t> this_timesteps_parcels;
	// in the network and in the active layer
	std::vector<std::uint8_t> active_parcel_records;
	std::vector<f_t> pvelocity;
	std::vector<f_t> frac_parcel;
	std::vector<f_t> distance_to_travel;

	// Parcel id -> distance travelled since the start of the run
	std::map<i_t, f_t> distance_traveled_cumulative;

	void init(i_t nlinks)
	{
		this->d_mean_active = std::vector<f_t>(nlinks, nan_value<f_t>());
		this->rhos_mean_active = std::vector<f_t>(nlinks, nan_value<f_t>());
		this->means_initialised = false;
		this->active_layer_thickness = std::vector<f_t>(nlinks, nan_value<f_t>());
		this->vol_tot = std::vector<f_t>(nlinks, 0.);
		this->vol_act = std::vector<f_t>(nlinks, 0.);
		this->vol_stor = std::vector<f_t>(nlinks, 0.);
		this->frac_sand = std::vector<f_t>(nlinks, 0.);
		this->this_timesteps_parcels.clear();
		this->active_parcel_records.clear();
		this->pvelocity.clear();
		this->frac_parcel.clear();
		this->distance_to_travel.clear();
		this->distance_traveled_cumulative.clear();
	}

	// Resizes the parcel-wise vectors, parcels may have been added
	void resize_parcels(i_t nparcels)
	{
		this->this_timesteps_parcels.assign(nparcels, false);
		this->active_parcel_records.assign(nparcels, false);
		this->pvelocity.assign(nparcels, 0.);
		this->frac_parcel.assign(nparcels, nan_value<f_t>());
		this->distance_to_travel.assign(nparcels, 0.);
	}
};

}; // namespace NSTRACK

#endif
