#ifndef NST_RECORDER_HPP
#define NST_RECORDER_HPP

// STL imports
#include <cmath>
#include <iostream>
#include <vector>

#include "utils.hpp"
#include "wrap_helper.hpp"

namespace NSTRACK {

// Keeps the history of a few link-wise diagnostics, one row of nlinks values
// per step. Everything is off by default.
template<class float_t>
class nst_recorder
{
public:
	nst_recorder() { ; }
	nst_recorder(int nlinks) { this->nlinks = nlinks; }

	int nlinks = 0;
	int nsteps = 0;

	bool thickness2record = false;
	std::vector<float_t> thickness;
	void enable_thickness_recording() { this->thickness2record = true; }
	void disable_thickness_recording() { this->thickness2record = false; }
	template<class out_t>
	out_t get_thickness()
	{
		return NSTRACK::format_output<std::vector<float_t>, out_t>(this->thickness);
	}

	bool vol_tot2record = false;
	std::vector<float_t> vol_tot;
	void enable_vol_tot_recording() { this->vol_tot2record = true; }
	void disable_vol_tot_recording() { this->vol_tot2record = false; }
	template<class out_t>
	out_t get_vol_tot()
	{
		return NSTRACK::format_output<std::vector<float_t>, out_t>(this->vol_tot);
	}

	bool vol_act2record = false;
	std::vector<float_t> vol_act;
	void enable_vol_act_recording() { this->vol_act2record = true; }
	void disable_vol_act_recording() { this->vol_act2record = false; }
	template<class out_t>
	out_t get_vol_act()
	{
		return NSTRACK::format_output<std::vector<float_t>, out_t>(this->vol_act);
	}

	bool vol_stor2record = false;
	std::vector<float_t> vol_stor;
	void enable_vol_stor_recording() { this->vol_stor2record = true; }
	void disable_vol_stor_recording() { this->vol_stor2record = false; }
	template<class out_t>
	out_t get_vol_stor()
	{
		return NSTRACK::format_output<std::vector<float_t>, out_t>(this->vol_stor);
	}

	bool frac_sand2record = false;
	std::vector<float_t> frac_sand;
	void enable_frac_sand_recording() { this->frac_sand2record = true; }
	void disable_frac_sand_recording() { this->frac_sand2record = false; }
	template<class out_t>
	out_t get_frac_sand()
	{
		return NSTRACK::format_output<std::vector<float_t>, out_t>(this->frac_sand);
	}

	// one value per step
	bool median_distance2record = false;
	std::vector<float_t> median_distance;
	void enable_median_distance_recording()
	{
		this->median_distance2record = true;
	}
	void disable_median_distance_recording()
	{
		this->median_distance2record = false;
	}
	template<class out_t>
	out_t get_median_distance()
	{
		return NSTRACK::format_output<std::vector<float_t>, out_t>(
			this->median_distance);
	}

	void enable_all()
	{
		this->thickness2record = true;
		this->vol_tot2record = true;
		this->vol_act2record = true;
		this->vol_stor2record = true;
		this->frac_sand2record = true;
		this->median_distance2record = true;
	}

	void reset()
	{
		this->nsteps = 0;
		this->thickness.clear();
		this->vol_tot.clear();
		this->vol_act.clear();
		this->vol_stor.clear();
		this->frac_sand.clear();
		this->median_distance.clear();
	}

	int get_nsteps() { return this->nsteps; }

	// Appends one step worth of diagnostics
	template<class state_t>
	void record(state_t& state, float_t median_travel_distance)
	{
		if (this->thickness2record)
			this->append(this->thickness, state.active_layer_thickness);
		if (this->vol_tot2record)
			this->append(this->vol_tot, state.vol_tot);
		if (this->vol_act2record)
			this->append(this->vol_act, state.vol_act);
		if (this->vol_stor2record)
			this->append(this->vol_stor, state.vol_stor);
		if (this->frac_sand2record)
			this->append(this->frac_sand, state.frac_sand);
		if (this->median_distance2record)
			this->median_distance.emplace_back(median_travel_distance);
		++this->nsteps;
	}

private:
	void append(std::vector<float_t>& history, const std::vector<float_t>& row)
	{
		history.insert(history.end(), row.begin(), row.end());
	}
};

} // namespace NSTRACK

#endif
