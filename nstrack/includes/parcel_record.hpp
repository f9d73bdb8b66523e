//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef parcel_record_HPP
#define parcel_record_HPP

/*
ParcelRecord is the data bag of the sediment parcels.
It stores items (parcels) through time: one slice of values per recorded
time for the temporal variables (location, volume, grain size, ...) and one
value per item for the static ones (density, abrasion rate, ...).
Slices are only appended, each new one starting as a copy of the last one.
Each item also has an element id per slice: the link it sits in.
*/

// STL imports
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "nst_errors.hpp"
#include "utils.hpp"
#include "wrap_helper.hpp"

namespace NSTRACK {

template<class i_t, class f_t>
class ParcelRecord
{

public:
	// Element id of an item at a time it did not exist yet
	static constexpr i_t NO_RECORD = std::numeric_limits<i_t>::min();

	ParcelRecord() { this->init(0.); };
	ParcelRecord(f_t start_time) { this->init(start_time); };

	void init(f_t start_time)
	{
		this->nitems = 0;
		this->times = { start_time };
		this->element_id = { std::vector<i_t>() };
		this->item_vars.clear();
		this->temporal_vars.clear();
	}

	i_t nitems = 0;

	// Recorded times
	std::vector<f_t> times;

	// [time][item] link of each item
	std::vector<std::vector<i_t>> element_id;

	// name -> [item]
	std::map<std::string, std::vector<f_t>> item_vars;

	// name -> [time][item]
	std::map<std::string, std::vector<std::vector<f_t>>> temporal_vars;

	i_t number_of_items() const { return this->nitems; }
	i_t number_of_timesteps() const { return i_t(this->times.size()); }
	i_t last_time_index() const { return i_t(this->times.size()) - 1; }
	f_t time_at(i_t time_idx) const { return this->times[time_idx]; }

	bool has_item_variable(const std::string& name) const
	{
		return this->item_vars.count(name) > 0;
	}
	bool has_temporal_variable(const std::string& name) const
	{
		return this->temporal_vars.count(name) > 0;
	}
	bool has_variable(const std::string& name) const
	{
		return this->has_item_variable(name) || this->has_temporal_variable(name);
	}

	// Adds items to the current (last) time slice.
	// Variables not given for the new items are NaN, variables only given for
	// the new items are created with NaN for the existing ones. Previous slices
	// have no record of the new items.
	void add_items(const std::vector<i_t>& elements,
								 const std::map<std::string, std::vector<f_t>>& item_values,
								 const std::map<std::string, std::vector<f_t>>& temporal_values)
	{
		size_t nnew = elements.size();
		for (auto& it : item_values) {
			if (it.second.size() != nnew)
				throw ConfigurationError("item variable " + it.first +
																 " does not match the number of new items");
			if (this->has_temporal_variable(it.first))
				throw ConfigurationError(it.first + " is already a temporal variable");
		}
		for (auto& it : temporal_values) {
			if (it.second.size() != nnew)
				throw ConfigurationError("temporal variable " + it.first +
																 " does not match the number of new items");
			if (this->has_item_variable(it.first))
				throw ConfigurationError(it.first + " is already an item variable");
		}

		i_t last = this->last_time_index();
		for (i_t t = 0; t < last; ++t)
			this->element_id[t].resize(this->nitems + nnew, NO_RECORD);
		this->element_id[last].insert(
			this->element_id[last].end(), elements.begin(), elements.end());

		// creating the new columns first
		for (auto& it : item_values) {
			if (this->has_item_variable(it.first) == false)
				this->item_vars[it.first] =
					std::vector<f_t>(this->nitems, nan_value<f_t>());
		}
		for (auto& it : temporal_values) {
			if (this->has_temporal_variable(it.first) == false)
				this->temporal_vars[it.first] = std::vector<std::vector<f_t>>(
					this->times.size(), std::vector<f_t>(this->nitems, nan_value<f_t>()));
		}

		for (auto& it : this->item_vars) {
			auto given = item_values.find(it.first);
			if (given == item_values.end())
				it.second.resize(this->nitems + nnew, nan_value<f_t>());
			else
				it.second.insert(
					it.second.end(), given->second.begin(), given->second.end());
		}

		for (auto& it : this->temporal_vars) {
			for (i_t t = 0; t < last; ++t)
				it.second[t].resize(this->nitems + nnew, nan_value<f_t>());
			auto given = temporal_values.find(it.first);
			if (given == temporal_values.end())
				it.second[last].resize(this->nitems + nnew, nan_value<f_t>());
			else
				it.second[last].insert(
					it.second[last].end(), given->second.begin(), given->second.end());
		}

		this->nitems += i_t(nnew);
	}

	// Appends a new time slice. Every temporal value (and the element ids) is
	// carried forward from the previous slice.
	void add_record(f_t time)
	{
		if (time < this->times.back())
			throw ConfigurationError("records must be added forward in time");
		this->times.emplace_back(time);
		this->element_id.emplace_back(this->element_id.back());
		for (auto& it : this->temporal_vars)
			it.second.emplace_back(it.second.back());
	}

	// Direct access to a slice of a temporal variable
	std::vector<f_t>& temporal(const std::string& name, i_t time_idx)
	{
		auto it = this->temporal_vars.find(name);
		if (it == this->temporal_vars.end())
			throw ConfigurationError(name + " is not a temporal parcel variable");
		if (time_idx < 0 || time_idx > this->last_time_index())
			throw ConfigurationError("no record at time index " +
															 std::to_string(time_idx));
		return it->second[time_idx];
	}

	// Direct access to an item variable
	std::vector<f_t>& item(const std::string& name)
	{
		auto it = this->item_vars.find(name);
		if (it == this->item_vars.end())
			throw ConfigurationError(name + " is not an item parcel variable");
		return it->second;
	}

	std::vector<i_t>& elements(i_t time_idx)
	{
		if (time_idx < 0 || time_idx > this->last_time_index())
			throw ConfigurationError("no record at time index " +
															 std::to_string(time_idx));
		return this->element_id[time_idx];
	}

	// Values of a variable for a subset of items at a given time
	std::vector<f_t> get_data(i_t time_idx,
														const std::vector<i_t>& ids,
														const std::string& name)
	{
		std::vector<f_t> out;
		out.reserve(ids.size());
		if (this->has_item_variable(name)) {
			auto& col = this->item(name);
			for (auto id : ids)
				out.emplace_back(col[id]);
		} else {
			auto& col = this->temporal(name, time_idx);
			for (auto id : ids)
				out.emplace_back(col[id]);
		}
		return out;
	}

	// Sets a variable to a single value for a subset of items at a given time
	void set_data(i_t time_idx,
								const std::vector<i_t>& ids,
								const std::string& name,
								f_t value)
	{
		auto& col = this->has_item_variable(name) ? this->item(name)
																							: this->temporal(name, time_idx);
		for (auto id : ids)
			col[id] = value;
	}

	// Sum of a variable per link at a given time over the items passing the
	// mask. Links without any such item get NaN.
	std::vector<f_t> calc_aggregate_sum(const std::string& name,
																			i_t nlinks,
																			const std::vector<std::uint8_t>& mask,
																			i_t time_idx)
	{
		auto& col = this->has_item_variable(name) ? this->item(name)
																							: this->temporal(name, time_idx);
		auto& elts = this->elements(time_idx);

		std::vector<f_t> out(nlinks, 0.);
		std::vector<std::uint8_t> seen(nlinks, false);
		for (i_t i = 0; i < this->nitems; ++i) {
			if (mask[i] == false)
				continue;
			i_t link = elts[i];
			if (link < 0 || link >= nlinks)
				continue;
			out[link] += col[i];
			seen[link] = true;
		}
		for (i_t l = 0; l < nlinks; ++l) {
			if (seen[l] == false)
				out[l] = nan_value<f_t>();
		}
		return out;
	}

	// Outputting functions
	template<class out_t>
	out_t get_times()
	{
		return format_output<decltype(this->times), out_t>(this->times);
	}
	template<class out_t>
	out_t get_element_id(i_t time_idx)
	{
		return format_output<std::vector<i_t>, out_t>(this->elements(time_idx));
	}
	template<class out_t>
	out_t get_variable(std::string name, i_t time_idx)
	{
		if (this->has_item_variable(name))
			return format_output<std::vector<f_t>, out_t>(this->item(name));
		return format_output<std::vector<f_t>, out_t>(
			this->temporal(name, time_idx));
	}
	// Whole history of one item, NaN before it existed. Item variables are
	// repeated over every time the item has a record.
	template<class out_t>
	out_t get_item_history(std::string name, i_t item_id)
	{
		std::vector<f_t> out(this->times.size());
		if (this->has_item_variable(name)) {
			f_t val = this->item(name)[item_id];
			for (size_t t = 0; t < this->times.size(); ++t)
				out[t] =
					(this->element_id[t][item_id] == NO_RECORD) ? nan_value<f_t>() : val;
		} else {
			for (size_t t = 0; t < this->times.size(); ++t)
				out[t] = this->temporal(name, i_t(t))[item_id];
		}
		return format_output<decltype(out), out_t>(out);
	}
	template<class out_t>
	out_t get_element_history(i_t item_id)
	{
		std::vector<i_t> out(this->times.size());
		for (size_t t = 0; t < this->times.size(); ++t)
			out[t] = this->element_id[t][item_id];
		return format_output<decltype(out), out_t>(out);
	}
};

} // namespace NSTRACK

#endif
