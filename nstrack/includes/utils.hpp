//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#pragma once

// STL imports
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

namespace NSTRACK {

// Quiet NaN shortcut, used all over the place as "no value"
template<class f_t>
inline f_t
nan_value()
{
	return std::numeric_limits<f_t>::quiet_NaN();
}

// Return a vector of sorted indices
// Equivalent of argsort in numpy or other platforms
// Shamelessly ripped from https://stackoverflow.com/a/12399290/7114716
// - credits to Lukasz Wiklendt
template<class U>
std::vector<size_t>
sort_indexes(U& v)
{

	// initialize original index locations
	std::vector<size_t> idx(v.size());
	std::iota(idx.begin(), idx.end(), 0);

	// sort indexes based on comparing values in v
	// using std::stable_sort instead of std::sort
	// to avoid unnecessary index re-orderings
	// when v contains elements of equal values
	std::stable_sort(idx.begin(), idx.end(), [&v](size_t i1, size_t i2) {
		return v[i1] < v[i2];
	});

	return idx;
}

// Mean of the finite values of a vector, NaN if there is none
template<class f_t>
f_t
finite_mean(const std::vector<f_t>& v)
{
	f_t sum = 0;
	size_t n = 0;
	for (auto val : v) {
		if (std::isfinite(val) == false)
			continue;
		sum += val;
		++n;
	}
	if (n == 0)
		return nan_value<f_t>();
	return sum / n;
}

// Number of finite values in a vector
template<class f_t>
size_t
count_finite(const std::vector<f_t>& v)
{
	return std::count_if(
		v.begin(), v.end(), [](f_t val) { return std::isfinite(val); });
}

// Median of a vector (numpy convention: mean of the two central values for
// even sizes). NaN for empty input.
template<class f_t>
f_t
median(std::vector<f_t> v)
{
	if (v.size() == 0)
		return nan_value<f_t>();
	size_t mid = v.size() / 2;
	std::nth_element(v.begin(), v.begin() + mid, v.end());
	f_t upper = v[mid];
	if (v.size() % 2 == 1)
		return upper;
	f_t lower = *std::max_element(v.begin(), v.begin() + mid);
	return 0.5 * (lower + upper);
}

// Replaces NaNs by a value in place
template<class f_t>
void
nan_to_value(std::vector<f_t>& v, f_t val)
{
	for (auto& tv : v) {
		if (std::isnan(tv))
			tv = val;
	}
}

}; // namespace NSTRACK
