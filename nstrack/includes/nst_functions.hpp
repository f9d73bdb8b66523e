//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef nst_functions_HPP
#define nst_functions_HPP

/*
Point-wise relations used by the network sediment transporter, kept out of
the model class so they can be checked on their own.
*/

#include <cmath>
#include <vector>

#include "nst_errors.hpp"

namespace NSTRACK {

// Channel slope from the elevations at both ends of a link, floored to the
// threshold. Throws if the upstream end is lower than the downstream one.
template<class f_t>
f_t
recalculate_channel_slope(f_t z_up, f_t z_down, f_t dx, f_t threshold = 1e-4)
{
	f_t chan_slope = (z_up - z_down) / dx;

	if (chan_slope < 0.)
		throw PhysicalInvariantViolation("Channel Slope Negative");

	if (chan_slope < threshold)
		chan_slope = threshold;

	return chan_slope;
}

// Alluvium depth at a node from the volume stored in its downstream link,
// spread over half the bed area of the links around it.
template<class f_t>
f_t
calculate_alluvium_depth(f_t stored_volume,
												 const std::vector<f_t>& width_of_upstream_links,
												 const std::vector<f_t>& length_of_upstream_links,
												 f_t width_of_downstream_link,
												 f_t length_of_downstream_link,
												 f_t porosity)
{
	f_t area = width_of_downstream_link * length_of_downstream_link;
	for (size_t i = 0; i < width_of_upstream_links.size(); ++i)
		area += width_of_upstream_links[i] * length_of_upstream_links[i];

	f_t alluvium_depth = 2 * stored_volume / area / (1 - porosity);

	if (alluvium_depth < 0.)
		throw PhysicalInvariantViolation("Alluvium Depth Negative");

	return alluvium_depth;
}

// Active layer thickness after Wong et al. (2007), NaN when the Shields number
// is below 0.0549 or when the link has no grains
template<class f_t>
f_t
calculate_active_layer_thickness(f_t tau,
																 f_t rho_sed_mean,
																 f_t rho_fluid,
																 f_t g,
																 f_t d_mean)
{
	f_t taustar = tau / ((rho_sed_mean - rho_fluid) * g * d_mean);
	return 0.515 * d_mean * (3.09 * std::pow(taustar - 0.0549, 0.56));
}

// Reference Shields stress of the bed surface after Wilcock and Crowe (2003),
// function of the sand content of the active layer
template<class f_t>
f_t
calculate_reference_shear_stress(f_t fluid_density,
																 f_t R,
																 f_t g,
																 f_t mean_active_grain_size,
																 f_t frac_sand)
{
	f_t taursg = fluid_density * R * g * mean_active_grain_size *
							 (0.021 + 0.015 * std::exp(-20. * frac_sand));

	if (taursg < 0.)
		throw PhysicalInvariantViolation("reference Shields stress is negative");

	return taursg;
}

// Sternberg exponential abrasion
template<class f_t>
f_t
calculate_parcel_volume_post_abrasion(f_t starting_volume,
																			f_t travel_distance,
																			f_t abrasion_rate)
{
	f_t volume = starting_volume * std::exp(travel_distance * (-abrasion_rate));

	if (volume > starting_volume)
		throw PhysicalInvariantViolation("parcel volume *increases* due to abrasion");

	return volume;
}

template<class f_t>
f_t
calculate_parcel_grain_diameter_post_abrasion(f_t starting_diameter,
																							f_t pre_abrasion_volume,
																							f_t post_abrasion_volume)
{
	return starting_diameter *
				 std::pow(post_abrasion_volume / pre_abrasion_volume, 1. / 3.);
}

}; // namespace NSTRACK

#endif
