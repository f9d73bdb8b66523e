// tests/test_functions.cpp (doctest)
//
// Point-wise relations and the small numerical helpers.

#include <doctest/doctest.h>

#include <cmath>
#include <vector>

#include "nst_errors.hpp"
#include "nst_functions.hpp"
#include "utils.hpp"

using namespace NSTRACK;

TEST_CASE("channel slope from elevations")
{
	CHECK(recalculate_channel_slope(10., 0., 10.) == doctest::Approx(1.0));
	// floored
	CHECK(recalculate_channel_slope(0., 0., 10.) == doctest::Approx(1e-4));
	CHECK(recalculate_channel_slope(1., 0.9999, 10., 1e-3) ==
				doctest::Approx(1e-3));
	CHECK_THROWS_AS(recalculate_channel_slope(0., 10., 10.),
									PhysicalInvariantViolation);
}

TEST_CASE("reference shear stress of Wilcock and Crowe")
{
	CHECK(calculate_reference_shear_stress(1., 1., 1., 1., 0.) ==
				doctest::Approx(0.036).epsilon(0.01));
	CHECK(calculate_reference_shear_stress(1000., 1.65, 9.8, 0.1, 0.9) ==
				doctest::Approx(33.957).epsilon(0.001));
	// lighter than water
	CHECK_THROWS_AS(calculate_reference_shear_stress(1000., -0.5, 9.8, 0.1, 0.),
									PhysicalInvariantViolation);
}

TEST_CASE("abrasion shrinks volume and diameter")
{
	CHECK(calculate_parcel_volume_post_abrasion(10., 100., 0.003) ==
				doctest::Approx(7.40818).epsilon(1e-5));
	CHECK(calculate_parcel_volume_post_abrasion(10., 100., 0.) == 10.);
	CHECK(calculate_parcel_volume_post_abrasion(10., 0., 0.003) == 10.);
	CHECK_THROWS_AS(calculate_parcel_volume_post_abrasion(10., 100., -0.003),
									PhysicalInvariantViolation);

	CHECK(calculate_parcel_grain_diameter_post_abrasion(10., 1., 1.) == 10.);
	CHECK(calculate_parcel_grain_diameter_post_abrasion(10., 2., 1.) ==
				doctest::Approx(7.937005).epsilon(1e-6));
}

TEST_CASE("alluvium depth at a node")
{
	std::vector<double> widths = { 10. }, lengths = { 10. };
	CHECK(calculate_alluvium_depth(10., widths, lengths, 10., 10., 0.5) ==
				doctest::Approx(0.2));

	// outlet, no downstream link
	CHECK(calculate_alluvium_depth(10., widths, lengths, 0., 0., 0.5) ==
				doctest::Approx(0.4));

	CHECK(calculate_alluvium_depth(0., widths, lengths, 10., 10., 0.3) == 0.);
	CHECK_THROWS_AS(calculate_alluvium_depth(-1., widths, lengths, 10., 10., 0.3),
									PhysicalInvariantViolation);
}

TEST_CASE("active layer thickness of Wong et al.")
{
	// 2 m of water on a 1% slope over 5 cm gravels
	double tau = 1000. * 9.81 * 0.01 * 2.;
	CHECK(calculate_active_layer_thickness(tau, 2650., 1000., 9.81, 0.05) ==
				doctest::Approx(0.03116362).epsilon(1e-4));

	// under the threshold Shields number
	CHECK(std::isnan(
		calculate_active_layer_thickness(1., 2650., 1000., 9.81, 0.05)));

	// no grain
	CHECK(std::isnan(calculate_active_layer_thickness(
		tau, nan_value<double>(), 1000., 9.81, nan_value<double>())));
}

TEST_CASE("argsort is stable")
{
	std::vector<double> v = { 3., 1., 2., 1. };
	auto idx = sort_indexes(v);
	std::vector<size_t> expected = { 1, 3, 2, 0 };
	CHECK(idx == expected);
}

TEST_CASE("median and finite mean")
{
	CHECK(median(std::vector<double>{ 3., 1., 2. }) == 2.);
	CHECK(median(std::vector<double>{ 4., 1., 2., 3. }) == doctest::Approx(2.5));
	CHECK(std::isnan(median(std::vector<double>{})));

	std::vector<double> v = { 1., nan_value<double>(), 3., HUGE_VAL };
	CHECK(finite_mean(v) == doctest::Approx(2.));
	CHECK(count_finite(v) == 2u);

	nan_to_value(v, 0.);
	CHECK(v[1] == 0.);
}
