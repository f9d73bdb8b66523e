// tests/test_transport_laws.cpp (doctest)
//
// Transport law registry and the Wilcock and Crowe rates.

#include <doctest/doctest.h>

#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "nst_enums.hpp"
#include "nst_errors.hpp"
#include "transport_laws.hpp"

using namespace NSTRACK;

namespace nst_law_tests {

// Everything moves at 1 m/s
class ConstantLaw : public TransportLaw<int, double>
{
public:
	std::string name() const override { return "Constant"; }
	void compute_velocity(const TransportInput<int, double>& in,
												std::vector<double>& pvelocity,
												std::vector<double>& frac_parcel) override
	{
		pvelocity = std::vector<double>(in.links->size(), 1.);
		frac_parcel = std::vector<double>(in.links->size(), 1.);
	}
};

} // namespace nst_law_tests

TEST_CASE("registry knows WilcockCrowe")
{
	TransportLawRegistry<int, double> registry;
	CHECK(registry.has("WilcockCrowe"));
	auto law = registry.create("WilcockCrowe");
	CHECK(law->name() == "WilcockCrowe");
	CHECK_THROWS_AS(registry.create("MeyerPeterMuller"), ConfigurationError);
}

TEST_CASE("registry accepts new laws")
{
	TransportLawRegistry<int, double> registry;
	registry.register_law("Constant", []() {
		return std::unique_ptr<TransportLaw<int, double>>(
			new nst_law_tests::ConstantLaw());
	});
	CHECK(registry.has("Constant"));
	CHECK(registry.names().size() == 2u);
	CHECK(registry.create("Constant")->name() == "Constant");

	// the shared one is untouched
	CHECK_FALSE(TransportLawRegistry<int, double>::global().has("Constant"));
}

TEST_CASE("dimensionless transport rate branches")
{
	CHECK(wilcock_crowe_dimensionless_rate(1.) == doctest::Approx(0.002));
	CHECK(wilcock_crowe_dimensionless_rate(0.5) ==
				doctest::Approx(0.002 * std::pow(0.5, 7.5)));
	CHECK(wilcock_crowe_dimensionless_rate(2.) ==
				doctest::Approx(14. * std::pow(1. - 0.894 / std::sqrt(2.), 4.5)));
	CHECK(wilcock_crowe_dimensionless_rate(0.) == doctest::Approx(0.));

	// real part of (-1)^7.5 is cos(7.5 pi) = 0
	CHECK(std::abs(wilcock_crowe_dimensionless_rate(-1.)) < 1e-12);
	// real part of (-2)^7.5 = 2^7.5 cos(7.5 pi) as well
	CHECK(std::abs(wilcock_crowe_dimensionless_rate(-2.)) < 1e-10);
}

TEST_CASE("shear stress ratio with hiding")
{
	// mean sized grain: no hiding
	CHECK(wilcock_crowe_shear_ratio(196.2, 29.135, 0.05, 0.05) ==
				doctest::Approx(196.2 / 29.135));
	// twice the mean
	double b = 0.67 / (1. + std::exp(-0.5));
	CHECK(wilcock_crowe_shear_ratio(1., 1., 0.1, 0.05) ==
				doctest::Approx(1. / std::pow(2., b)));
	// the sign is the one of the shear stress, a reversed slope gives phi < 0
	CHECK(wilcock_crowe_shear_ratio(-1., 1., 0.05, 0.05) < 0.);
}

TEST_CASE("Wilcock and Crowe velocities")
{
	// one link, one active parcel, one buried one, one out of the network
	std::vector<int> links = { 0, 0, -2 };
	std::vector<std::uint8_t> in_network = { true, true, false };
	std::vector<double> D = { 0.05, 0.05, 0.05 };
	std::vector<double> volume = { 1., 1., 1. };
	std::vector<double> density = { 2650., 2650., 2650. };
	std::vector<double> active = { static_cast<double>(LAYER::ACTIVE),
																 static_cast<double>(LAYER::INACTIVE),
																 static_cast<double>(LAYER::ACTIVE) };
	std::vector<double> d_mean = { 0.05 };
	std::vector<double> frac_sand = { 0. };
	std::vector<double> vol_act = { 1. };
	std::vector<double> thickness = { 0.03116362 };
	std::vector<double> slope = { 0.01 };
	std::vector<double> depth = { 2. };

	TransportInput<int, double> in;
	in.links = &links;
	in.in_network = &in_network;
	in.D = &D;
	in.volume = &volume;
	in.density = &density;
	in.active = &active;
	in.d_mean_active = &d_mean;
	in.frac_sand = &frac_sand;
	in.vol_act = &vol_act;
	in.active_layer_thickness = &thickness;
	in.slope = &slope;
	in.flow_depth = depth.data();

	WilcockCrowe<int, double> law;
	std::vector<double> pvelocity, frac_parcel;
	law.compute_velocity(in, pvelocity, frac_parcel);

	REQUIRE(pvelocity.size() == 3u);
	CHECK(pvelocity[0] == doctest::Approx(0.360517).epsilon(1e-4));
	CHECK(pvelocity[1] == 0.);
	CHECK(pvelocity[2] == 0.);
	CHECK(frac_parcel[0] == doctest::Approx(1.));
	CHECK(std::isnan(frac_parcel[2]));

	// no active layer: NaN velocity is zeroed
	thickness[0] = 0.;
	vol_act[0] = 0.;
	law.compute_velocity(in, pvelocity, frac_parcel);
	CHECK(pvelocity[0] == 0.);
}
