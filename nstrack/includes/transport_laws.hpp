//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef transport_laws_HPP
#define transport_laws_HPP

/*
Bedload transport laws turning the bed statistics of each link into a virtual
velocity for each parcel. Laws are looked up by name in a registry so new ones
can be plugged in without touching the transporter.
So far: Wilcock and Crowe (2003), surface-based.
*/

// STL imports
#include <cmath>
#include <complex>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "nst_enums.hpp"
#include "nst_errors.hpp"
#include "nst_functions.hpp"
#include "utils.hpp"

namespace NSTRACK {

// Everything a transport law can read. Parcel-wise vectors are indexed by
// parcel id, link-wise ones by link id. Nothing is owned.
template<class i_t, class f_t>
struct TransportInput
{
	// # Parcel-wise
	const std::vector<i_t>* links = nullptr;
	const std::vector<std::uint8_t>* in_network = nullptr;
	const std::vector<f_t>* D = nullptr;
	const std::vector<f_t>* volume = nullptr;
	const std::vector<f_t>* density = nullptr;
	const std::vector<f_t>* active = nullptr;

	// # Link-wise
	const std::vector<f_t>* d_mean_active = nullptr;
	const std::vector<f_t>* frac_sand = nullptr;
	const std::vector<f_t>* vol_act = nullptr;
	const std::vector<f_t>* active_layer_thickness = nullptr;
	const std::vector<f_t>* slope = nullptr;
	const f_t* flow_depth = nullptr;

	// # Constants
	f_t rho_fluid = 1000.;
	f_t g = 9.81;
};

template<class i_t, class f_t>
class TransportLaw
{
public:
	virtual ~TransportLaw() {}

	virtual std::string name() const = 0;

	// Fills the virtual velocity (m/s) of every parcel (0 for the ones not
	// moving) and the fraction used to scale it
	virtual void compute_velocity(const TransportInput<i_t, f_t>& in,
																std::vector<f_t>& pvelocity,
																std::vector<f_t>& frac_parcel) = 0;
};

// Dimensionless transport rate W* of Wilcock and Crowe (2003).
// Below 1.35 the power law is evaluated on the complex plane and only the real
// part is kept, which defines a value for (unphysical) negative ratios.
template<class f_t>
f_t
wilcock_crowe_dimensionless_rate(f_t tautaur)
{
	if (tautaur < 1.35)
		return 0.002 * std::pow(std::complex<f_t>(tautaur, 0.), f_t(7.5)).real();
	return 14. * std::pow(1. - 0.894 / std::sqrt(tautaur), 4.5);
}

// phi: shear stress over the reference one of a grain of size D, hiding
// function of D over the active layer mean
template<class f_t>
f_t
wilcock_crowe_shear_ratio(f_t tau, f_t taursg, f_t D, f_t d_mean)
{
	f_t Dratio = D / d_mean;
	f_t b = 0.67 / (1. + std::exp(1.5 - Dratio));
	return tau / (taursg * std::pow(Dratio, b));
}

template<class i_t, class f_t>
class WilcockCrowe : public TransportLaw<i_t, f_t>
{
public:
	WilcockCrowe(){};

	std::string name() const override { return "WilcockCrowe"; }

	void compute_velocity(const TransportInput<i_t, f_t>& in,
												std::vector<f_t>& pvelocity,
												std::vector<f_t>& frac_parcel) override
	{
		const auto& links = *in.links;
		const auto& in_network = *in.in_network;
		const auto& D = *in.D;
		const auto& volume = *in.volume;
		const auto& density = *in.density;
		const auto& active = *in.active;
		const auto& d_mean_active = *in.d_mean_active;
		const auto& frac_sand = *in.frac_sand;
		const auto& vol_act = *in.vol_act;
		const auto& thickness = *in.active_layer_thickness;
		const auto& slope = *in.slope;

		int nparcels = int(links.size());
		pvelocity = std::vector<f_t>(nparcels, 0.);
		frac_parcel = std::vector<f_t>(nparcels, nan_value<f_t>());

		// Reference Shields stress for every parcel in the network, active or not.
		// Done first and serially as it can throw.
		std::vector<f_t> taursg(nparcels, nan_value<f_t>());
		for (int p = 0; p < nparcels; ++p) {
			if (in_network[p] == false)
				continue;
			i_t link = links[p];
			f_t R = (density[p] - in.rho_fluid) / in.rho_fluid;
			taursg[p] = calculate_reference_shear_stress(
				in.rho_fluid, R, in.g, d_mean_active[link], frac_sand[link]);
		}

#ifdef NSTRACK_DEBUG
		for (int p = 0; p < nparcels; ++p) {
			if (in_network[p] == false ||
					active[p] != static_cast<f_t>(LAYER::ACTIVE))
				continue;
			i_t link = links[p];
			f_t tau = in.rho_fluid * in.g * in.flow_depth[link] * slope[link];
			f_t tautaur =
				wilcock_crowe_shear_ratio(tau, taursg[p], D[p], d_mean_active[link]);
			if (tautaur < 0)
				std::cout << "NST::DEBUG::negative shear stress ratio (" << tautaur
									<< ") for parcel " << p << " in link " << link << std::endl;
		}
#endif

#pragma omp parallel for
		for (int p = 0; p < nparcels; ++p) {
			if (in_network[p] == false)
				continue;

			i_t link = links[p];
			f_t R = (density[p] - in.rho_fluid) / in.rho_fluid;

			if (vol_act[link] != 0)
				frac_parcel[p] = vol_act[link] / volume[p];

			if (active[p] != static_cast<f_t>(LAYER::ACTIVE))
				continue;

			f_t tau = in.rho_fluid * in.g * in.flow_depth[link] * slope[link];
			f_t W = wilcock_crowe_dimensionless_rate(
				wilcock_crowe_shear_ratio(tau, taursg[p], D[p], d_mean_active[link]));

			f_t vel = W * std::pow(tau, 1.5) * frac_parcel[p] /
								std::pow(in.rho_fluid, 1.5) / in.g / R / thickness[link];

			pvelocity[p] = std::isnan(vel) ? 0. : vel;
		}
	}
};

// Name -> transport law
template<class i_t, class f_t>
class TransportLawRegistry
{
public:
	using factory_t = std::function<std::unique_ptr<TransportLaw<i_t, f_t>>()>;

	TransportLawRegistry()
	{
		this->register_law("WilcockCrowe", []() {
			return std::unique_ptr<TransportLaw<i_t, f_t>>(
				new WilcockCrowe<i_t, f_t>());
		});
	}

	std::map<std::string, factory_t> table;

	void register_law(const std::string& name, factory_t factory)
	{
		this->table[name] = factory;
	}

	bool has(const std::string& name) const { return this->table.count(name) > 0; }

	std::vector<std::string> names() const
	{
		std::vector<std::string> out;
		for (auto& it : this->table)
			out.emplace_back(it.first);
		return out;
	}

	std::unique_ptr<TransportLaw<i_t, f_t>> create(const std::string& name) const
	{
		auto it = this->table.find(name);
		if (it == this->table.end())
			throw ConfigurationError("Transport Method not supported: " + name);
		return it->second();
	}

	// Registry used by default by the transporter
	static TransportLawRegistry<i_t, f_t>& global()
	{
		static TransportLawRegistry<i_t, f_t> registry;
		return registry;
	}
};

}; // namespace NSTRACK

#endif
