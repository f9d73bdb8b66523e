#pragma once

#include "nst_errors.hpp"
#include "utils.hpp"

namespace NSTRACK {

// Scalar configuration of the network sediment transporter
template<class i_t, class f_t>
class ParamBag
{
public:
	// Empty constructor
	ParamBag(){};

	// CONSTANTS
	f_t GRAVITY = 9.81;
	f_t rho_fluid = 1000.;

	// Proportion of void space between grains of the bed, in [0,1)
	f_t bed_porosity = 0.3;

	// Name of the transport law, resolved against the TransportLawRegistry
	std::string transport_method = "WilcockCrowe";

	// Slopes are floored to this value to avoid dividing by 0 later on
	f_t minimum_slope = 1e-4;

	// Active layer thickness used when no link gives a finite one
	f_t fallback_active_layer_thickness = 0.03116362;

	// Parcels finer than this are sand (m)
	f_t sand_diameter = 0.002;

	// Prints a few diagnostics each step
	bool verbose = false;

	void set_gravity(f_t val) { this->GRAVITY = val; }
	f_t get_gravity() { return this->GRAVITY; }

	void set_fluid_density(f_t val) { this->rho_fluid = val; }
	f_t get_fluid_density() { return this->rho_fluid; }

	void set_bed_porosity(f_t val) { this->bed_porosity = val; }
	f_t get_bed_porosity() { return this->bed_porosity; }

	void set_transport_method(std::string val) { this->transport_method = val; }
	std::string get_transport_method() { return this->transport_method; }

	void set_minimum_slope(f_t val) { this->minimum_slope = val; }
	f_t get_minimum_slope() { return this->minimum_slope; }

	void set_fallback_active_layer_thickness(f_t val)
	{
		this->fallback_active_layer_thickness = val;
	}
	f_t get_fallback_active_layer_thickness()
	{
		return this->fallback_active_layer_thickness;
	}

	void set_sand_diameter(f_t val) { this->sand_diameter = val; }
	f_t get_sand_diameter() { return this->sand_diameter; }

	void enable_verbose() { this->verbose = true; }
	void disable_verbose() { this->verbose = false; }

	// Throws a ConfigurationError if any numerical parameter is out of range
	void check() const
	{
		if (!(this->bed_porosity >= 0 && this->bed_porosity < 1))
			throw ConfigurationError("bed_porosity must be between 0 and 1");
		if (!(this->GRAVITY > 0))
			throw ConfigurationError("gravitational acceleration must be positive");
		if (!(this->rho_fluid > 0))
			throw ConfigurationError("fluid density must be positive");
		if (!(this->minimum_slope > 0))
			throw ConfigurationError("minimum slope must be positive");
		if (!(this->fallback_active_layer_thickness > 0))
			throw ConfigurationError(
				"fallback active layer thickness must be positive");
	}
};

};
