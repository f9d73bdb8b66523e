//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef NST_ERRORS_HPP
#define NST_ERRORS_HPP

/*
Error kinds thrown by nstrack. All of them are fatal: the model state may have
been partially updated when they are thrown and the run has to be stopped.
*/

#include <stdexcept>
#include <string>

namespace NSTRACK {

class NSTError : public std::runtime_error
{
public:
	explicit NSTError(const std::string& msg)
		: std::runtime_error("NST::" + msg)
	{
	}
};

// Invalid inputs at construction: missing field, inconsistent sizes, out of
// range parameter, unknown transport method
class ConfigurationError : public NSTError
{
public:
	explicit ConfigurationError(const std::string& msg)
		: NSTError(msg)
	{
	}
};

// Negative slope, negative alluvium depth, negative reference Shields stress,
// volume gained through abrasion
class PhysicalInvariantViolation : public NSTError
{
public:
	explicit PhysicalInvariantViolation(const std::string& msg)
		: NSTError(msg)
	{
	}
};

// No parcel left in the network
class ExhaustionError : public NSTError
{
public:
	explicit ExhaustionError(const std::string& msg)
		: NSTError(msg)
	{
	}
};

}; // namespace NSTRACK

#endif
