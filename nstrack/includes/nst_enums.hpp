#ifndef NST_ENUMS_HPP
#define NST_ENUMS_HPP

#include <cstdint>

namespace NSTRACK {

// Membership of a parcel in the bed layers, stored as a float column in the
// parcel record
enum class LAYER : std::uint8_t
{
	INACTIVE = 0,
	ACTIVE = 1,
};

}; // end of namespace NSTRACK

#endif
