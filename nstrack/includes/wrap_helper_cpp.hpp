//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef wrap_helper_cpp_HPP
#define wrap_helper_cpp_HPP

// Plain C++ backend of the wrapper: every array is a std::vector and goes
// through untouched.

#include <vector>

namespace NSTRACK {

template<class T>
std::vector<T>
_format_input(std::vector<T>& tin)
{
	return tin;
}

template<class T>
std::vector<T>
_format_input(const std::vector<T>& tin)
{
	return tin;
}

template<class T>
std::vector<T>
_format_output(std::vector<T>& tout)
{
	return tout;
}

template<class T>
std::vector<T>
to_vec(std::vector<T>& in)
{
	return in;
}

}; // namespace NSTRACK

#endif
