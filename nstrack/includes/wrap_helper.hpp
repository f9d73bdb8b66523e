//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef wrap_helper_HPP
#define wrap_helper_HPP

// STL imports
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "utils.hpp"

// defines all the format_input depnding on the eventual wrapper
#ifdef NSTRACK_FT_PYTHON
#include "wrap_helper_python.hpp"
#else
#include "wrap_helper_cpp.hpp"
#endif

namespace NSTRACK {

template<typename in_t>
auto
format_input(in_t& tin)
{
	auto ret = _format_input(tin);
	return ret;
}

template<class in_t, class out_t>
out_t
format_output(in_t& tin)
{
	out_t ret = _format_output(tin);
	return ret;
}

} // namespace NSTRACK

#endif
