//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef wrap_helper_python_HPP
#define wrap_helper_python_HPP

#ifndef NSTRACK_FT_PYTHON
#define NSTRACK_FT_PYTHON
#endif

// STL imports
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "utils.hpp"

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace NSTRACK {

// Thin view on a 1D numpy array, no copy
template<class T>
class numvec
{
public:
	T* ptr = nullptr;
	size_t usize = 0;

	numvec(){};
	numvec(py::array_t<T, 1>& arr)
	{
		auto buf = arr.request();
		this->ptr = (T*)buf.ptr;
		this->usize = arr.size();
	};

	T& operator[](size_t i) { return this->ptr[i]; }

	size_t size() const { return this->usize; }
};

template<class T>
py::array
_format_output(std::vector<T>& tout)
{
	return py::array(tout.size(), tout.data());
}

template<class T>
std::vector<T>
to_vec(numvec<T>& in)
{
	std::vector<T> out(in.size());
	for (size_t i = 0; i < in.size(); ++i)
		out[i] = in[i];
	return out;
}

template<class T>
std::vector<T>
to_vec(py::array_t<T, 1>& tin)
{
	numvec<T> in(tin);
	return to_vec(in);
}

template<class T>
numvec<T>
_format_input(py::array_t<T, 1>& tin)
{
	numvec<T> view(tin);
	return view;
}

template<class T>
numvec<T>
_format_input(numvec<T>& tin)
{
	return tin;
}

// end of namespace NSTRACK
}; // namespace NSTRACK

#endif
