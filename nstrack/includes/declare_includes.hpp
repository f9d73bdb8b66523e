/*
All the includes of the python bindings will be added there
*/

#pragma once

#include "flow_director.hpp"
#include "network_graph.hpp"
#include "network_sediment_transporter.hpp"
#include "nst_enums.hpp"
#include "nst_errors.hpp"
#include "nst_recorder.hpp"
#include "parambag.hpp"
#include "parcel_record.hpp"
#include "transport_laws.hpp"
#include "utils.hpp"
#include "wrap_helper.hpp"
#include <pybind11/pybind11.h>

#define FLOATING_POINT_NSTRACK double
