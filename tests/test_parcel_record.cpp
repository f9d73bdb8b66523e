// tests/test_parcel_record.cpp (doctest)
//
// Time sliced parcel storage.

#include <doctest/doctest.h>

#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "nst_errors.hpp"
#include "parcel_record.hpp"

using namespace NSTRACK;
using Record = ParcelRecord<int, double>;

namespace nst_record_tests {

Record
two_parcels()
{
	Record rec(0.);
	std::map<std::string, std::vector<double>> items = { { "density",
																												 { 2650., 2000. } } };
	std::map<std::string, std::vector<double>> temporal = {
		{ "volume", { 1., 2. } }, { "D", { 0.05, 0.01 } }
	};
	rec.add_items({ 0, 1 }, items, temporal);
	return rec;
}

} // namespace nst_record_tests

using nst_record_tests::two_parcels;

TEST_CASE("new records carry the last values forward")
{
	Record rec = two_parcels();
	CHECK(rec.number_of_items() == 2);
	CHECK(rec.number_of_timesteps() == 1);

	rec.add_record(60.);
	CHECK(rec.number_of_timesteps() == 2);
	CHECK(rec.time_at(1) == 60.);
	CHECK(rec.temporal("volume", 1)[1] == 2.);
	CHECK(rec.elements(1)[1] == 1);

	// changing the new slice leaves the old one alone
	rec.temporal("volume", 1)[1] = 1.5;
	CHECK(rec.temporal("volume", 0)[1] == 2.);

	CHECK_THROWS_AS(rec.add_record(30.), ConfigurationError);
}

TEST_CASE("items can be injected in the current slice")
{
	Record rec = two_parcels();
	rec.add_record(60.);

	std::map<std::string, std::vector<double>> items = { { "density", { 2500. } },
																											 { "abrasion_rate",
																												 { 0.01 } } };
	std::map<std::string, std::vector<double>> temporal = { { "volume", { 3. } } };
	rec.add_items({ 2 }, items, temporal);

	CHECK(rec.number_of_items() == 3);
	CHECK(rec.elements(0)[2] == Record::NO_RECORD);
	CHECK(rec.elements(1)[2] == 2);
	CHECK(std::isnan(rec.temporal("volume", 0)[2]));
	CHECK(rec.temporal("volume", 1)[2] == 3.);
	// not given for the new one
	CHECK(std::isnan(rec.temporal("D", 1)[2]));
	// only given for the new one
	CHECK(std::isnan(rec.item("abrasion_rate")[0]));
	CHECK(rec.item("abrasion_rate")[2] == doctest::Approx(0.01));

	std::vector<int> history = rec.get_element_history<std::vector<int>>(2);
	CHECK(history[0] == Record::NO_RECORD);
	CHECK(history[1] == 2);

	std::vector<double> volumes =
		rec.get_item_history<std::vector<double>>("volume", 2);
	REQUIRE(volumes.size() == 2u);
	CHECK(std::isnan(volumes[0]));
	CHECK(volumes[1] == 3.);

	// item variables repeat where the item exists
	std::vector<double> rho =
		rec.get_item_history<std::vector<double>>("density", 2);
	CHECK(std::isnan(rho[0]));
	CHECK(rho[1] == 2500.);
	rho = rec.get_item_history<std::vector<double>>("density", 0);
	CHECK(rho[0] == 2650.);
	CHECK(rho[1] == 2650.);

	CHECK_THROWS_AS(rec.get_item_history<std::vector<double>>("nope", 0),
									ConfigurationError);
}

TEST_CASE("malformed injections are rejected")
{
	Record rec = two_parcels();
	std::map<std::string, std::vector<double>> none;
	std::map<std::string, std::vector<double>> wrong_size = { { "volume",
																															{ 1., 2. } } };
	CHECK_THROWS_AS(rec.add_items({ 0 }, none, wrong_size), ConfigurationError);

	std::map<std::string, std::vector<double>> clash = { { "volume", { 1. } } };
	CHECK_THROWS_AS(rec.add_items({ 0 }, clash, none), ConfigurationError);
}

TEST_CASE("get and set data on a subset")
{
	Record rec = two_parcels();
	rec.add_record(1.);

	auto vols = rec.get_data(1, { 1, 0 }, "volume");
	CHECK(vols[0] == 2.);
	CHECK(vols[1] == 1.);

	rec.set_data(1, { 0 }, "volume", 0.5);
	CHECK(rec.temporal("volume", 1)[0] == 0.5);
	CHECK(rec.temporal("volume", 0)[0] == 1.);

	auto rho = rec.get_data(1, { 1 }, "density");
	CHECK(rho[0] == 2000.);

	CHECK_THROWS_AS(rec.get_data(1, { 0 }, "nope"), ConfigurationError);
	CHECK_THROWS_AS(rec.temporal("volume", 5), ConfigurationError);
}

TEST_CASE("aggregated sums per link")
{
	Record rec = two_parcels();
	std::map<std::string, std::vector<double>> items = { { "density", { 1. } } };
	std::map<std::string, std::vector<double>> temporal = { { "volume", { 4. } },
																													{ "D", { 0.1 } } };
	rec.add_items({ 0 }, items, temporal);

	std::vector<std::uint8_t> all(3, true);
	auto sums = rec.calc_aggregate_sum("volume", 3, all, 0);
	CHECK(sums[0] == 5.);
	CHECK(sums[1] == 2.);
	CHECK(std::isnan(sums[2]));

	std::vector<std::uint8_t> some = { false, true, true };
	sums = rec.calc_aggregate_sum("volume", 3, some, 0);
	CHECK(sums[0] == 4.);

	// retired items are not counted anywhere
	rec.elements(0)[2] = -2;
	sums = rec.calc_aggregate_sum("volume", 3, all, 0);
	CHECK(sums[0] == 1.);
}
