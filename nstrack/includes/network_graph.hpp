//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef network_graph_HPP
#define network_graph_HPP

/*
This file contains the NetworkGraph class.
A network graph is a set of nodes connected by links, each link being a reach
of river with a length and a width. Node-wise it carries the bedrock and the
topographic elevation, the latter being updated by the sediment transporter.
*/

// STL imports
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "nst_errors.hpp"
#include "utils.hpp"
#include "wrap_helper.hpp"

namespace NSTRACK {

template<class i_t, class f_t>
class NetworkGraph
{

	// Everything goes public, more straighforward
public:
	// Reserved "no-link" index
	static constexpr i_t BAD_INDEX = -1;
	// Element id of parcels which left the network
	static constexpr i_t OUT_OF_NETWORK = BAD_INDEX - 1;

	i_t nnodes = 0;
	i_t nlinks = 0;

	// integer vector of 2*links size with the node indices of each link
	// for example, the nodes of link #42 would be indices 84 and 85
	std::vector<i_t> linknodes;

	// Links attached to each node, nnodes * max_degree, padded with BAD_INDEX
	i_t max_degree = 0;
	std::vector<i_t> _links_at_node;

	// # Link fields
	std::vector<f_t> link_length;
	std::vector<f_t> channel_width;
	std::vector<f_t> channel_slope;

	// Published by the transporter after each step
	std::vector<f_t> sediment_total_volume;
	std::vector<f_t> sediment_active_volume;
	std::vector<f_t> sediment_active_sand_fraction;

	// # Node fields
	std::vector<f_t> topographic_elevation;
	std::vector<f_t> bedrock_elevation;

	// default empty constructor
	NetworkGraph(){};

	// Classic constructor: number of nodes and the flat node pairs of each link
	template<class arrin_t>
	NetworkGraph(i_t nnodes, arrin_t& tlinknodes)
	{
		this->init(nnodes, tlinknodes);
	}

	template<class arrin_t>
	void init(i_t nnodes, arrin_t& tlinknodes)
	{
		auto arr = format_input<arrin_t>(tlinknodes);
		this->linknodes = to_vec(arr);
		if (this->linknodes.size() % 2 != 0)
			throw ConfigurationError(
				"nodes_at_link must contain pairs of node indices");

		this->nnodes = nnodes;
		this->nlinks = i_t(this->linknodes.size() / 2);

		for (auto node : this->linknodes) {
			if (node < 0 || node >= this->nnodes)
				throw ConfigurationError("nodes_at_link refers to an unknown node");
		}

		this->build_links_at_node();
	}

	// Builds the padded adjacency from linknodes
	void build_links_at_node()
	{
		std::vector<i_t> degree(this->nnodes, 0);
		for (auto node : this->linknodes)
			++degree[node];

		this->max_degree = 0;
		for (auto d : degree)
			this->max_degree = std::max(this->max_degree, d);

		this->_links_at_node =
			std::vector<i_t>(this->nnodes * this->max_degree, BAD_INDEX);
		std::vector<i_t> filled(this->nnodes, 0);
		for (i_t l = 0; l < this->nlinks; ++l) {
			for (int j = 0; j < 2; ++j) {
				i_t node = this->linknodes[2 * l + j];
				this->_links_at_node[node * this->max_degree + filled[node]] = l;
				++filled[node];
			}
		}
	}

	i_t number_of_nodes() const { return this->nnodes; }
	i_t number_of_links() const { return this->nlinks; }

	i_t node_at_link_tail(i_t link) const { return this->linknodes[2 * link]; }
	i_t node_at_link_head(i_t link) const { return this->linknodes[2 * link + 1]; }

	// k-th link attached to node (BAD_INDEX for padding)
	i_t links_at_node(i_t node, i_t k) const
	{
		return this->_links_at_node[node * this->max_degree + k];
	}

	// The other end of a link
	i_t other_node(i_t link, i_t node) const
	{
		return (this->linknodes[2 * link] == node) ? this->linknodes[2 * link + 1]
																							 : this->linknodes[2 * link];
	}

	// #Link length
	template<class arrin_t>
	void set_link_length(arrin_t& tarr)
	{
		auto arr = format_input<arrin_t>(tarr);
		this->link_length = to_vec(arr);
	}
	template<class out_t>
	out_t get_link_length()
	{
		return format_output<decltype(this->link_length), out_t>(
			this->link_length);
	}

	// #Channel width
	template<class arrin_t>
	void set_channel_width(arrin_t& tarr)
	{
		auto arr = format_input<arrin_t>(tarr);
		this->channel_width = to_vec(arr);
	}
	template<class out_t>
	out_t get_channel_width()
	{
		return format_output<decltype(this->channel_width), out_t>(
			this->channel_width);
	}

	// #Channel slope (optional, created by the transporter if missing)
	template<class arrin_t>
	void set_channel_slope(arrin_t& tarr)
	{
		auto arr = format_input<arrin_t>(tarr);
		this->channel_slope = to_vec(arr);
	}
	template<class out_t>
	out_t get_channel_slope()
	{
		return format_output<decltype(this->channel_slope), out_t>(
			this->channel_slope);
	}
	bool has_channel_slope() const
	{
		return this->channel_slope.size() > 0;
	}

	// #Topographic surface (bedrock + alluvium)
	template<class arrin_t>
	void set_topographic_elevation(arrin_t& tarr)
	{
		auto arr = format_input<arrin_t>(tarr);
		this->topographic_elevation = to_vec(arr);
	}
	template<class out_t>
	out_t get_topographic_elevation()
	{
		return format_output<decltype(this->topographic_elevation), out_t>(
			this->topographic_elevation);
	}

	// #Bedrock surface
	template<class arrin_t>
	void set_bedrock_elevation(arrin_t& tarr)
	{
		auto arr = format_input<arrin_t>(tarr);
		this->bedrock_elevation = to_vec(arr);
	}
	template<class out_t>
	out_t get_bedrock_elevation()
	{
		return format_output<decltype(this->bedrock_elevation), out_t>(
			this->bedrock_elevation);
	}

	template<class out_t>
	out_t get_sediment_total_volume()
	{
		return format_output<decltype(this->sediment_total_volume), out_t>(
			this->sediment_total_volume);
	}
	template<class out_t>
	out_t get_sediment_active_volume()
	{
		return format_output<decltype(this->sediment_active_volume), out_t>(
			this->sediment_active_volume);
	}
	template<class out_t>
	out_t get_sediment_active_sand_fraction()
	{
		return format_output<decltype(this->sediment_active_sand_fraction),
												 out_t>(this->sediment_active_sand_fraction);
	}

	// Checks that every field the transporter needs is there and has the right
	// size. The slope is optional.
	void check_fields() const
	{
		if (this->nlinks == 0)
			throw ConfigurationError("the network graph has no link");
		if (this->channel_width.size() != size_t(this->nlinks))
			throw ConfigurationError(
				"channel_width must be assigned to the grid links");
		if (this->link_length.size() != size_t(this->nlinks))
			throw ConfigurationError(
				"link_length must be assigned to the grid links");
		if (this->topographic_elevation.size() != size_t(this->nnodes))
			throw ConfigurationError(
				"topographic__elevation must be assigned to the grid nodes");
		if (this->bedrock_elevation.size() != size_t(this->nnodes))
			throw ConfigurationError(
				"bedrock__elevation must be assigned to the grid nodes");
		if (this->has_channel_slope() &&
				this->channel_slope.size() != size_t(this->nlinks))
			throw ConfigurationError(
				"channel_slope must have one value per link");
		for (auto len : this->link_length) {
			if (!(len > 0))
				throw ConfigurationError("link_length must be positive");
		}
	}
};

} // namespace NSTRACK

#endif
