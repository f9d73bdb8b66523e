//=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
#ifndef flow_director_HPP
#define flow_director_HPP

/*
Single flow direction on a network graph.
Each node gives its flow to one link at most (the steepest descending one)
and every link gets an upstream and a downstream node out of it.
*/

// STL imports
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "network_graph.hpp"
#include "nst_errors.hpp"
#include "utils.hpp"
#include "wrap_helper.hpp"

namespace NSTRACK {

template<class i_t, class f_t>
class FlowDirector
{

public:
	FlowDirector(NetworkGraph<i_t, f_t>& graph) { this->graph = &graph; }

	// The network (not owned)
	NetworkGraph<i_t, f_t>* graph;

	// Link receiving the outflow of each node, BAD_INDEX at outlets
	std::vector<i_t> link_to_flow_receiving_node;

	// Node at each end of a link in the flow direction
	std::vector<i_t> _upstream_node_at_link;
	std::vector<i_t> _downstream_node_at_link;

	// Same layout than NetworkGraph::_links_at_node, 1 if the link delivers flow
	// into the node, 0 otherwise
	std::vector<std::uint8_t> _flow_link_incoming_at_node;

	bool computed = false;
	bool is_computed() const { return this->computed; }

	// Steepest descent: each node sends its flow through the link to the lowest
	// neighbour (slope = drop / link length), if any neighbour is lower.
	void run_one_step()
	{
		auto& gr = *this->graph;
		if (gr.topographic_elevation.size() != size_t(gr.nnodes))
			throw ConfigurationError(
				"topographic__elevation must be assigned before directing flow");
		if (gr.link_length.size() != size_t(gr.nlinks))
			throw ConfigurationError(
				"link_length must be assigned before directing flow");

		this->link_to_flow_receiving_node =
			std::vector<i_t>(gr.nnodes, NetworkGraph<i_t, f_t>::BAD_INDEX);

		for (i_t node = 0; node < gr.nnodes; ++node) {
			f_t steepest = 0.;
			for (i_t k = 0; k < gr.max_degree; ++k) {
				i_t link = gr.links_at_node(node, k);
				if (link == NetworkGraph<i_t, f_t>::BAD_INDEX)
					continue;
				i_t other = gr.other_node(link, node);
				f_t slope =
					(gr.topographic_elevation[node] - gr.topographic_elevation[other]) /
					gr.link_length[link];
				if (slope > steepest) {
					steepest = slope;
					this->link_to_flow_receiving_node[node] = link;
				}
			}
		}

		this->compute_link_directions();
	}

	// Bypasses the elevation analysis: the receiving link of each node is given
	template<class arrin_t>
	void set_receiving_links(arrin_t& tarr)
	{
		auto arr = format_input<arrin_t>(tarr);
		auto recs = to_vec(arr);
		auto& gr = *this->graph;
		if (recs.size() != size_t(gr.nnodes))
			throw ConfigurationError("one receiving link per node is needed");

		this->link_to_flow_receiving_node = std::vector<i_t>(gr.nnodes);
		for (i_t node = 0; node < gr.nnodes; ++node) {
			i_t link = i_t(recs[node]);
			if (link != NetworkGraph<i_t, f_t>::BAD_INDEX &&
					(link < 0 || link >= gr.nlinks ||
					 (gr.node_at_link_tail(link) != node &&
						gr.node_at_link_head(link) != node)))
				throw ConfigurationError("receiving link not attached to its node");
			this->link_to_flow_receiving_node[node] = link;
		}

		this->compute_link_directions();
	}

	// Orientates the links from the receiving links of the nodes, then flags
	// the incoming links at each node
	void compute_link_directions()
	{
		auto& gr = *this->graph;
		this->_upstream_node_at_link = std::vector<i_t>(gr.nlinks);
		this->_downstream_node_at_link = std::vector<i_t>(gr.nlinks);

		for (i_t link = 0; link < gr.nlinks; ++link) {
			i_t tail = gr.node_at_link_tail(link);
			i_t head = gr.node_at_link_head(link);
			if (this->link_to_flow_receiving_node[head] == link &&
					this->link_to_flow_receiving_node[tail] != link) {
				this->_upstream_node_at_link[link] = head;
				this->_downstream_node_at_link[link] = tail;
			} else {
				this->_upstream_node_at_link[link] = tail;
				this->_downstream_node_at_link[link] = head;
			}
		}

		this->_flow_link_incoming_at_node =
			std::vector<std::uint8_t>(gr.nnodes * gr.max_degree, 0);
		for (i_t node = 0; node < gr.nnodes; ++node) {
			for (i_t k = 0; k < gr.max_degree; ++k) {
				i_t link = gr.links_at_node(node, k);
				if (link == NetworkGraph<i_t, f_t>::BAD_INDEX)
					continue;
				if (this->_downstream_node_at_link[link] == node)
					this->_flow_link_incoming_at_node[node * gr.max_degree + k] = 1;
			}
		}

		this->computed = true;
	}

	i_t upstream_node_at_link(i_t link) const
	{
		return this->_upstream_node_at_link[link];
	}
	i_t downstream_node_at_link(i_t link) const
	{
		return this->_downstream_node_at_link[link];
	}
	bool flow_link_incoming_at_node(i_t node, i_t k) const
	{
		return this->_flow_link_incoming_at_node[node * this->graph->max_degree +
																						 k] == 1;
	}

	// Link downstream of a link, BAD_INDEX if the link drains out of the network
	i_t downstream_link_at_link(i_t link) const
	{
		return this->link_to_flow_receiving_node[this->_downstream_node_at_link[link]];
	}

	// Number of links flowing into a node
	i_t number_of_contributors(i_t node) const
	{
		i_t n = 0;
		for (i_t k = 0; k < this->graph->max_degree; ++k) {
			if (this->flow_link_incoming_at_node(node, k))
				++n;
		}
		return n;
	}

	template<class out_t>
	out_t get_link_to_flow_receiving_node()
	{
		return format_output<decltype(this->link_to_flow_receiving_node), out_t>(
			this->link_to_flow_receiving_node);
	}
	template<class out_t>
	out_t get_upstream_node_at_link()
	{
		return format_output<decltype(this->_upstream_node_at_link), out_t>(
			this->_upstream_node_at_link);
	}
	template<class out_t>
	out_t get_downstream_node_at_link()
	{
		return format_output<decltype(this->_downstream_node_at_link), out_t>(
			this->_downstream_node_at_link);
	}
	template<class out_t>
	out_t get_flow_link_incoming_at_node()
	{
		return format_output<decltype(this->_flow_link_incoming_at_node), out_t>(
			this->_flow_link_incoming_at_node);
	}
};

} // namespace NSTRACK

#endif
