#include "cst/core/util/SliceMatcher.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>

#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/cycle_canceling.hpp>
#include <boost/graph/push_relabel_max_flow.hpp>

#include "cst/core/util/Logging.hpp"

namespace cst {

namespace {

using Traits = boost::adjacency_list_traits<boost::vecS, boost::vecS, boost::directedS>;
using FlowGraph = boost::adjacency_list<
    boost::vecS, boost::vecS, boost::directedS, boost::no_property,
    boost::property<boost::edge_capacity_t, long,
    boost::property<boost::edge_residual_capacity_t, long,
    boost::property<boost::edge_reverse_t, Traits::edge_descriptor,
    boost::property<boost::edge_weight_t, long>>>>>;
using Vertex = boost::graph_traits<FlowGraph>::vertex_descriptor;
using Edge = boost::graph_traits<FlowGraph>::edge_descriptor;

// Costs are quantised to integers for the solver.
constexpr double kCostScale = 1e6;

Edge addArc(FlowGraph& g, Vertex u, Vertex v, long cap, long weight)
{
    auto capacity = boost::get(boost::edge_capacity, g);
    auto reverse = boost::get(boost::edge_reverse, g);
    auto w = boost::get(boost::edge_weight, g);

    Edge e = boost::add_edge(u, v, g).first;
    Edge r = boost::add_edge(v, u, g).first;
    capacity[e] = cap;
    capacity[r] = 0;
    w[e] = weight;
    w[r] = -weight;
    reverse[e] = r;
    reverse[r] = e;
    return e;
}

} // namespace

std::vector<Correspondence> CorrespondenceMap::predecessorsOf(Label b) const
{
    std::vector<Correspondence> out;
    for (const auto& c : matches)
        if (c.b == b)
            out.push_back(c);
    return out;
}

std::vector<Correspondence> CorrespondenceMap::successorsOf(Label a) const
{
    std::vector<Correspondence> out;
    for (const auto& c : matches)
        if (c.a == a)
            out.push_back(c);
    return out;
}

bool preferCorrespondence(const Correspondence& l, const Correspondence& r, bool compareA)
{
    if (l.cost != r.cost)
        return l.cost < r.cost;
    if (l.overlap != r.overlap)
        return l.overlap > r.overlap;
    return compareA ? l.a < r.a : l.b < r.b;
}

SliceMatcher::SliceMatcher(MatchParams params) : params_(params) {}

std::vector<TransportFlow> SliceMatcher::solveTransport(const OverlapTable& table)
{
    std::vector<TransportFlow> flows;
    if (table.entries.empty())
        return flows;

    // Vertex layout: source, sink, labels of A, labels of B.
    std::map<Label, Vertex> vertexA;
    std::map<Label, Vertex> vertexB;
    Vertex next = 2;
    for (const auto& [l, area] : table.areasA)
        vertexA[l] = next++;
    for (const auto& [l, area] : table.areasB)
        vertexB[l] = next++;

    FlowGraph g(next);
    const Vertex source = 0;
    const Vertex sink = 1;
    const long unbounded = static_cast<long>(table.total);

    for (const auto& [l, area] : table.areasA)
        addArc(g, source, vertexA[l], static_cast<long>(area), 0);
    for (const auto& [l, area] : table.areasB)
        addArc(g, vertexB[l], sink, static_cast<long>(area), 0);

    std::vector<Edge> pairEdges;
    pairEdges.reserve(table.entries.size());
    std::vector<double> costs;
    costs.reserve(table.entries.size());
    for (const auto& e : table.entries) {
        const double cost = 1.0 - intersectionOverUnion(e.count, table.areaA(e.a), table.areaB(e.b));
        const long weight = std::lround(std::max(0.0, cost) * kCostScale);
        pairEdges.push_back(addArc(g, vertexA[e.a], vertexB[e.b], unbounded, weight));
        costs.push_back(cost);
    }

    // Every pixel is moved, so the max flow is total; cancelling negative
    // cycles in the residual graph then makes it a minimum-cost plan.
    const long flowed = boost::push_relabel_max_flow(g, source, sink);
    if (flowed != unbounded) {
        throw std::runtime_error("transport plan moved " + std::to_string(flowed) +
                                 " of " + std::to_string(unbounded) + " pixels");
    }
    boost::cycle_canceling(g);

    auto capacity = boost::get(boost::edge_capacity, g);
    auto residual = boost::get(boost::edge_residual_capacity, g);

    flows.reserve(pairEdges.size());
    for (std::size_t i = 0; i < pairEdges.size(); ++i) {
        const long moved = capacity[pairEdges[i]] - residual[pairEdges[i]];
        if (moved <= 0)
            continue;
        const auto& e = table.entries[i];
        flows.push_back({e.a, e.b, e.count, static_cast<std::uint64_t>(moved), costs[i]});
    }
    return flows;
}

bool SliceMatcher::accept(const TransportFlow& f, const OverlapTable& table) const
{
    if (f.cost > params_.max_cost)
        return false;
    const double m = static_cast<double>(f.supportedMass());
    return m >= params_.min_mass_fraction * static_cast<double>(table.areaA(f.a)) ||
           m >= params_.min_mass_fraction * static_cast<double>(table.areaB(f.b));
}

CorrespondenceMap SliceMatcher::match(const LabelMask& a, const LabelMask& b) const
{
    const OverlapTable table = computeOverlap(a, b);

    std::vector<Label> labelsA;
    std::vector<Label> labelsB;
    for (const auto& [l, area] : table.areasA)
        if (l != 0) labelsA.push_back(l);
    for (const auto& [l, area] : table.areasB)
        if (l != 0) labelsB.push_back(l);

    CorrespondenceMap out;
    if (labelsA.empty() || labelsB.empty()) {
        out.appeared = std::move(labelsB);
        out.disappeared = std::move(labelsA);
        return out;
    }

    for (const auto& f : solveTransport(table)) {
        if (f.a == 0 || f.b == 0)
            continue;
        if (accept(f, table))
            out.matches.push_back({f.a, f.b, f.overlap, f.mass, f.cost});
    }

    std::vector<Label> matchedA;
    std::vector<Label> matchedB;
    for (const auto& c : out.matches) {
        matchedA.push_back(c.a);
        matchedB.push_back(c.b);
    }
    std::sort(matchedA.begin(), matchedA.end());
    std::sort(matchedB.begin(), matchedB.end());

    std::set_difference(labelsA.begin(), labelsA.end(), matchedA.begin(), matchedA.end(),
                        std::back_inserter(out.disappeared));
    std::set_difference(labelsB.begin(), labelsB.end(), matchedB.begin(), matchedB.end(),
                        std::back_inserter(out.appeared));

    out.degenerate = out.matches.empty();
    if (out.degenerate) {
        Logger()->debug("slice matcher: no pair accepted among {} x {} instances",
                        labelsA.size(), labelsB.size());
    }
    return out;
}

} // namespace cst
