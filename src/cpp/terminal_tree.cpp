#include "terminal_tree.h"

#include <algorithm>
#include <cstdint>
#include <queue>

namespace {

bool better_edge(
    const TerminalEdge& lhs,
    const TerminalEdge& rhs,
    const std::vector<GridCoord>& terminals,
    const TieBreaker& tie) {
    if (lhs.weight != rhs.weight) {
        return lhs.weight < rhs.weight;
    }
    std::uint64_t lhs_tie = tie.key(terminals[lhs.u]) ^ tie.key(terminals[lhs.v]);
    std::uint64_t rhs_tie = tie.key(terminals[rhs.u]) ^ tie.key(terminals[rhs.v]);
    if (lhs_tie != rhs_tie) {
        return lhs_tie < rhs_tie;
    }
    if (lhs.u != rhs.u) {
        return lhs.u < rhs.u;
    }
    return lhs.v < rhs.v;
}

struct Adjacent {
    int node;
    int weight;
};

}  // namespace

std::vector<TerminalEdge> build_terminal_mst(
    const std::vector<GridCoord>& terminals,
    const TieBreaker& tie) {
    std::vector<TerminalEdge> edges;
    int n = static_cast<int>(terminals.size());
    if (n <= 1) {
        return edges;
    }
    edges.reserve(n - 1);

    std::vector<char> in_tree(n, 0);
    in_tree[0] = 1;
    int tree_size = 1;

    while (tree_size < n) {
        bool found = false;
        TerminalEdge best{-1, -1, 0};
        for (int u = 0; u < n; ++u) {
            if (!in_tree[u]) {
                continue;
            }
            for (int v = 0; v < n; ++v) {
                if (in_tree[v]) {
                    continue;
                }
                TerminalEdge candidate{u, v, terminals[u].manhattan(terminals[v])};
                if (!found || better_edge(candidate, best, terminals, tie)) {
                    best = candidate;
                    found = true;
                }
            }
        }
        if (!found) {
            break;
        }
        in_tree[best.v] = 1;
        ++tree_size;
        edges.push_back(best);
    }
    return edges;
}

std::vector<int> build_connection_order(
    const std::vector<GridCoord>& terminals,
    const std::vector<TerminalEdge>& mst,
    const TieBreaker& tie) {
    int n = static_cast<int>(terminals.size());
    std::vector<int> order;
    if (n == 0) {
        return order;
    }

    std::vector<std::vector<Adjacent>> adjacency(n);
    for (const auto& e : mst) {
        adjacency[e.u].push_back({e.v, e.weight});
        adjacency[e.v].push_back({e.u, e.weight});
    }

    std::vector<char> visited(n, 0);
    std::queue<int> q;
    visited[0] = 1;
    q.push(0);
    while (!q.empty()) {
        int cur = q.front();
        q.pop();
        std::vector<Adjacent> next = adjacency[cur];
        std::stable_sort(next.begin(), next.end(), [&](const Adjacent& lhs, const Adjacent& rhs) {
            if (lhs.weight != rhs.weight) {
                return lhs.weight < rhs.weight;
            }
            return tie.key(terminals[lhs.node]) < tie.key(terminals[rhs.node]);
        });
        for (const auto& adj : next) {
            if (visited[adj.node]) {
                continue;
            }
            visited[adj.node] = 1;
            order.push_back(adj.node);
            q.push(adj.node);
        }
    }
    return order;
}
